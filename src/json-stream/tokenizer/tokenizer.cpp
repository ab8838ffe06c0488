#include <charconv>
#include <format>
#include <stdexcept>
#include <system_error>

#include <json-stream/tokenizer/escapes.hpp>

#include <json-stream/tokenizer/tokenizer.hpp>

namespace tokenizer {

namespace {

bool is_whitespace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool is_digit(int c) {
  return c >= '0' && c <= '9';
}

std::string describe(char c) {
  if (static_cast<unsigned char>(c) < 0x20) return std::format("'\\x{:02x}'", static_cast<unsigned int>(c));
  return std::format("'{}'", c);
}

} // namespace

std::string token_type_name(TokenType type) {
  switch (type) {
    case TokenType::Comma: return "comma";
    case TokenType::Colon: return "colon";
    case TokenType::OpenBracket: return "open bracket";
    case TokenType::CloseBracket: return "close bracket";
    case TokenType::OpenBrace: return "open brace";
    case TokenType::CloseBrace: return "close brace";
    case TokenType::Null: return "null";
    case TokenType::True: return "true";
    case TokenType::False: return "false";
    case TokenType::String: return "string";
    case TokenType::Number: return "number";
    default: throw std::logic_error("Unknown TokenType");
  }
}

Result Tokenizer::read() {
  skip_whitespace();

  auto next = buffer.peek();
  if (std::holds_alternative<EndOfStream>(next)) return EndOfStream {};
  if (std::holds_alternative<NeedMoreData>(next)) return NeedMoreData {};

  auto c = std::get<char>(next);
  switch (c) {
    case ',': return single_character_token(TokenType::Comma);
    case ':': return single_character_token(TokenType::Colon);
    case '[': return single_character_token(TokenType::OpenBracket);
    case ']': return single_character_token(TokenType::CloseBracket);
    case '{': return single_character_token(TokenType::OpenBrace);
    case '}': return single_character_token(TokenType::CloseBrace);
    case 'n': return read_literal("null", TokenType::Null, nullptr);
    case 't': return read_literal("true", TokenType::True, true);
    case 'f': return read_literal("false", TokenType::False, false);
    case '"': return read_string();
    default: {
      if (c == '-' || is_digit(c)) {
        return read_number();
      }

      return SyntaxError {
        std::string(1, c),
        buffer.position(),
        std::format("Unexpected character {}", describe(c))
      };
    }
  }
}

void Tokenizer::skip_whitespace() {
  while (true) {
    auto next = buffer.peek();
    auto c = std::get_if<char>(&next);
    if (c == nullptr || !is_whitespace(*c)) return;
    buffer.take();
  }
}

Result Tokenizer::single_character_token(TokenType type) {
  auto start = buffer.position();
  auto c = std::get<char>(buffer.take());
  return Token { type, start, std::string(1, c), std::nullopt };
}

Result Tokenizer::read_literal(std::string_view literal, TokenType type, Value value) {
  auto start = buffer.position();

  for (char expected : literal) {
    auto next = buffer.take();
    auto c = std::get_if<char>(&next);
    if (c == nullptr) return interrupted(start, next);
    if (*c != expected) {
      return make_error(start, std::format("Invalid literal, expected '{}' but got {}", literal, describe(*c)));
    }
  }

  return Token { type, start, std::string(literal), std::move(value) };
}

Result Tokenizer::read_string() {
  auto start = buffer.position();
  buffer.take(); // Opening quote

  std::string value;
  while (true) {
    auto next = buffer.take();
    auto c = std::get_if<char>(&next);
    if (c == nullptr) return interrupted(start, next);

    if (*c == '"') break;

    if (*c == '\\') {
      if (auto result = read_escape(start, value)) return *result;
      continue;
    }

    if (static_cast<unsigned char>(*c) < 0x20) {
      return make_error(start, std::format("Unescaped control character {} in string", describe(*c)));
    }

    value += *c;
  }

  auto text = std::string(buffer.consumed_since(start));
  return Token { TokenType::String, start, std::move(text), std::move(value) };
}

std::optional<Result> Tokenizer::read_escape(size_t start, std::string & value) {
  auto next = buffer.take();
  auto c = std::get_if<char>(&next);
  if (c == nullptr) return interrupted(start, next);

  if (*c == 'u') {
    return read_unicode_escape(start, value);
  }

  auto unescaped = unescape(*c);
  if (unescaped == 0) {
    return make_error(start, std::format("Invalid escape sequence '\\{}'", *c));
  }

  value += unescaped;
  return std::nullopt;
}

std::optional<Result> Tokenizer::read_unicode_escape(size_t start, std::string & value) {
  uint32_t code_point = 0;
  if (auto result = read_hex_quad(start, code_point)) return result;

  if (code_point >= LOW_SURROGATE_FIRST && code_point <= LOW_SURROGATE_LAST) {
    return make_error(start, "Unpaired low surrogate in unicode escape");
  }

  if (code_point >= HIGH_SURROGATE_FIRST && code_point <= HIGH_SURROGATE_LAST) {
    // A high surrogate must be followed directly by an escaped low surrogate.
    if (auto result = expect_char(start, '\\')) return result;
    if (auto result = expect_char(start, 'u')) return result;

    uint32_t low = 0;
    if (auto result = read_hex_quad(start, low)) return result;
    if (low < LOW_SURROGATE_FIRST || low > LOW_SURROGATE_LAST) {
      return make_error(start, "Expected low surrogate after high surrogate");
    }

    code_point = 0x10000 + (((code_point - HIGH_SURROGATE_FIRST) << 10) | (low - LOW_SURROGATE_FIRST));
  }

  append_utf8(value, code_point);
  return std::nullopt;
}

std::optional<Result> Tokenizer::read_hex_quad(size_t start, uint32_t & unit) {
  unit = 0;
  for (int i = 0; i < 4; i++) {
    auto next = buffer.take();
    auto c = std::get_if<char>(&next);
    if (c == nullptr) return interrupted(start, next);

    auto digit = hex_value(*c);
    if (digit < 0) {
      return make_error(start, std::format("Invalid hex digit {} in unicode escape", describe(*c)));
    }
    unit = unit * 16 + static_cast<uint32_t>(digit);
  }
  return std::nullopt;
}

std::optional<Result> Tokenizer::expect_char(size_t start, char expected) {
  auto next = buffer.take();
  auto c = std::get_if<char>(&next);
  if (c == nullptr) return interrupted(start, next);
  if (*c != expected) {
    return make_error(start, std::format("Expected '{}' but got {}", expected, describe(*c)));
  }
  return std::nullopt;
}

Result Tokenizer::read_number() {
  auto start = buffer.position();
  bool integral = true;
  bool negative = false;
  bool negative_exponent = false;

  if (std::get<char>(buffer.peek()) == '-') {
    negative = true;
    buffer.take();
  }

  // Integer part, a lone zero or a non-zero digit followed by more digits.
  auto c = peek_number_char();
  if (!c.has_value()) return suspend(start);
  if (c.value() == '0') {
    buffer.take();
    c = peek_number_char();
    if (!c.has_value()) return suspend(start);
    if (is_digit(c.value())) {
      return make_error(start, "Leading zeros are not allowed in numbers");
    }
  } else {
    if (auto result = read_digits(start)) return *result;
  }

  // Fractional part
  c = peek_number_char();
  if (!c.has_value()) return suspend(start);
  if (c.value() == '.') {
    integral = false;
    buffer.take();
    if (auto result = read_digits(start)) return *result;
  }

  // Exponent
  c = peek_number_char();
  if (!c.has_value()) return suspend(start);
  if (c.value() == 'e' || c.value() == 'E') {
    integral = false;
    buffer.take();

    c = peek_number_char();
    if (!c.has_value()) return suspend(start);
    if (c.value() == '+' || c.value() == '-') {
      negative_exponent = c.value() == '-';
      buffer.take();
    }

    if (auto result = read_digits(start)) return *result;
  }

  auto text = std::string(buffer.consumed_since(start));
  auto first = text.data();
  auto last = text.data() + text.size();

  if (integral) {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec == std::errc::result_out_of_range) {
      return make_error(start, std::format("Integer {} is out of range", text));
    }
    if (ec != std::errc() || ptr != last) {
      throw std::logic_error(std::format("Failed to convert integer {}", text));
    }
    return Token { TokenType::Number, start, std::move(text), value };
  }

  double value = 0.0;
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec == std::errc::result_out_of_range && negative_exponent) {
    // Too small for a double, rounds to zero.
    return Token { TokenType::Number, start, std::move(text), negative ? -0.0 : 0.0 };
  }
  if (ec == std::errc::result_out_of_range) {
    return make_error(start, std::format("Number {} is out of range", text));
  }
  if (ec != std::errc() || ptr != last) {
    throw std::logic_error(std::format("Failed to convert number {}", text));
  }
  return Token { TokenType::Number, start, std::move(text), value };
}

std::optional<Result> Tokenizer::read_digits(size_t start) {
  size_t count = 0;

  while (true) {
    auto c = peek_number_char();
    if (!c.has_value()) return suspend(start);
    if (!is_digit(c.value())) break;
    buffer.take();
    count++;
  }

  if (count == 0) {
    auto next = buffer.peek();
    auto c = std::get_if<char>(&next);
    if (c == nullptr) {
      return make_error(start, "Unexpected end of input in number");
    }
    return make_error(start, std::format("Expected digit but got {}", describe(*c)));
  }

  return std::nullopt;
}

std::optional<int> Tokenizer::peek_number_char() {
  auto next = buffer.peek();
  if (auto c = std::get_if<char>(&next)) return static_cast<unsigned char>(*c);
  // The end of the stream terminates a number like any other delimiter.
  if (std::holds_alternative<EndOfStream>(next)) return END_OF_INPUT;
  return std::nullopt;
}

Result Tokenizer::interrupted(size_t start, const stream::ReadResult & signal) {
  if (std::holds_alternative<EndOfStream>(signal)) {
    return make_error(start, "Unexpected end of input");
  }
  return suspend(start);
}

Result Tokenizer::suspend(size_t start) {
  buffer.rewind(start);
  return NeedMoreData {};
}

SyntaxError Tokenizer::make_error(size_t start, std::string reason) {
  return SyntaxError { std::string(buffer.consumed_since(start)), start, std::move(reason) };
}

} // namespace tokenizer
