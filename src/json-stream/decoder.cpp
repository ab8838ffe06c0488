#include <format>
#include <stdexcept>
#include <variant>

#include <json-stream/error.hpp>

#include <json-stream/decoder.hpp>

namespace {

std::string expected_names(uint8_t expecting) {
  std::string names;
  auto add = [&](Expect category, const char *name) {
    if (!(expecting & category)) return;
    if (!names.empty()) names += ", ";
    names += name;
  };

  add(ExpectValue, "value");
  add(ExpectArrayOpen, "'['");
  add(ExpectArrayClose, "']'");
  add(ExpectObjectOpen, "'{'");
  add(ExpectObjectClose, "'}'");
  add(ExpectComma, "','");
  add(ExpectColon, "':'");
  return names;
}

} // namespace

Decoder::Decoder()
  : lexer(buffer) {}

void Decoder::write(std::string_view data) {
  buffer.write(data);
}

void Decoder::end() {
  buffer.mark_finished();
}

bool Decoder::read(const ValueCallback &callback) {
  if (failed) {
    throw DecodeError("Decoder is unusable after a previous error", "", buffer.position());
  }
  if (exhausted) return false;

  while (true) {
    auto result = lexer.read();

    if (std::holds_alternative<tokenizer::NeedMoreData>(result)) {
      return true;
    }

    if (std::holds_alternative<tokenizer::EndOfStream>(result)) {
      exhausted = true;
      return false;
    }

    if (auto error = std::get_if<tokenizer::SyntaxError>(&result)) {
      fail(std::format("{} at {}", error->reason, error->pos), error->text, error->pos);
    }

    dispatch(std::get<tokenizer::Token>(result), callback);
  }
}

void Decoder::dispatch(tokenizer::Token &token, const ValueCallback &callback) {
  using tokenizer::TokenType;
  switch (token.type) {
    case TokenType::Comma: return handle_comma(token);
    case TokenType::Colon: return handle_colon(token);
    case TokenType::OpenBracket: return open_array(token);
    case TokenType::CloseBracket: return close_array(token);
    case TokenType::OpenBrace: return open_object(token);
    case TokenType::CloseBrace: return close_object(token);
    case TokenType::Null:
    case TokenType::True:
    case TokenType::False:
    case TokenType::String:
    case TokenType::Number:
      return handle_value(token, callback);
    default:
      throw std::logic_error("Unknown TokenType");
  }
}

void Decoder::handle_value(tokenizer::Token &token, const ValueCallback &callback) {
  expect(token, ExpectValue);

  if (!token.value.has_value()) {
    throw std::logic_error(std::format("Value token '{}' carries no value", token.text));
  }

  if (current_path.empty()) {
    emit(token.value.value(), callback);
    return;
  }

  auto &top = current_path.back();

  if (auto index = std::get_if<size_t>(&top)) {
    emit(token.value.value(), callback);
    (*index)++;
    expecting = ExpectComma | ExpectArrayClose;
    return;
  }

  auto &object = std::get<ObjectKey>(top);
  if (object.key.has_value()) {
    emit(token.value.value(), callback);
    object.key.reset();
    expecting = ExpectComma | ExpectObjectClose;
    return;
  }

  // No key read yet, so this value is the key.
  auto key = std::get_if<std::string>(&token.value.value());
  if (key == nullptr) {
    fail(std::format("Expected string key but got {} at {}", tokenizer::token_type_name(token.type), token.pos),
      token.text, token.pos);
  }
  object.key = std::move(*key);
  expecting = ExpectColon;
}

void Decoder::handle_comma(const tokenizer::Token &token) {
  expect(token, ExpectComma);

  // Inside an object the comma must be followed by a key.
  if (!current_path.empty() && is_object_segment(current_path.back())) {
    expecting = ExpectValue;
  } else {
    expecting = EXPECT_ANY_VALUE;
  }
}

void Decoder::handle_colon(const tokenizer::Token &token) {
  expect(token, ExpectColon);
  expecting = EXPECT_ANY_VALUE;
}

void Decoder::open_array(const tokenizer::Token &token) {
  expect(token, ExpectArrayOpen);
  current_path.emplace_back(size_t { 0 });
  expecting = ExpectValue | ExpectArrayOpen | ExpectArrayClose | ExpectObjectOpen;
}

void Decoder::close_array(const tokenizer::Token &token) {
  expect(token, ExpectArrayClose);
  current_path.pop_back();
  ascend();
}

void Decoder::open_object(const tokenizer::Token &token) {
  expect(token, ExpectObjectOpen);
  current_path.emplace_back(ObjectKey {});
  expecting = ExpectValue | ExpectObjectClose;
}

void Decoder::close_object(const tokenizer::Token &token) {
  expect(token, ExpectObjectClose);
  current_path.pop_back();
  ascend();
}

// Moves past a container that was just closed.
void Decoder::ascend() {
  if (current_path.empty()) {
    expecting = EXPECT_ANY_VALUE;
    return;
  }

  auto &top = current_path.back();
  if (auto index = std::get_if<size_t>(&top)) {
    (*index)++;
    expecting = ExpectComma | ExpectArrayClose;
  } else {
    std::get<ObjectKey>(top).key.reset();
    expecting = ExpectComma | ExpectObjectClose;
  }
}

void Decoder::emit(const Value &value, const ValueCallback &callback) {
  emitted++;
  if (!callback) return;

  // The token is already consumed, so a throwing callback ends the session.
  try {
    callback(current_path, value);
  } catch (...) {
    failed = true;
    throw;
  }
}

void Decoder::expect(const tokenizer::Token &token, Expect category) {
  if (expecting & category) return;

  fail(std::format("Unexpected {} '{}' at {}, expected {}",
      tokenizer::token_type_name(token.type), token.text, token.pos, expected_names(expecting)),
    token.text, token.pos);
}

void Decoder::fail(const std::string &message, const std::string &source, size_t offset) {
  failed = true;
  throw DecodeError(message, source, offset);
}
