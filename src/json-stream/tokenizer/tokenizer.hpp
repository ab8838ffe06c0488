#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <json-stream/stream/buffer.hpp>
#include <json-stream/tokenizer/token.hpp>

namespace tokenizer {

// Reads one JSON token per call from a stream buffer.
//
// A token that cannot be completed with the data currently in the buffer is
// rolled back entirely: the read cursor returns to where the token started and
// NeedMoreData is returned, so the next call after a write starts over.
class Tokenizer {
public:
  Tokenizer(stream::Buffer & buffer)
    : buffer(buffer) {}

  Result read();
private:
  stream::Buffer & buffer;

  void skip_whitespace();

  Result single_character_token(TokenType type);
  Result read_literal(std::string_view literal, TokenType type, Value value);
  Result read_string();
  Result read_number();

  std::optional<Result> read_escape(size_t start, std::string & value);
  std::optional<Result> read_unicode_escape(size_t start, std::string & value);
  std::optional<Result> read_hex_quad(size_t start, uint32_t & unit);
  std::optional<Result> read_digits(size_t start);
  std::optional<Result> expect_char(size_t start, char expected);

  // Marks the end of the stream when peeking inside a number.
  static constexpr int END_OF_INPUT = -1;

  // Next byte as an unsigned value, END_OF_INPUT, or nothing when more data is needed.
  std::optional<int> peek_number_char();

  Result interrupted(size_t start, const stream::ReadResult & signal);
  Result suspend(size_t start);
  SyntaxError make_error(size_t start, std::string reason);
};

} // namespace tokenizer
