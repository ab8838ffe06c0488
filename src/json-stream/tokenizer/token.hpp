#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>

#include <json-stream/stream/buffer.hpp>
#include <json-stream/value.hpp>

namespace tokenizer {

enum class TokenType {
  Comma,
  Colon,
  OpenBracket,
  CloseBracket,
  OpenBrace,
  CloseBrace,
  Null,
  True,
  False,
  String,
  Number,
};

struct Token {
  TokenType type;
  size_t pos;
  std::string text; // Verbatim source text
  std::optional<Value> value; // Absent for structural tokens
};

struct SyntaxError {
  std::string text;
  size_t pos;
  std::string reason;
};

using stream::NeedMoreData;
using stream::EndOfStream;

using Result = std::variant<Token, NeedMoreData, EndOfStream, SyntaxError>;

std::string token_type_name(TokenType type);

} // namespace tokenizer
