#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

// A decoded leaf value. Containers are never represented as values.
using Value = std::variant<
  std::nullptr_t,
  bool,
  int64_t,
  double,
  std::string
>;

// Renders a value as JSON text.
std::string to_string(const Value &value);

// Writes s as a quoted JSON string literal into out.
void append_quoted(std::string &out, const std::string &s);
