#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

struct StreamError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Thrown by the decoder on malformed input. Fatal to the decoding session.
struct DecodeError : std::runtime_error {
  DecodeError(const std::string &message, std::string source, size_t offset)
    : std::runtime_error(message), source_text(std::move(source)), source_offset(offset) {}

  const std::string & source() const { return source_text; }
  size_t offset() const { return source_offset; }
private:
  std::string source_text;
  size_t source_offset;
};
