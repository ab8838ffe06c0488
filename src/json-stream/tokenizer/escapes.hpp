#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace tokenizer {

// Maps the character after a backslash to the character it stands for.
// Zero marks characters that are not a single-character escape.
constexpr std::array<char, 256> make_escape_table() {
  std::array<char, 256> table {};
  table['"'] = '"';
  table['\\'] = '\\';
  table['/'] = '/';
  table['b'] = '\b';
  table['f'] = '\f';
  table['n'] = '\n';
  table['r'] = '\r';
  table['t'] = '\t';
  return table;
}

// Maps hex digits to their value, everything else to -1.
constexpr std::array<int8_t, 256> make_hex_table() {
  std::array<int8_t, 256> table {};
  table.fill(-1);
  for (int i = 0; i < 10; i++) table['0' + i] = static_cast<int8_t>(i);
  for (int i = 0; i < 6; i++) {
    table['a' + i] = static_cast<int8_t>(10 + i);
    table['A' + i] = static_cast<int8_t>(10 + i);
  }
  return table;
}

inline constexpr auto ESCAPES = make_escape_table();
inline constexpr auto HEX_DIGITS = make_hex_table();

inline constexpr uint32_t HIGH_SURROGATE_FIRST = 0xD800;
inline constexpr uint32_t HIGH_SURROGATE_LAST = 0xDBFF;
inline constexpr uint32_t LOW_SURROGATE_FIRST = 0xDC00;
inline constexpr uint32_t LOW_SURROGATE_LAST = 0xDFFF;

inline char unescape(char c) {
  return ESCAPES[static_cast<unsigned char>(c)];
}

inline int hex_value(char c) {
  return HEX_DIGITS[static_cast<unsigned char>(c)];
}

// Appends a unicode code point (at most 0x10FFFF) encoded as UTF-8.
inline void append_utf8(std::string &out, uint32_t code_point) {
  if (code_point < 0x80) {
    out += static_cast<char>(code_point);
  } else if (code_point < 0x800) {
    out += static_cast<char>(0xC0 | (code_point >> 6));
    out += static_cast<char>(0x80 | (code_point & 0x3F));
  } else if (code_point < 0x10000) {
    out += static_cast<char>(0xE0 | (code_point >> 12));
    out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (code_point & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (code_point >> 18));
    out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (code_point & 0x3F));
  }
}

} // namespace tokenizer
