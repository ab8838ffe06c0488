#include <cmath>
#include <format>

#include <json-stream/value.hpp>

namespace {

struct ValuePrinter {
  std::string &out;

  void operator()(std::nullptr_t) { out += "null"; }
  void operator()(bool b) { out += b ? "true" : "false"; }
  void operator()(int64_t i) { out += std::format("{}", i); }
  void operator()(double d) {
    if (!std::isfinite(d)) {
      out += "null";
      return;
    }
    auto text = std::format("{}", d);
    // Keep doubles distinguishable from integers.
    if (text.find_first_of(".eE") == std::string::npos) text += ".0";
    out += text;
  }
  void operator()(const std::string &s) { append_quoted(out, s); }
};

} // namespace

void append_quoted(std::string &out, const std::string &s) {
  out += '"';
  for (unsigned char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default: {
        if (c < 0x20) {
          out += std::format("\\u{:04x}", static_cast<unsigned int>(c));
        } else {
          out += static_cast<char>(c);
        }
      }
    }
  }
  out += '"';
}

std::string to_string(const Value &value) {
  std::string out;
  std::visit(ValuePrinter { out }, value);
  return out;
}
