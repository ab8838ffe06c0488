#include <format>

#include <json-stream/path.hpp>

std::string to_string(const Path &path) {
  std::string out = "$";

  for (const auto &segment : path) {
    if (auto index = std::get_if<size_t>(&segment)) {
      out += std::format("[{}]", *index);
      continue;
    }

    auto &object = std::get<ObjectKey>(segment);
    if (!object.key.has_value()) {
      // Awaiting a key, there is nothing to address yet.
      out += "[?]";
      continue;
    }

    out += "['";
    for (char c : object.key.value()) {
      if (c == '\'' || c == '\\') out += '\\';
      out += c;
    }
    out += "']";
  }

  return out;
}
