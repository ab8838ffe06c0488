#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Object segment of a path. Holds no key while the decoder is awaiting one,
// and the last key read while awaiting its value.
struct ObjectKey {
  std::optional<std::string> key;

  bool operator==(const ObjectKey &) const = default;
};

// An array segment holds the index of the next slot to fill.
using PathSegment = std::variant<size_t, ObjectKey>;

// Root-to-innermost location inside the document. Empty at the root.
using Path = std::vector<PathSegment>;

inline bool is_array_segment(const PathSegment &segment) {
  return std::holds_alternative<size_t>(segment);
}

inline bool is_object_segment(const PathSegment &segment) {
  return std::holds_alternative<ObjectKey>(segment);
}

// Renders a normalized JSONPath, e.g. `$['store'][3]`.
std::string to_string(const Path &path);
