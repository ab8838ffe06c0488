#pragma once

#include <cstddef>
#include <functional>
#include <istream>
#include <string_view>
#include <vector>

namespace util {

// Reads a stream in chunks of at most chunk_size bytes, calling on_chunk for each.
inline void for_each_chunk(std::istream &input, size_t chunk_size,
    const std::function<void(std::string_view)> &on_chunk) {
  std::vector<char> chunk(chunk_size);
  while (input) {
    input.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    auto n = static_cast<size_t>(input.gcount());
    if (n == 0) break;
    on_chunk(std::string_view(chunk.data(), n));
  }
}

} // namespace util
