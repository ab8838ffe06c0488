#include <format>
#include <stdexcept>

#include <json-stream/error.hpp>

#include <json-stream/stream/buffer.hpp>

namespace stream {

void Buffer::write(std::string_view chunk) {
  if (finished) {
    throw StreamError("Stream is not writable");
  }

  // The write cursor is always the end of the data, reads keep their own cursor.
  data.append(chunk);
}

void Buffer::mark_finished() {
  finished = true;
}

ReadResult Buffer::peek() const {
  if (read_pos < data.size()) {
    return data[read_pos];
  }
  return exhausted();
}

ReadResult Buffer::take() {
  if (read_pos < data.size()) {
    return data[read_pos++];
  }
  return exhausted();
}

void Buffer::rewind(size_t pos) {
  if (pos > read_pos) {
    throw std::out_of_range(std::format("Cannot rewind read cursor forward from {} to {}", read_pos, pos));
  }
  read_pos = pos;
}

std::string_view Buffer::consumed_since(size_t pos) const {
  if (pos > read_pos) {
    throw std::out_of_range(std::format("Position {} is past the read cursor {}", pos, read_pos));
  }
  return std::string_view(data).substr(pos, read_pos - pos);
}

ReadResult Buffer::exhausted() const {
  if (finished) return EndOfStream {};
  return NeedMoreData {};
}

} // namespace stream
