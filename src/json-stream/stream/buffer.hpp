#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>

namespace stream {

// Signals returned instead of a character when the buffer has nothing left to read.
// NeedMoreData: the writer may still append. EndOfStream: it never will.
struct NeedMoreData {};
struct EndOfStream {};

using ReadResult = std::variant<char, NeedMoreData, EndOfStream>;

// Append-only character store with independent write and read cursors.
class Buffer {
public:
  // Appends data at the write cursor. Throws StreamError once finished.
  void write(std::string_view data);
  // Seals the buffer, no further writes are accepted.
  void mark_finished();

  ReadResult peek() const;
  ReadResult take();

  size_t position() const { return read_pos; }
  // Text read since pos, which must be a position at or before the read cursor.
  std::string_view consumed_since(size_t pos) const;
  // Moves the read cursor back to a position obtained from position().
  void rewind(size_t pos);

  size_t available() const { return data.size() - read_pos; }
  size_t size() const { return data.size(); }
  bool is_finished() const { return finished; }
private:
  std::string data;
  size_t read_pos = 0;
  bool finished = false;

  ReadResult exhausted() const;
};

} // namespace stream
