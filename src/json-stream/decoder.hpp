#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string_view>

#include <json-stream/path.hpp>
#include <json-stream/stream/buffer.hpp>
#include <json-stream/tokenizer/token.hpp>
#include <json-stream/tokenizer/tokenizer.hpp>
#include <json-stream/value.hpp>

// Called once per leaf value, in document order. The path refers to decoder
// state that changes after the callback returns, copy it to keep it. An
// exception thrown by the callback propagates out of read() and leaves the
// decoder unusable.
using ValueCallback = std::function<void(const Path &path, const Value &value)>;

// Token categories the decoder can expect next, combined as a bit set.
enum Expect : uint8_t {
  ExpectValue        = 1 << 0,
  ExpectArrayOpen    = 1 << 1,
  ExpectArrayClose   = 1 << 2,
  ExpectObjectOpen   = 1 << 3,
  ExpectObjectClose  = 1 << 4,
  ExpectComma        = 1 << 5,
  ExpectColon        = 1 << 6,
};

// Incremental JSON decoder.
//
// Data is pushed in with write() and end(), and read() decodes as much of it
// as possible, invoking the callback for every leaf value found on the way.
class Decoder {
public:
  Decoder();

  Decoder(Decoder const&) = delete;
  void operator=(Decoder const&) = delete;

  void write(std::string_view data);
  void end();

  // Returns true when more input is needed, false once the input is exhausted.
  // Throws DecodeError on malformed input, after which the decoder is unusable.
  bool read(const ValueCallback &callback);

  const Path & path() const { return current_path; }
  size_t depth() const { return current_path.size(); }
  bool at_root() const { return current_path.empty(); }
  size_t values_emitted() const { return emitted; }
private:
  static constexpr uint8_t EXPECT_ANY_VALUE = ExpectValue | ExpectArrayOpen | ExpectObjectOpen;

  stream::Buffer buffer;
  tokenizer::Tokenizer lexer;

  Path current_path;
  uint8_t expecting = EXPECT_ANY_VALUE;
  size_t emitted = 0;
  bool failed = false;
  bool exhausted = false;

  void dispatch(tokenizer::Token &token, const ValueCallback &callback);

  // State transitions
  void handle_value(tokenizer::Token &token, const ValueCallback &callback);
  void handle_comma(const tokenizer::Token &token);
  void handle_colon(const tokenizer::Token &token);
  void open_array(const tokenizer::Token &token);
  void close_array(const tokenizer::Token &token);
  void open_object(const tokenizer::Token &token);
  void close_object(const tokenizer::Token &token);

  // Helper functions
  void ascend();
  void emit(const Value &value, const ValueCallback &callback);
  void expect(const tokenizer::Token &token, Expect category);

  [[noreturn]] void fail(const std::string &message, const std::string &source, size_t offset);
};
