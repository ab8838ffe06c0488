#include <algorithm>
#include <stdexcept>

#include "value-recorder.hpp"

ValueCallback ValueRecorder::callback() {
  return [this](const Path &path, const Value &value) {
    recorded.push_back(Record { path, value });
  };
}

std::vector<std::string> ValueRecorder::lines() const {
  std::vector<std::string> result;
  for (const auto &record : recorded) {
    result.push_back(to_string(record.path) + " = " + to_string(record.value));
  }
  return result;
}

std::vector<std::string> decode_whole(const std::string &json) {
  return decode_with_splits(json, {});
}

std::vector<std::string> decode_with_splits(const std::string &json, const std::vector<size_t> &splits) {
  if (!std::is_sorted(splits.begin(), splits.end())) {
    throw std::invalid_argument("Split offsets must be sorted");
  }

  auto recorder = ValueRecorder();
  auto decoder = Decoder();
  auto callback = recorder.callback();

  size_t start = 0;
  for (auto split : splits) {
    decoder.write(json.substr(start, split - start));
    if (!decoder.read(callback)) throw std::logic_error("Decoder exhausted before end()");
    start = split;
  }
  decoder.write(json.substr(start));
  if (!decoder.read(callback)) throw std::logic_error("Decoder exhausted before end()");

  decoder.end();
  if (decoder.read(callback)) throw std::logic_error("Decoder wants more data after end()");

  return recorder.lines();
}

std::vector<std::string> decode_in_chunks(const std::string &json, size_t chunk_size) {
  std::vector<size_t> splits;
  for (size_t split = chunk_size; split < json.size(); split += chunk_size) {
    splits.push_back(split);
  }
  return decode_with_splits(json, splits);
}
