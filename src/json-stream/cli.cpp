#include <charconv>
#include <fstream>
#include <iostream>
#include <string_view>
#include <system_error>

#include <json-stream/util/files.hpp>
#include <json-stream/decoder.hpp>
#include <json-stream/error.hpp>

#include <json-stream/cli.hpp>

namespace cli {

namespace {

std::optional<size_t> parse_chunk_size(const std::string &value) {
  size_t chunk_size = 0;
  auto last = value.data() + value.size();
  auto [ptr, ec] = std::from_chars(value.data(), last, chunk_size);
  if (ec != std::errc() || ptr != last || chunk_size == 0) return std::nullopt;
  return chunk_size;
}

} // namespace

std::optional<Options> parse_options(const std::vector<std::string> &args) {
  Options options;
  std::vector<std::string> positional;

  for (size_t i = 0; i < args.size(); i++) {
    if (args[i] == "--chunk-size") {
      if (i + 1 >= args.size()) return std::nullopt;
      auto chunk_size = parse_chunk_size(args[++i]);
      if (!chunk_size.has_value()) return std::nullopt;
      options.chunk_size = chunk_size.value();
    } else {
      positional.push_back(args[i]);
    }
  }

  if (positional.size() != 1) return std::nullopt;

  options.input = positional[0];
  return options;
}

void print_usage(std::ostream &out) {
  out << "Usage: ./json-stream <file|-> [--chunk-size N]" << std::endl;
}

int run(const Options &options, std::istream &input, std::ostream &out, std::ostream &err) {
  auto print_value = [&](const Path &path, const Value &value) {
    out << to_string(path) << " = " << to_string(value) << "\n";
  };

  auto decoder = Decoder();
  try {
    util::for_each_chunk(input, options.chunk_size, [&](std::string_view chunk) {
      decoder.write(chunk);
      decoder.read(print_value);
    });

    decoder.end();
    decoder.read(print_value);
  } catch (const DecodeError &e) {
    out << std::flush;
    err << "Invalid JSON: " << e.what() << std::endl;
    return DecodeFailure;
  }
  out << std::flush;

  err << "Decoded " << decoder.values_emitted() << " values" << std::endl;

  if (!decoder.at_root()) {
    err << "Input ended inside " << to_string(decoder.path()) << std::endl;
    return TruncatedDocument;
  }

  return Success;
}

int run_file(const Options &options, std::ostream &out, std::ostream &err) {
  if (options.input == "-") {
    return run(options, std::cin, out, err);
  }

  std::ifstream file(options.input, std::ios::binary);
  if (!file.is_open()) {
    err << "Could not open file: " << options.input << std::endl;
    return InputError;
  }

  return run(options, file, out, err);
}

} // namespace cli
