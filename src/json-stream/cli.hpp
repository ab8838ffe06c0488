#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace cli {

constexpr size_t DEFAULT_CHUNK_SIZE = 4096;

enum ExitCode {
  Success = 0,
  UsageError = 1,
  InputError = 2,
  DecodeFailure = 3,
  TruncatedDocument = 4,
};

struct Options {
  std::string input;
  size_t chunk_size = DEFAULT_CHUNK_SIZE;
};

// Parses the arguments following the program name. Returns nothing on a usage error.
std::optional<Options> parse_options(const std::vector<std::string> &args);

void print_usage(std::ostream &out);

// Decodes input chunk by chunk, printing `<path> = <value>` for every leaf to
// out and diagnostics to err. Returns the process exit code.
int run(const Options &options, std::istream &input, std::ostream &out, std::ostream &err);

// Opens options.input, or uses stdin for "-", and decodes it with run().
int run_file(const Options &options, std::ostream &out, std::ostream &err);

} // namespace cli
