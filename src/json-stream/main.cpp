#include <iostream>
#include <string>
#include <vector>

#include <json-stream/cli.hpp>

int main(int argc, char *argv[]) {
  auto options = cli::parse_options(std::vector<std::string>(argv + 1, argv + argc));
  if (!options.has_value()) {
    cli::print_usage(std::cout);
    return cli::UsageError;
  }

  return cli::run_file(options.value(), std::cout, std::cerr);
}
