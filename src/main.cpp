#include "cli/cli.hpp"
#include <iostream>
#include <string>
#include "content/content_store.hpp"
#include "logger/logger.hpp"

namespace {

cafs::logging::LogOptions log_options_for(const cafs::cli::ProgramOptions& options) {
  cafs::logging::LogOptions log_options;
  log_options.log_file = options.log_file;
  // Console logs share stderr with command errors, keep them quiet unless asked
  if (options.verbose) {
    log_options.min_level = cafs::logging::severity_level::debug;
  } else if (options.log_file.empty()) {
    log_options.min_level = cafs::logging::severity_level::warning;
  }
  return log_options;
}

int run_command(const cafs::cli::ProgramOptions& options) {
  try {
    cafs::logging::init_logging(log_options_for(options));

    cafs::content::ContentStoreOptions store_options;
    store_options.store = cafs::cli::build_store(options);
    store_options.hash_algorithm = options.hash;
    store_options.keep_extension = options.keep_extension;
    cafs::content::ContentStore content_store(store_options);

    cafs::cli::CLI cli(content_store, std::cout, std::cerr);
    return cli.run(options.command, options.args);
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to open store: " << e.what() << '\n';
    return 1;
  }
}

} // namespace

int main(int argc, char* argv[]) {
  if (const auto options = cafs::cli::parse_command_line(argc, argv, std::cerr); !options.valid) {
    return 1;
  } else {
    return run_command(options);
  }
}
