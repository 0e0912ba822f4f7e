#include "cli/cli.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <unordered_set>
#include <boost/log/trivial.hpp>
#include "store/cache_store.hpp"
#include "store/directory_store.hpp"
#include "utils/byte_source.hpp"

namespace cafs {
namespace cli {

//==============================================
// COMMAND LINE PARSING
//==============================================

void print_usage(const std::string& program_name, std::ostream& err) {
  err << "Usage: " << program_name << " --dir <path> [options] <command> [args]\n"
      << "Options:\n"
      << "  --dir <path>          Directory holding the blobs (required)\n"
      << "  --cache-dir <path>    Directory used as a cache tier in front of --dir\n"
      << "  --cache-limit <bytes> Byte budget of the cache tier\n"
      << "  --hash <algorithm>    Content hash algorithm (default sha256)\n"
      << "  --keep-extension      Keep file extensions on stored keys\n"
      << "  --log-file <path>     Log to a rotating file instead of the console\n"
      << "  --verbose             Log debug messages\n"
      << "Commands:\n"
      << "  put <file>            Store a file, prints key, hash and size\n"
      << "  get <key> [out]       Write a blob to <out> or stdout\n"
      << "  has <key>             Exit code 0 if the key is stored\n"
      << "  has-content <file>    Exit code 0 if the file's content is stored\n"
      << "  rm <key>              Delete a blob\n"
      << "Example: " << program_name << " --dir ./blobs put notes.txt\n";
}

ProgramOptions parse_command_line(int argc, char* argv[], std::ostream& err) {
  const std::unordered_set<std::string> value_flags = {
    "--dir", "--cache-dir", "--cache-limit", "--hash", "--log-file"
  };

  ProgramOptions options;
  const std::string program_name = argc > 0 ? argv[0] : "cafs";

  int i = 1;
  for (; i < argc; ++i) {
    const std::string flag(argv[i]);
    if (flag.rfind("--", 0) != 0) {
      break;
    }

    if (flag == "--keep-extension") {
      options.keep_extension = true;
      continue;
    }
    if (flag == "--verbose") {
      options.verbose = true;
      continue;
    }
    if (value_flags.count(flag) == 0) {
      err << "Error: Unknown argument: " << flag << '\n';
      print_usage(program_name, err);
      return options;
    }
    if (i + 1 >= argc) {
      err << "Error: Missing value for " << flag << '\n';
      print_usage(program_name, err);
      return options;
    }

    const std::string value(argv[++i]);
    if (flag == "--dir") {
      options.dir = value;
    } else if (flag == "--cache-dir") {
      options.cache_dir = value;
    } else if (flag == "--cache-limit") {
      try {
        std::size_t consumed = 0;
        options.cache_limit = std::stoull(value, &consumed);
        if (consumed != value.size()) {
          throw std::invalid_argument(value);
        }
      } catch (const std::exception&) {
        err << "Error: Invalid cache limit: " << value << '\n';
        print_usage(program_name, err);
        return options;
      }
    } else if (flag == "--hash") {
      options.hash = value;
    } else if (flag == "--log-file") {
      options.log_file = value;
    }
  }

  if (options.dir.empty()) {
    err << "Error: --dir is required\n";
    print_usage(program_name, err);
    return options;
  }
  if (i >= argc) {
    err << "Error: No command given\n";
    print_usage(program_name, err);
    return options;
  }

  options.command = argv[i++];
  for (; i < argc; ++i) {
    options.args.emplace_back(argv[i]);
  }

  options.valid = true;
  return options;
}

std::shared_ptr<store::Store> build_store(const ProgramOptions& options) {
  auto directory = std::make_shared<store::DirectoryStore>(options.dir);
  if (options.cache_dir.empty()) {
    return directory;
  }

  store::CacheStoreOptions cache_options;
  cache_options.cache_tier = std::make_shared<store::DirectoryStore>(options.cache_dir);
  cache_options.fallback_tier = directory;
  cache_options.byte_budget = options.cache_limit;
  return std::make_shared<store::CacheStore>(cache_options);
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(content::ContentStore& content_store, std::ostream& out, std::ostream& err)
  : content_store_(content_store)
  , out_(out)
  , err_(err) {
  BOOST_LOG_TRIVIAL(debug) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

int CLI::run(const std::string& command, const std::vector<std::string>& args) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with " << args.size() << " argument(s)";
  return process_command(command, args);
}


//==============================================
// COMMAND PROCESSING
//==============================================

int CLI::process_command(const std::string& command, const std::vector<std::string>& args) {
  if (command == "put" && args.size() == 1) {
    return handle_put_command(args[0]);
  }
  else if (command == "get" && (args.size() == 1 || args.size() == 2)) {
    return handle_get_command(args[0], args.size() == 2 ? args[1] : std::string());
  }
  else if (command == "has" && args.size() == 1) {
    return handle_has_command(args[0]);
  }
  else if (command == "has-content" && args.size() == 1) {
    return handle_has_content_command(args[0]);
  }
  else if (command == "rm" && args.size() == 1) {
    return handle_remove_command(args[0]);
  }

  err_ << "Unknown command or invalid arguments: " << command << std::endl;
  return 1;
}

int CLI::handle_put_command(const std::string& filename) {
  try {
    const std::string name = std::filesystem::path(filename).filename().string();
    content::BlobInfo info = content_store_.put(utils::from_file(filename),
                                                content::metadata_for_filename(name)).get();
    out_ << info.key << ' ' << info.hash.value_or("") << ' ' << info.size.value_or(0) << std::endl;
    return 0;
  } catch (const std::exception& e) {
    return log_and_display_error("Error storing file", e.what());
  }
}

int CLI::handle_get_command(const std::string& key, const std::string& output_path) {
  try {
    if (output_path.empty()) {
      content_store_.stream(key, out_).get();
      out_.flush();
      return 0;
    }

    std::ofstream output(output_path, std::ios::binary);
    if (!output) {
      err_ << "Error opening file: " << output_path << std::endl;
      return 1;
    }
    content_store_.stream(key, output).get();
    return 0;
  } catch (const std::exception& e) {
    return log_and_display_error("Error reading blob", e.what());
  }
}

int CLI::handle_has_command(const std::string& key) {
  try {
    return content_store_.has(key).get() ? 0 : 1;
  } catch (const std::exception& e) {
    return log_and_display_error("Error checking blob", e.what());
  }
}

int CLI::handle_has_content_command(const std::string& filename) {
  try {
    const std::string name = std::filesystem::path(filename).filename().string();
    return content_store_.has_content(utils::from_file(filename),
                                      content::metadata_for_filename(name)).get() ? 0 : 1;
  } catch (const std::exception& e) {
    return log_and_display_error("Error checking content", e.what());
  }
}

int CLI::handle_remove_command(const std::string& key) {
  try {
    content_store_.unlink(key).get();
    out_ << "Blob deleted successfully" << std::endl;
    return 0;
  } catch (const std::exception& e) {
    return log_and_display_error("Error deleting blob", e.what());
  }
}

int CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  err_ << message << ": " << error << std::endl;
  return 1;
}

} // namespace cli
} // namespace cafs
