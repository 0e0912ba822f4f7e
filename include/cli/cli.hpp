#pragma once

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include "content/content_store.hpp"
#include "store/store.hpp"

namespace cafs {
namespace cli {

struct ProgramOptions {
  std::string dir;
  // Empty means no cache tier
  std::string cache_dir;
  std::uint64_t cache_limit{100ull * 1024 * 1024};
  std::string hash{"sha256"};
  bool keep_extension{false};
  std::string log_file;
  bool verbose{false};
  std::string command;
  std::vector<std::string> args;
  bool valid{false};
};

void print_usage(const std::string& program_name, std::ostream& err);

// Parses `cafs <options> <command> [args]`, reporting problems to `err`
ProgramOptions parse_command_line(int argc, char* argv[], std::ostream& err);

// A DirectoryStore on --dir, wrapped in a CacheStore when --cache-dir is given
std::shared_ptr<store::Store> build_store(const ProgramOptions& options);


class CLI {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CLI(content::ContentStore& content_store, std::ostream& out, std::ostream& err);


  // ---- STARTUP ----
  // Runs a single command and returns the process exit code
  int run(const std::string& command, const std::vector<std::string>& args);

private:
  // ---- PARAMETERS ----
  content::ContentStore& content_store_;
  std::ostream& out_;
  std::ostream& err_;


  // ---- COMMAND PROCESSING ----
  int process_command(const std::string& command, const std::vector<std::string>& args);
  int handle_put_command(const std::string& filename);
  int handle_get_command(const std::string& key, const std::string& output_path);
  int handle_has_command(const std::string& key);
  int handle_has_content_command(const std::string& filename);
  int handle_remove_command(const std::string& key);
  int log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace cafs
