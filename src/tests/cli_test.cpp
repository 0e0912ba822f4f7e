#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include "cli/cli.hpp"
#include "crypto/digest.hpp"
#include "store/cache_store.hpp"
#include "store/directory_store.hpp"
#include "test_utils.hpp"

using namespace cafs::cli;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace {

ProgramOptions parse(std::vector<std::string> arguments, std::ostream& err) {
  arguments.insert(arguments.begin(), "cafs");
  std::vector<char*> argv;
  for (auto& argument : arguments) {
    argv.push_back(argument.data());
  }
  return parse_command_line(static_cast<int>(argv.size()), argv.data(), err);
}

} // namespace

class CommandLineTest : public ::testing::Test {
protected:
  std::ostringstream err;
};

TEST_F(CommandLineTest, ParsesFlagsAndCommand) {
  auto options = parse({"--dir", "/data", "--cache-dir", "/cache", "--cache-limit", "4096",
                        "--hash", "sha1", "--keep-extension", "--verbose",
                        "get", "abc", "out.bin"}, err);

  ASSERT_TRUE(options.valid) << err.str();
  EXPECT_EQ(options.dir, "/data");
  EXPECT_EQ(options.cache_dir, "/cache");
  EXPECT_EQ(options.cache_limit, 4096u);
  EXPECT_EQ(options.hash, "sha1");
  EXPECT_TRUE(options.keep_extension);
  EXPECT_TRUE(options.verbose);
  EXPECT_EQ(options.command, "get");
  EXPECT_THAT(options.args, ElementsAre("abc", "out.bin"));
}

TEST_F(CommandLineTest, Defaults) {
  auto options = parse({"--dir", "blobs", "has", "abc"}, err);

  ASSERT_TRUE(options.valid);
  EXPECT_TRUE(options.cache_dir.empty());
  EXPECT_EQ(options.cache_limit, 100u * 1024 * 1024);
  EXPECT_EQ(options.hash, "sha256");
  EXPECT_FALSE(options.keep_extension);
  EXPECT_TRUE(options.log_file.empty());
}

TEST_F(CommandLineTest, RejectsBadInput) {
  EXPECT_FALSE(parse({"put", "file"}, err).valid);
  EXPECT_THAT(err.str(), HasSubstr("--dir is required"));

  EXPECT_FALSE(parse({"--dir", "blobs"}, err).valid);
  EXPECT_THAT(err.str(), HasSubstr("No command given"));

  EXPECT_FALSE(parse({"--dir", "blobs", "--bogus", "put", "file"}, err).valid);
  EXPECT_THAT(err.str(), HasSubstr("Unknown argument: --bogus"));

  EXPECT_FALSE(parse({"--dir", "blobs", "--cache-limit", "lots", "put", "file"}, err).valid);
  EXPECT_THAT(err.str(), HasSubstr("Invalid cache limit"));

  EXPECT_FALSE(parse({"--dir"}, err).valid);
  EXPECT_THAT(err.str(), HasSubstr("Missing value for --dir"));
}

TEST_F(CommandLineTest, BuildsTieredStoreWhenCacheDirGiven) {
  init_logging();
  TempDir dir("cli_build_store");

  ProgramOptions options;
  options.dir = (dir.path() / "data").string();
  EXPECT_NE(dynamic_cast<cafs::store::DirectoryStore*>(build_store(options).get()), nullptr);

  options.cache_dir = (dir.path() / "cache").string();
  options.cache_limit = 1024;
  auto store = build_store(options);
  auto* tiered = dynamic_cast<cafs::store::CacheStore*>(store.get());
  ASSERT_NE(tiered, nullptr);
  EXPECT_EQ(tiered->stats().byte_budget, 1024u);
}


class CLITest : public ::testing::Test {
protected:
  std::unique_ptr<TempDir> test_dir;
  std::unique_ptr<cafs::content::ContentStore> content;
  std::ostringstream out;
  std::ostringstream err;

  void SetUp() override {
    init_logging();
    test_dir = std::make_unique<TempDir>("cli_test");

    ProgramOptions options;
    options.dir = (test_dir->path() / "blobs").string();

    cafs::content::ContentStoreOptions store_options;
    store_options.store = build_store(options);
    content = std::make_unique<cafs::content::ContentStore>(std::move(store_options));
  }

  std::filesystem::path write_file(const std::string& name, const std::string& data) {
    auto path = test_dir->path() / name;
    std::ofstream output(path, std::ios::binary);
    output << data;
    return path;
  }

  int run(const std::string& command, const std::vector<std::string>& args) {
    CLI cli(*content, out, err);
    return cli.run(command, args);
  }
};

TEST_F(CLITest, PutPrintsKeyHashAndSize) {
  auto path = write_file("notes.txt", "cli content");
  const std::string hash = cafs::crypto::Digest::hex("cli content");

  EXPECT_EQ(run("put", {path.string()}), 0);
  EXPECT_EQ(out.str(), hash + " " + hash + " 11\n");
}

TEST_F(CLITest, GetToStdoutAndFile) {
  auto path = write_file("data.bin", "round trip");
  ASSERT_EQ(run("put", {path.string()}), 0);
  const std::string key = cafs::crypto::Digest::hex("round trip");
  out.str("");

  EXPECT_EQ(run("get", {key}), 0);
  EXPECT_EQ(out.str(), "round trip");

  auto output_path = test_dir->path() / "copy.bin";
  EXPECT_EQ(run("get", {key, output_path.string()}), 0);
  std::ifstream copy(output_path, std::ios::binary);
  std::stringstream contents;
  contents << copy.rdbuf();
  EXPECT_EQ(contents.str(), "round trip");
}

TEST_F(CLITest, HasAndHasContentExitCodes) {
  auto stored = write_file("stored.txt", "present");
  auto unknown = write_file("unknown.txt", "absent");
  ASSERT_EQ(run("put", {stored.string()}), 0);

  EXPECT_EQ(run("has", {cafs::crypto::Digest::hex("present")}), 0);
  EXPECT_EQ(run("has", {cafs::crypto::Digest::hex("absent")}), 1);
  EXPECT_EQ(run("has-content", {stored.string()}), 0);
  EXPECT_EQ(run("has-content", {unknown.string()}), 1);
}

TEST_F(CLITest, RemoveDeletesBlob) {
  auto path = write_file("doomed.txt", "doomed");
  ASSERT_EQ(run("put", {path.string()}), 0);
  const std::string key = cafs::crypto::Digest::hex("doomed");

  EXPECT_EQ(run("rm", {key}), 0);
  EXPECT_EQ(run("has", {key}), 1);
  EXPECT_EQ(run("rm", {key}), 1);
  EXPECT_THAT(err.str(), HasSubstr("ENOENT"));
}

TEST_F(CLITest, ErrorsGoToStderr) {
  EXPECT_EQ(run("get", {"missing-key"}), 1);
  EXPECT_THAT(err.str(), HasSubstr("Error reading blob: ENOENT"));

  EXPECT_EQ(run("put", {(test_dir->path() / "nope.txt").string()}), 1);
  EXPECT_THAT(err.str(), HasSubstr("Error storing file"));

  EXPECT_EQ(run("frobnicate", {}), 1);
  EXPECT_THAT(err.str(), HasSubstr("Unknown command or invalid arguments: frobnicate"));
  EXPECT_TRUE(out.str().empty());
}
