#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <istream>
#include <memory>
#include <ostream>
#include <sstream>
#include <string>

namespace cafs {
namespace utils {

// Size of the chunks moved between sources, tees and stores
constexpr std::size_t CHUNK_SIZE = 64 * 1024;

// Pull-based byte producer. read() fills up to `size` bytes into `buffer` and
// returns the number of bytes delivered, 0 once the source is exhausted.
// A failing source throws; the exception reaches every consumer unchanged.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  virtual std::size_t read(char* buffer, std::size_t size) = 0;
};

using ByteSourcePtr = std::shared_ptr<ByteSource>;

// Writes the next chunk into the stream, returns false once there is nothing left
using ProducerFn = std::function<bool(std::stringstream&)>;


class BufferSource : public ByteSource {
public:
  explicit BufferSource(std::string data);

  std::size_t read(char* buffer, std::size_t size) override;

private:
  std::string data_;
  std::size_t offset_{0};
};

class StreamSource : public ByteSource {
public:
  // The stream must outlive the source
  explicit StreamSource(std::istream& input);

  std::size_t read(char* buffer, std::size_t size) override;

private:
  std::istream& input_;
};

class FileSource : public ByteSource {
public:
  explicit FileSource(const std::filesystem::path& path);

  std::size_t read(char* buffer, std::size_t size) override;

private:
  std::filesystem::path path_;
  std::ifstream file_;
};

class ProducerSource : public ByteSource {
public:
  explicit ProducerSource(ProducerFn producer);

  std::size_t read(char* buffer, std::size_t size) override;

private:
  ProducerFn producer_;
  std::string chunk_;
  std::size_t offset_{0};
  bool eof_{false};

  // Pulls chunks from the producer until one has data or the producer is done
  bool fill_chunk();
};


// ---- SOURCE FACTORIES ----
ByteSourcePtr from_buffer(std::string data);
ByteSourcePtr from_stream(std::istream& input);
ByteSourcePtr from_file(const std::filesystem::path& path);
ByteSourcePtr from_producer(ProducerFn producer);


// ---- HELPERS ----
// Drains `source` into `output` and returns the number of bytes copied
std::uint64_t copy(ByteSource& source, std::ostream& output);
// Drains `source` into a string
std::string read_all(ByteSource& source);

} // namespace utils
} // namespace cafs
