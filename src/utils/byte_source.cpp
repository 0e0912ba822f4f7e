#include "utils/byte_source.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <vector>
#include <boost/log/trivial.hpp>

namespace cafs {
namespace utils {

//==============================================
// BUFFER SOURCE
//==============================================

BufferSource::BufferSource(std::string data) : data_(std::move(data)) {}

std::size_t BufferSource::read(char* buffer, std::size_t size) {
  std::size_t n = std::min(size, data_.size() - offset_);
  if (n > 0) {
    std::memcpy(buffer, data_.data() + offset_, n);
    offset_ += n;
  }
  return n;
}


//==============================================
// STREAM SOURCE
//==============================================

StreamSource::StreamSource(std::istream& input) : input_(input) {}

std::size_t StreamSource::read(char* buffer, std::size_t size) {
  if (input_.eof()) {
    return 0;
  }
  if (!input_.good()) {
    BOOST_LOG_TRIVIAL(error) << "Byte source: Invalid input stream state";
    throw std::runtime_error("Byte source: Invalid input stream");
  }

  input_.read(buffer, static_cast<std::streamsize>(size));
  if (input_.bad()) {
    BOOST_LOG_TRIVIAL(error) << "Byte source: Failed to read from input stream";
    throw std::runtime_error("Byte source: Failed to read from input stream");
  }
  return static_cast<std::size_t>(input_.gcount());
}


//==============================================
// FILE SOURCE
//==============================================

FileSource::FileSource(const std::filesystem::path& path)
  : path_(path)
  , file_(path, std::ios::binary) {
  if (!file_) {
    BOOST_LOG_TRIVIAL(error) << "Byte source: Failed to open file: " << path_.string();
    throw std::runtime_error("ENOENT: no such file or directory, open '" + path_.string() + "'");
  }
  BOOST_LOG_TRIVIAL(debug) << "Byte source: Opened file: " << path_.string();
}

std::size_t FileSource::read(char* buffer, std::size_t size) {
  if (file_.eof()) {
    return 0;
  }

  file_.read(buffer, static_cast<std::streamsize>(size));
  if (file_.bad()) {
    BOOST_LOG_TRIVIAL(error) << "Byte source: Failed to read file: " << path_.string();
    throw std::runtime_error("Byte source: Failed to read file: " + path_.string());
  }
  return static_cast<std::size_t>(file_.gcount());
}


//==============================================
// PRODUCER SOURCE
//==============================================

ProducerSource::ProducerSource(ProducerFn producer) : producer_(std::move(producer)) {}

bool ProducerSource::fill_chunk() {
  while (offset_ == chunk_.size()) {
    if (eof_) {
      return false;
    }

    std::stringstream chunk;
    // Exceptions thrown by the producer are the source's own failure and pass through untouched
    bool more = producer_(chunk);
    chunk_ = chunk.str();
    offset_ = 0;

    if (!more) {
      eof_ = true;
    }
  }
  return true;
}

std::size_t ProducerSource::read(char* buffer, std::size_t size) {
  if (!fill_chunk()) {
    return 0;
  }

  std::size_t n = std::min(size, chunk_.size() - offset_);
  std::memcpy(buffer, chunk_.data() + offset_, n);
  offset_ += n;
  return n;
}


//==============================================
// SOURCE FACTORIES
//==============================================

ByteSourcePtr from_buffer(std::string data) {
  return std::make_shared<BufferSource>(std::move(data));
}

ByteSourcePtr from_stream(std::istream& input) {
  return std::make_shared<StreamSource>(input);
}

ByteSourcePtr from_file(const std::filesystem::path& path) {
  return std::make_shared<FileSource>(path);
}

ByteSourcePtr from_producer(ProducerFn producer) {
  return std::make_shared<ProducerSource>(std::move(producer));
}


//==============================================
// HELPERS
//==============================================

std::uint64_t copy(ByteSource& source, std::ostream& output) {
  std::vector<char> buffer(CHUNK_SIZE);
  std::uint64_t total_bytes = 0;

  while (std::size_t n = source.read(buffer.data(), buffer.size())) {
    output.write(buffer.data(), static_cast<std::streamsize>(n));
    if (!output.good()) {
      throw std::runtime_error("Byte source: Failed to write to output stream");
    }
    total_bytes += n;
  }
  return total_bytes;
}

std::string read_all(ByteSource& source) {
  std::ostringstream output;
  copy(source, output);
  return output.str();
}

} // namespace utils
} // namespace cafs
