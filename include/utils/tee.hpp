#pragma once

#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <streambuf>
#include <string>
#include <vector>
#include "utils/byte_source.hpp"

namespace cafs {
namespace utils {

// Broadcasts a single byte stream to a fixed number of branches.
//
// Only one chunk is held at a time: write() blocks until every live branch has
// consumed the previous chunk, so the slowest consumer paces the producer.
// fail() poisons the tee and every blocked or later read() rethrows the error.
class Tee {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Tee(std::size_t branches);
  ~Tee() = default;

  Tee(const Tee&) = delete;
  Tee& operator=(const Tee&) = delete;


  // ---- PRODUCER SIDE ----
  // Hands a chunk to all branches, throws the tee's error if it has failed
  void write(const char* data, std::size_t size);
  // Signals end of stream, branches drain the last chunk and then read 0
  void close();
  // Aborts the stream for the producer and every branch
  void fail(std::exception_ptr error);


  // ---- CONSUMER SIDE ----
  ByteSource& branch(std::size_t index);
  // Stops waiting on a branch whose consumer has finished
  void detach(std::size_t index);


  // ---- GETTERS ----
  std::uint64_t bytes_written() const;
  std::size_t branch_count() const { return cursors_.size(); }

private:
  class Branch : public ByteSource {
  public:
    Branch(Tee& tee, std::size_t index) : tee_(tee), index_(index) {}
    std::size_t read(char* buffer, std::size_t size) override;

  private:
    Tee& tee_;
    std::size_t index_;
  };

  struct Cursor {
    std::uint64_t generation{0};
    std::size_t offset{0};
    bool detached{false};
  };

  // ---- PARAMETERS ----
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::string chunk_;
  std::uint64_t generation_{0};
  std::vector<Cursor> cursors_;
  std::vector<std::unique_ptr<Branch>> branches_;
  bool closed_{false};
  std::exception_ptr error_;
  std::uint64_t bytes_written_{0};

  std::size_t pull(std::size_t index, char* buffer, std::size_t size);
  // Requires mutex_
  bool all_consumed() const;
};


// Output stream buffer feeding a tee, lets push-style readers act as a tee producer
class TeeStreambuf : public std::streambuf {
public:
  explicit TeeStreambuf(Tee& tee) : tee_(tee) {}

protected:
  int_type overflow(int_type ch) override;
  std::streamsize xsputn(const char* s, std::streamsize n) override;

private:
  Tee& tee_;
};


using Producer = std::function<void(Tee&)>;
using Consumer = std::function<void(ByteSource&)>;

// Runs every consumer on its own thread against its own branch while `produce`
// feeds the tee on the calling thread. Returns the number of bytes produced.
// If the producer fails its exception is rethrown, otherwise the first consumer
// failure is; any failure aborts all the other participants.
std::uint64_t fork(const Producer& produce, const std::vector<Consumer>& consumers);

// Same as above with `source` pumped into the tee
std::uint64_t fork(ByteSource& source, const std::vector<Consumer>& consumers);

} // namespace utils
} // namespace cafs
