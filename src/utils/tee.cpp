#include "utils/tee.hpp"
#include <algorithm>
#include <cstring>
#include <future>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace cafs {
namespace utils {

//==============================================
// CONSTRUCTOR
//==============================================

Tee::Tee(std::size_t branches) : cursors_(branches) {
  if (branches == 0) {
    throw std::invalid_argument("Tee: At least one branch is required");
  }
  branches_.reserve(branches);
  for (std::size_t i = 0; i < branches; ++i) {
    branches_.push_back(std::make_unique<Branch>(*this, i));
  }
}


//==============================================
// PRODUCER SIDE
//==============================================

void Tee::write(const char* data, std::size_t size) {
  if (size == 0) {
    return;
  }

  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return error_ || all_consumed(); });

  if (error_) {
    std::rethrow_exception(error_);
  }
  if (closed_) {
    throw std::logic_error("Tee: Write after close");
  }

  chunk_.assign(data, size);
  ++generation_;
  for (auto& cursor : cursors_) {
    cursor.offset = 0;
  }
  bytes_written_ += size;
  cv_.notify_all();
}

void Tee::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = true;
  cv_.notify_all();
}

void Tee::fail(std::exception_ptr error) {
  std::lock_guard<std::mutex> lock(mutex_);
  // The first failure is the one every participant reports
  if (!error_) {
    error_ = error;
  }
  cv_.notify_all();
}


//==============================================
// CONSUMER SIDE
//==============================================

ByteSource& Tee::branch(std::size_t index) {
  return *branches_.at(index);
}

void Tee::detach(std::size_t index) {
  std::lock_guard<std::mutex> lock(mutex_);
  cursors_.at(index).detached = true;
  cv_.notify_all();
}

std::size_t Tee::Branch::read(char* buffer, std::size_t size) {
  return tee_.pull(index_, buffer, size);
}

std::size_t Tee::pull(std::size_t index, char* buffer, std::size_t size) {
  std::unique_lock<std::mutex> lock(mutex_);
  Cursor& cursor = cursors_[index];
  cv_.wait(lock, [this, &cursor] {
    return error_ || cursor.generation < generation_ || closed_;
  });

  if (error_) {
    std::rethrow_exception(error_);
  }
  if (cursor.generation == generation_) {
    // Closed and fully drained
    return 0;
  }

  std::size_t n = std::min(size, chunk_.size() - cursor.offset);
  std::memcpy(buffer, chunk_.data() + cursor.offset, n);
  cursor.offset += n;

  if (cursor.offset == chunk_.size()) {
    cursor.generation = generation_;
    cv_.notify_all();
  }
  return n;
}

bool Tee::all_consumed() const {
  return std::all_of(cursors_.begin(), cursors_.end(), [this](const Cursor& cursor) {
    return cursor.detached || cursor.generation == generation_;
  });
}

std::uint64_t Tee::bytes_written() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return bytes_written_;
}


//==============================================
// TEE STREAM BUFFER
//==============================================

TeeStreambuf::int_type TeeStreambuf::overflow(int_type ch) {
  if (traits_type::eq_int_type(ch, traits_type::eof())) {
    return traits_type::not_eof(ch);
  }
  char c = traits_type::to_char_type(ch);
  tee_.write(&c, 1);
  return ch;
}

std::streamsize TeeStreambuf::xsputn(const char* s, std::streamsize n) {
  // Large writes are split so the tee never holds more than one chunk
  std::streamsize written = 0;
  while (written < n) {
    auto length = std::min<std::streamsize>(n - written, static_cast<std::streamsize>(CHUNK_SIZE));
    tee_.write(s + written, static_cast<std::size_t>(length));
    written += length;
  }
  return written;
}


//==============================================
// FORK
//==============================================

std::uint64_t fork(const Producer& produce, const std::vector<Consumer>& consumers) {
  Tee tee(consumers.size());

  std::vector<std::future<void>> results;
  results.reserve(consumers.size());
  for (std::size_t i = 0; i < consumers.size(); ++i) {
    results.push_back(std::async(std::launch::async, [&tee, &consumers, i] {
      try {
        consumers[i](tee.branch(i));
        tee.detach(i);
      }
      catch (...) {
        tee.fail(std::current_exception());
        throw;
      }
    }));
  }

  std::exception_ptr producer_error;
  try {
    produce(tee);
    tee.close();
  }
  catch (...) {
    producer_error = std::current_exception();
    tee.fail(producer_error);
  }

  std::exception_ptr consumer_error;
  for (auto& result : results) {
    try {
      result.get();
    }
    catch (...) {
      if (!consumer_error) {
        consumer_error = std::current_exception();
      }
    }
  }

  if (producer_error) {
    std::rethrow_exception(producer_error);
  }
  if (consumer_error) {
    std::rethrow_exception(consumer_error);
  }

  std::uint64_t total_bytes = tee.bytes_written();
  BOOST_LOG_TRIVIAL(trace) << "Tee: Forked " << total_bytes << " bytes to " << consumers.size() << " consumers";
  return total_bytes;
}

std::uint64_t fork(ByteSource& source, const std::vector<Consumer>& consumers) {
  return fork([&source](Tee& tee) {
    std::vector<char> buffer(CHUNK_SIZE);
    while (std::size_t n = source.read(buffer.data(), buffer.size())) {
      tee.write(buffer.data(), n);
    }
  }, consumers);
}

} // namespace utils
} // namespace cafs
