#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include "utils/tee.hpp"
#include "test_utils.hpp"

using namespace cafs::utils;

class TeeTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_logging();
  }

  static std::string pattern(std::size_t size) {
    std::string data(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
      data[i] = static_cast<char>('a' + (i % 26));
    }
    return data;
  }
};

TEST_F(TeeTest, EveryConsumerSeesTheWholeStream) {
  const std::string data = pattern(3 * CHUNK_SIZE + 17);
  std::string first, second, third;

  auto source = from_buffer(data);
  std::uint64_t total = fork(*source, {
    [&first](ByteSource& input) { first = read_all(input); },
    [&second](ByteSource& input) { second = read_all(input); },
    [&third](ByteSource& input) { third = read_all(input); }
  });

  EXPECT_EQ(total, data.size());
  EXPECT_EQ(first, data);
  EXPECT_EQ(second, data);
  EXPECT_EQ(third, data);
}

TEST_F(TeeTest, EmptySourceClosesAllBranches) {
  std::string received = "untouched";
  auto source = from_buffer("");

  std::uint64_t total = fork(*source, {
    [&received](ByteSource& input) { received = read_all(input); }
  });

  EXPECT_EQ(total, 0u);
  EXPECT_TRUE(received.empty());
}

TEST_F(TeeTest, SlowConsumerPacesTheOthers) {
  const std::string data = pattern(4 * CHUNK_SIZE);
  std::string fast, slow;

  auto source = from_buffer(data);
  fork(*source, {
    [&fast](ByteSource& input) { fast = read_all(input); },
    [&slow](ByteSource& input) {
      std::vector<char> buffer(1024);
      while (std::size_t n = input.read(buffer.data(), buffer.size())) {
        slow.append(buffer.data(), n);
        std::this_thread::sleep_for(std::chrono::microseconds(50));
      }
    }
  });

  EXPECT_EQ(fast, data);
  EXPECT_EQ(slow, data);
}

TEST_F(TeeTest, ConsumerFinishingEarlyDoesNotBlockProducer) {
  const std::string data = pattern(5 * CHUNK_SIZE);
  std::string full;

  auto source = from_buffer(data);
  std::uint64_t total = fork(*source, {
    [](ByteSource& input) {
      char byte;
      input.read(&byte, 1);
    },
    [&full](ByteSource& input) { full = read_all(input); }
  });

  EXPECT_EQ(total, data.size());
  EXPECT_EQ(full, data);
}

TEST_F(TeeTest, SourceErrorReachesEveryConsumer) {
  std::atomic<int> consumers_failed{0};
  auto consumer = [&consumers_failed](ByteSource& input) {
    try {
      read_all(input);
    } catch (const std::runtime_error&) {
      ++consumers_failed;
      throw;
    }
  };

  auto source = failing_source({"first chunk"}, "aargh");
  try {
    fork(*source, {consumer, consumer});
    FAIL() << "Fork should have failed";
  } catch (const std::runtime_error& e) {
    EXPECT_STREQ(e.what(), "aargh");
  }
  EXPECT_EQ(consumers_failed, 2);
}

TEST_F(TeeTest, ConsumerErrorAbortsTheFork) {
  const std::string data = pattern(8 * CHUNK_SIZE);
  std::atomic<bool> other_failed{false};

  auto source = from_buffer(data);
  try {
    fork(*source, {
      [](ByteSource& input) {
        std::vector<char> buffer(CHUNK_SIZE);
        input.read(buffer.data(), buffer.size());
        throw std::logic_error("consumer gave up");
      },
      [&other_failed](ByteSource& input) {
        try {
          read_all(input);
        } catch (const std::logic_error&) {
          other_failed = true;
          throw;
        }
      }
    });
    FAIL() << "Fork should have failed";
  } catch (const std::logic_error& e) {
    EXPECT_STREQ(e.what(), "consumer gave up");
  }
  EXPECT_TRUE(other_failed);
}

TEST_F(TeeTest, StreambufActsAsProducer) {
  const std::string data = pattern(2 * CHUNK_SIZE + 5);
  std::string received;

  std::uint64_t total = fork(
    [&data](Tee& tee) {
      TeeStreambuf buffer(tee);
      std::ostream output(&buffer);
      output.exceptions(std::ios::badbit);
      output << data.substr(0, 3);
      output.put(data[3]);
      output.write(data.data() + 4, static_cast<std::streamsize>(data.size() - 4));
    },
    {[&received](ByteSource& input) { received = read_all(input); }});

  EXPECT_EQ(total, data.size());
  EXPECT_EQ(received, data);
}

TEST_F(TeeTest, WriteAfterFailureRethrows) {
  Tee tee(1);
  tee.fail(std::make_exception_ptr(std::runtime_error("broken")));

  EXPECT_THROW(tee.write("x", 1), std::runtime_error);
  char byte;
  EXPECT_THROW(tee.branch(0).read(&byte, 1), std::runtime_error);
}

TEST_F(TeeTest, RequiresAtLeastOneBranch) {
  EXPECT_THROW(Tee tee(0), std::invalid_argument);
}
