#include <gtest/gtest.h>
#include <string>
#include "crypto/digest.hpp"
#include "test_utils.hpp"

using namespace cafs::crypto;

class DigestTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_logging();
  }
};

TEST_F(DigestTest, KnownSha256Vectors) {
  EXPECT_EQ(Digest::hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(Digest::hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(DigestTest, OtherAlgorithmsByName) {
  EXPECT_EQ(Digest::hex("abc", "md5"), "900150983cd24fb0d6963f7d28e17f72");
  EXPECT_EQ(Digest::hex("abc", "sha1"), "a9993e364706816aba3e25717850c26c9cd0d89d");
}

TEST_F(DigestTest, IncrementalMatchesOneShot) {
  const std::string data = "The quick brown fox jumps over the lazy dog";

  Digest digest;
  digest.update(data.data(), 10);
  digest.update(data.data() + 10, 0);
  digest.update(data.data() + 10, data.size() - 10);

  EXPECT_EQ(digest.bytes(), data.size());
  EXPECT_EQ(digest.hex_digest(), Digest::hex(data));
  EXPECT_EQ(digest.algorithm(), "sha256");
}

TEST_F(DigestTest, UnsupportedAlgorithm) {
  EXPECT_FALSE(Digest::is_supported("not-a-digest"));
  EXPECT_TRUE(Digest::is_supported("sha512"));
  EXPECT_THROW(Digest digest("not-a-digest"), DigestError);
}

TEST_F(DigestTest, FinalizesOnlyOnce) {
  Digest digest;
  digest.update("abc", 3);
  digest.hex_digest();

  EXPECT_THROW(digest.hex_digest(), DigestError);
  EXPECT_THROW(digest.update("d", 1), DigestError);
}
