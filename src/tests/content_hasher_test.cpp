#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "crypto/content_hasher.hpp"

using namespace chunkfs::crypto;

class ContentHasherTest : public ::testing::Test {
protected:
  static std::vector<uint8_t> bytes_of(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
  }
};

TEST_F(ContentHasherTest, KnownDigests) {
  EXPECT_EQ(ContentHasher::hex_digest_of(bytes_of("")), "d41d8cd98f00b204e9800998ecf8427e");
  EXPECT_EQ(ContentHasher::hex_digest_of(bytes_of("abc")), "900150983cd24fb0d6963f7d28e17f72");
  EXPECT_EQ(ContentHasher::hex_digest_of(bytes_of("The quick brown fox jumps over the lazy dog")),
            "9e107d9d372bb6826bd81d3542a419d6");
}

TEST_F(ContentHasherTest, IncrementalUpdatesMatchOneShot) {
  const auto data = bytes_of("The quick brown fox jumps over the lazy dog");

  ContentHasher hasher;
  hasher.update(data.data(), 10);
  hasher.update(data.data() + 10, 0);
  hasher.update(data.data() + 10, data.size() - 10);

  EXPECT_EQ(hasher.hex_digest(), ContentHasher::hex_digest_of(data));
  EXPECT_EQ(hasher.bytes_hashed(), data.size());
}

TEST_F(ContentHasherTest, DigestDoesNotFinalize) {
  ContentHasher hasher;
  hasher.update(bytes_of("a"));
  EXPECT_EQ(hasher.hex_digest(), "0cc175b9c0f1b6a831c399e269772661");

  hasher.update(bytes_of("bc"));
  EXPECT_EQ(hasher.hex_digest(), "900150983cd24fb0d6963f7d28e17f72");
}

TEST_F(ContentHasherTest, CopiesAreIndependent) {
  ContentHasher base;
  base.update(bytes_of("ab"));

  ContentHasher copy(base);
  copy.update(bytes_of("c"));

  EXPECT_EQ(copy.hex_digest(), "900150983cd24fb0d6963f7d28e17f72");
  EXPECT_EQ(copy.bytes_hashed(), 3u);
  EXPECT_EQ(base.hex_digest(), ContentHasher::hex_digest_of(bytes_of("ab")));
  EXPECT_EQ(base.bytes_hashed(), 2u);

  ContentHasher assigned;
  assigned = copy;
  EXPECT_EQ(assigned.hex_digest(), copy.hex_digest());
}

TEST_F(ContentHasherTest, MovedFromHasherThrows) {
  ContentHasher source;
  source.update(bytes_of("abc"));
  ContentHasher target(std::move(source));

  EXPECT_EQ(target.hex_digest(), "900150983cd24fb0d6963f7d28e17f72");
  EXPECT_THROW(source.hex_digest(), DigestError);
  EXPECT_THROW(source.update(bytes_of("x")), CryptoError);
}
