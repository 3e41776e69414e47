#include <gtest/gtest.h>
#include "ethstorage/crypto/hash.hpp"
#include "fakes.hpp"

using namespace ethstorage;
using namespace ethstorage::crypto;

class HashTest : public ::testing::Test {
protected:
  void SetUp() override {
    test::quiet_logging();
  }
};

TEST_F(HashTest, Sha256KnownVectors) {
  EXPECT_EQ(to_hex(sha256(Bytes{})),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(to_hex(sha256(test::to_bytes("abc"))),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(HashTest, Keccak256KnownVectors) {
  EXPECT_EQ(to_hex(keccak256(std::string())),
            "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
  EXPECT_EQ(to_hex(keccak256(std::string("abc"))),
            "4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45");
}

TEST_F(HashTest, Keccak256OverloadsAgree) {
  Bytes data = test::make_content(1000);
  EXPECT_EQ(keccak256(data), keccak256(data.data(), data.size()));
  EXPECT_EQ(keccak256(std::string("hello")), keccak256(test::to_bytes("hello")));
}

// Inputs spanning several 136-byte rate blocks
TEST_F(HashTest, Keccak256MultiBlockDiffersPerLength) {
  Bytes a = test::make_content(136);
  Bytes b = test::make_content(137);
  EXPECT_NE(keccak256(a), keccak256(b));
  EXPECT_EQ(keccak256(a), keccak256(a));
}

TEST_F(HashTest, HexRoundTripAcceptsPrefix) {
  Bytes bytes{0x00, 0x01, 0xab, 0xff};
  EXPECT_EQ(to_hex(bytes), "0001abff");
  EXPECT_EQ(from_hex("0x0001abff"), bytes);
  EXPECT_EQ(from_hex("0001ABFF"), bytes);
}

TEST_F(HashTest, FromHexRejectsMalformedInput) {
  EXPECT_THROW(from_hex("abc"), HashError);
  EXPECT_THROW(from_hex("zz"), HashError);
}

TEST_F(HashTest, HashFromHexRequires32Bytes) {
  std::string hex(64, 'a');
  Hash32 hash = hash_from_hex(hex);
  EXPECT_EQ(hash[0], 0xaa);
  EXPECT_THROW(hash_from_hex("0xabcd"), HashError);
}
