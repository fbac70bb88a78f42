#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <openssl/err.h>
#include <sstream>
#include <string>
#include "streams/decompress.hpp"
#include "streams/hash.hpp"
#include "streams/stream_config.hpp"
#include "test_utils.hpp"

using namespace streamkit::streams;
using ::testing::HasSubstr;
using ::testing::MatchesRegex;

class HashTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_test_logging();
  }

  static std::string hash_of(const std::string& data, const std::string& algorithm) {
    std::istringstream input(data);
    return calculate_hash(input, algorithm);
  }
};

TEST_F(HashTest, Md5KnownVectors) {
  EXPECT_EQ(hash_of("", "MD5"), "D41D8CD98F00B204E9800998ECF8427E");
  EXPECT_EQ(hash_of("abc", "MD5"), "900150983CD24FB0D6963F7D28E17F72");
  EXPECT_EQ(hash_of("The quick brown fox jumps over the lazy dog", "MD5"),
            "9E107D9D372BB6826BD81D3542A419D6");
}

TEST_F(HashTest, Sha1KnownVectors) {
  EXPECT_EQ(hash_of("", "SHA1"), "DA39A3EE5E6B4B0D3255BFEF95601890AFD80709");
  EXPECT_EQ(hash_of("abc", "SHA1"), "A9993E364706816ABA3E25717850C26C9CD0D89D");
}

TEST_F(HashTest, Sha256KnownVectors) {
  EXPECT_EQ(hash_of("", "SHA256"),
            "E3B0C44298FC1C149AFBF4C8996FB92427AE41E4649B934CA495991B7852B855");
  EXPECT_EQ(hash_of("abc", "SHA256"),
            "BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD");
}

TEST_F(HashTest, AlgorithmNameAliases) {
  const std::string expected = hash_of("abc", "SHA256");
  EXPECT_EQ(hash_of("abc", "SHA-256"), expected);
  EXPECT_EQ(hash_of("abc", "sha256"), expected);
}

TEST_F(HashTest, OutputIsUppercaseHex) {
  EXPECT_THAT(hash_of("some data", "SHA512"), MatchesRegex("[0-9A-F]{128}"));
}

TEST_F(HashTest, LargeInputMatchesChunkedEngine) {
  const std::string data = make_binary_content(5 * BUFFER_SIZE + 3);

  DigestEngine engine("SHA256");
  engine.update(data.data(), 100);
  engine.update(data.data() + 100, data.size() - 100);

  EXPECT_EQ(hash_of(data, "SHA256"), to_hex(engine.finish()));
}

TEST_F(HashTest, HashesOnlyRemainingContent) {
  std::istringstream input("skipABC");
  input.ignore(4);
  EXPECT_EQ(calculate_hash(input, "MD5"), hash_of("ABC", "MD5"));
}

TEST_F(HashTest, StreamIsLeftUsable) {
  std::stringstream stream("abc");
  calculate_hash(stream, "MD5");

  // Consumed to the end but still open for the caller
  EXPECT_TRUE(stream.eof());
  stream.clear();
  stream.seekg(0);
  EXPECT_EQ(calculate_hash(stream, "MD5"), "900150983CD24FB0D6963F7D28E17F72");
}

TEST_F(HashTest, UnknownAlgorithmRejected) {
  std::istringstream input("abc");
  try {
    calculate_hash(input, "NOT-A-HASH");
    FAIL() << "Expected InvalidArgumentError";
  } catch (const InvalidArgumentError& e) {
    EXPECT_EQ(e.param_name(), "algorithm_name");
    EXPECT_THAT(e.what(), HasSubstr("NOT-A-HASH"));
  }
}

TEST_F(HashTest, UnknownAlgorithmLeavesNoOpenSslErrors) {
  ERR_clear_error();
  EXPECT_THROW(DigestEngine("NOT-A-HASH"), InvalidArgumentError);
  EXPECT_EQ(ERR_peek_error(), 0ul);
}

TEST_F(HashTest, BlankAlgorithmRejected) {
  std::istringstream input("abc");
  EXPECT_THROW(calculate_hash(input, ""), InvalidArgumentError);
  EXPECT_THROW(calculate_hash(input, "  "), InvalidArgumentError);
}

TEST_F(HashTest, BadStreamRejected) {
  std::istringstream input("abc");
  input.setstate(std::ios::badbit);
  EXPECT_THROW(calculate_hash(input, "MD5"), IOError);
}

TEST_F(HashTest, EngineCannotBeReused) {
  DigestEngine engine("MD5");
  EXPECT_EQ(engine.digest_size(), 16u);
  EXPECT_EQ(to_hex(engine.finish()), "D41D8CD98F00B204E9800998ECF8427E");
  EXPECT_THROW(engine.finish(), StreamError);
  EXPECT_THROW(engine.update("x", 1), StreamError);
}

class HashFileTest : public TempDirTest {};

TEST_F(HashFileTest, HashOfDecompressedStream) {
  const std::string original = "content to be compressed and hashed";
  auto path = write_file("data.gz", gzip_bytes(original));

  auto stream = decompress_stream(path, DecompressionMethod::Gzip);
  EXPECT_EQ(calculate_hash(*stream, "MD5"), [&] {
    std::istringstream input(original);
    return calculate_hash(input, "MD5");
  }());
}
