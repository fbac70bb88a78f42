#include <gtest/gtest.h>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include "streams/decompress.hpp"
#include "streams/inflate_stream.hpp"
#include "streams/stream_config.hpp"
#include "test_utils.hpp"

using namespace streamkit::streams;

class DecompressTest : public TempDirTest {
protected:
  static std::string read_stream(std::istream& stream) {
    return std::string(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
  }

  // Reads with read() so stream exceptions are not absorbed by iterators
  static std::string read_chunks(std::istream& stream) {
    std::string result;
    char buffer[512];
    while (stream.read(buffer, sizeof(buffer)) || stream.gcount() > 0) {
      result.append(buffer, static_cast<std::size_t>(stream.gcount()));
    }
    return result;
  }

  const std::string sample = "The quick brown fox jumps over the lazy dog.\n";
};

TEST_F(DecompressTest, NoneReturnsRawBytes) {
  auto raw = make_binary_content(2000);
  auto path = write_file("raw.bin", raw);

  auto stream = decompress_stream(path, DecompressionMethod::None);
  ASSERT_NE(stream, nullptr);
  EXPECT_EQ(read_chunks(*stream), raw);
}

TEST_F(DecompressTest, NoneDoesNotDecodeGzip) {
  auto compressed = gzip_bytes(sample);
  auto path = write_file("data.gz", compressed);

  auto stream = decompress_stream(path, DecompressionMethod::None);
  EXPECT_EQ(read_chunks(*stream), compressed);
}

TEST_F(DecompressTest, GzipDecoded) {
  auto path = write_file("data.gz", gzip_bytes(sample));
  auto stream = decompress_stream(path, DecompressionMethod::Gzip);
  EXPECT_EQ(read_chunks(*stream), sample);
}

TEST_F(DecompressTest, DeflateDecoded) {
  auto path = write_file("data.deflate", deflate_bytes(sample));
  auto stream = decompress_stream(path, DecompressionMethod::Deflate);
  EXPECT_EQ(read_chunks(*stream), sample);
}

TEST_F(DecompressTest, LargeContentSpansManyChunks) {
  auto original = make_binary_content(10 * BUFFER_SIZE + 77);
  auto path = write_file("large.gz", gzip_bytes(original));

  auto stream = decompress_stream(path, DecompressionMethod::Gzip);
  EXPECT_EQ(read_stream(*stream), original);
}

TEST_F(DecompressTest, ConcatenatedGzipMembers) {
  auto path = write_file("multi.gz", gzip_bytes("first part, ") + gzip_bytes("second part"));
  auto stream = decompress_stream(path, DecompressionMethod::Gzip);
  EXPECT_EQ(read_chunks(*stream), "first part, second part");
}

TEST_F(DecompressTest, TrailingDataAfterGzipMemberIgnored) {
  for (const std::string trailer : {std::string("junk"), std::string("\x1fjunk"), std::string("\x1f")}) {
    auto path = write_file("trailer.gz", gzip_bytes(sample) + trailer);
    auto stream = decompress_stream(path, DecompressionMethod::Gzip);
    EXPECT_EQ(read_chunks(*stream), sample) << trailer.size() << " trailing bytes";
  }
}

TEST_F(DecompressTest, EmptyFileIsEmptyStream) {
  auto path = write_file("empty.gz", "");
  auto stream = decompress_stream(path, DecompressionMethod::Gzip);
  EXPECT_EQ(read_chunks(*stream), "");
}

TEST_F(DecompressTest, CorruptDataThrows) {
  auto path = write_file("corrupt.gz", "this is definitely not gzip data");
  auto stream = decompress_stream(path, DecompressionMethod::Gzip);
  EXPECT_THROW(read_chunks(*stream), DecompressionError);
}

TEST_F(DecompressTest, TruncatedDataThrows) {
  auto compressed = gzip_bytes(make_binary_content(4096));
  auto path = write_file("truncated.gz", compressed.substr(0, compressed.size() / 2));
  auto stream = decompress_stream(path, DecompressionMethod::Gzip);
  EXPECT_THROW(read_chunks(*stream), DecompressionError);
}

TEST_F(DecompressTest, WrongMethodThrows) {
  // A gzip header is not valid raw deflate
  auto path = write_file("data.gz", gzip_bytes(sample));
  auto stream = decompress_stream(path, DecompressionMethod::Deflate);
  EXPECT_THROW(read_chunks(*stream), DecompressionError);
}

TEST_F(DecompressTest, InvalidPathsRejected) {
  EXPECT_THROW(decompress_stream("", DecompressionMethod::Gzip), InvalidArgumentError);
  EXPECT_THROW(decompress_stream("   ", DecompressionMethod::None), InvalidArgumentError);
  EXPECT_THROW(decompress_stream(path_for("missing.gz"), DecompressionMethod::Deflate), FileNotFoundError);
}

TEST_F(DecompressTest, InflateStreamOverMemorySource) {
  auto source = std::make_unique<std::istringstream>(deflate_bytes(sample));
  InflateStream stream(std::move(source), InflateFormat::RawDeflate);

  EXPECT_EQ(read_chunks(stream), sample);
  EXPECT_EQ(stream.buffer().format(), InflateFormat::RawDeflate);
  EXPECT_EQ(stream.buffer().decompressed_bytes(), sample.size());
  EXPECT_GT(stream.buffer().compressed_bytes(), 0u);
}

TEST(DecompressionMethodTest, Names) {
  EXPECT_STREQ(to_string(DecompressionMethod::None), "none");
  EXPECT_STREQ(to_string(DecompressionMethod::Deflate), "deflate");
  EXPECT_STREQ(to_string(DecompressionMethod::Gzip), "gzip");
}
