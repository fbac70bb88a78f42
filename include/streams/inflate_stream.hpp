#ifndef STREAMKIT_STREAMS_INFLATE_STREAM_HPP
#define STREAMKIT_STREAMS_INFLATE_STREAM_HPP

#include <cstddef>
#include <istream>
#include <memory>
#include <streambuf>
#include <vector>
#include "streams/stream_config.hpp"
#include "streams/stream_error.hpp"

namespace streamkit::streams {

// Forward declaration for zlib stream state
struct InflateContext;

enum class InflateFormat {
  RawDeflate,  // RFC 1951, no header
  Gzip         // RFC 1952, concatenated members are decoded in sequence
};

// Read-side streambuf that inflates bytes pulled from an owned source stream
class InflateStreambuf : public std::streambuf {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  InflateStreambuf(std::unique_ptr<std::istream> source, InflateFormat format);
  ~InflateStreambuf() override;

  InflateStreambuf(const InflateStreambuf&) = delete;
  InflateStreambuf& operator=(const InflateStreambuf&) = delete;


  // ---- GETTERS ----
  InflateFormat format() const { return format_; }
  std::size_t compressed_bytes() const { return compressed_bytes_; }
  std::size_t decompressed_bytes() const { return decompressed_bytes_; }

protected:
  int_type underflow() override;

private:
  // ---- PARAMETERS ----
  std::unique_ptr<std::istream> source_;
  std::unique_ptr<InflateContext> context_;
  InflateFormat format_;
  std::vector<char> in_buffer_;
  std::vector<char> out_buffer_;
  std::size_t compressed_bytes_{0};
  std::size_t decompressed_bytes_{0};
  bool finished_{false};


  // ---- INFLATION ----
  // Pulls the next chunk of compressed input behind any unconsumed bytes,
  // false once the source is exhausted
  bool refill();
  // Called at the end of a compressed stream. Restarts the inflater if
  // another gzip member follows, otherwise reports the end.
  bool start_next_member();
};

// Input stream yielding the decompressed content of `source`.
// Corrupt or truncated input throws DecompressionError from the read that
// meets it (badbit exceptions are enabled).
class InflateStream : public std::istream {
public:
  InflateStream(std::unique_ptr<std::istream> source, InflateFormat format);
  ~InflateStream() override = default;

  const InflateStreambuf& buffer() const { return buffer_; }

private:
  InflateStreambuf buffer_;
};

} // namespace streamkit::streams

#endif // STREAMKIT_STREAMS_INFLATE_STREAM_HPP
