#include "streams/inflate_stream.hpp"
#include <zlib.h>
#include <cstring>
#include <string>
#include <boost/log/trivial.hpp>

namespace streamkit::streams {

//=================================================
// RAII WRAPPER TO MANAGE ZLIB STREAM LIFECYCLE
//=================================================

struct InflateContext {
  z_stream strm{};

  explicit InflateContext(int window_bits) {
    if (inflateInit2(&strm, window_bits) != Z_OK) {
      throw DecompressionError("Failed to initialize zlib inflater");
    }
  }

  ~InflateContext() {
    inflateEnd(&strm);
  }

  z_stream* get() { return &strm; }
};

namespace {

constexpr unsigned char GZIP_MAGIC_FIRST = 0x1f;
constexpr unsigned char GZIP_MAGIC_SECOND = 0x8b;

int window_bits_for(InflateFormat format) {
  // Negative bits select raw deflate, +16 selects the gzip wrapper
  return format == InflateFormat::Gzip ? 15 + 16 : -15;
}

const char* format_name(InflateFormat format) {
  return format == InflateFormat::Gzip ? "gzip" : "deflate";
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

InflateStreambuf::InflateStreambuf(std::unique_ptr<std::istream> source, InflateFormat format)
  : source_(std::move(source))
  , format_(format)
  , in_buffer_(BUFFER_SIZE)
  , out_buffer_(BUFFER_SIZE) {
  if (!source_ || !source_->good()) {
    throw IOError("Inflate stream: Invalid source stream");
  }

  context_ = std::make_unique<InflateContext>(window_bits_for(format_));
  setg(out_buffer_.data(), out_buffer_.data(), out_buffer_.data());
  BOOST_LOG_TRIVIAL(debug) << "Inflate stream: Initialized " << format_name(format_) << " decoder";
}

InflateStreambuf::~InflateStreambuf() {
  BOOST_LOG_TRIVIAL(debug) << "Inflate stream: Closing after " << compressed_bytes_
                           << " compressed / " << decompressed_bytes_ << " decompressed bytes";
}


//==============================================
// INFLATION
//==============================================

InflateStreambuf::int_type InflateStreambuf::underflow() {
  if (gptr() < egptr()) {
    return traits_type::to_int_type(*gptr());
  }

  z_stream* strm = context_->get();

  while (!finished_) {
    if (strm->avail_in == 0 && !refill()) {
      // An empty source is an empty stream, anything else ended mid-stream
      if (compressed_bytes_ == 0) {
        finished_ = true;
        break;
      }
      BOOST_LOG_TRIVIAL(error) << "Inflate stream: Compressed " << format_name(format_)
                               << " data ended unexpectedly";
      throw DecompressionError("Unexpected end of compressed stream");
    }

    strm->next_out = reinterpret_cast<Bytef*>(out_buffer_.data());
    strm->avail_out = static_cast<uInt>(out_buffer_.size());

    int code = inflate(strm, Z_NO_FLUSH);
    if (code == Z_NEED_DICT || code == Z_DATA_ERROR || code == Z_MEM_ERROR || code == Z_STREAM_ERROR) {
      std::string reason = strm->msg ? strm->msg : "zlib error " + std::to_string(code);
      BOOST_LOG_TRIVIAL(error) << "Inflate stream: Failed to inflate " << format_name(format_)
                               << " data: " << reason;
      throw DecompressionError(reason);
    }

    const std::size_t produced = out_buffer_.size() - strm->avail_out;
    decompressed_bytes_ += produced;

    if (code == Z_STREAM_END && !start_next_member()) {
      finished_ = true;
    }

    if (produced > 0) {
      BOOST_LOG_TRIVIAL(trace) << "Inflate stream: Inflated " << produced << " bytes";
      setg(out_buffer_.data(), out_buffer_.data(), out_buffer_.data() + produced);
      return traits_type::to_int_type(*gptr());
    }
  }

  return traits_type::eof();
}

bool InflateStreambuf::refill() {
  z_stream* strm = context_->get();

  // Unconsumed input moves to the front of the buffer
  const std::size_t pending = strm->avail_in;
  if (pending > 0 && strm->next_in != reinterpret_cast<Bytef*>(in_buffer_.data())) {
    std::memmove(in_buffer_.data(), strm->next_in, pending);
  }
  strm->next_in = reinterpret_cast<Bytef*>(in_buffer_.data());

  source_->read(in_buffer_.data() + pending, static_cast<std::streamsize>(in_buffer_.size() - pending));
  const auto bytes_read = source_->gcount();

  if (source_->bad()) {
    BOOST_LOG_TRIVIAL(error) << "Inflate stream: Failed to read compressed source";
    throw IOError("Inflate stream: Failed to read compressed source");
  }

  if (bytes_read <= 0) {
    return false;
  }

  strm->avail_in = static_cast<uInt>(pending + static_cast<std::size_t>(bytes_read));
  compressed_bytes_ += static_cast<std::size_t>(bytes_read);
  return true;
}

bool InflateStreambuf::start_next_member() {
  if (format_ != InflateFormat::Gzip) {
    return false;
  }

  z_stream* strm = context_->get();
  // A member header may straddle the end of the current chunk
  if (strm->avail_in < 2 && !refill() && strm->avail_in == 0) {
    return false;
  }

  // Bytes after the last member that are not a gzip header are ignored
  if (strm->avail_in < 2 || strm->next_in[0] != GZIP_MAGIC_FIRST || strm->next_in[1] != GZIP_MAGIC_SECOND) {
    BOOST_LOG_TRIVIAL(debug) << "Inflate stream: Ignoring " << strm->avail_in
                             << " trailing bytes after gzip member";
    return false;
  }

  BOOST_LOG_TRIVIAL(debug) << "Inflate stream: Starting next gzip member";
  if (inflateReset(strm) != Z_OK) {
    throw DecompressionError("Failed to reset zlib inflater");
  }
  return true;
}


//==============================================
// INFLATE STREAM
//==============================================

InflateStream::InflateStream(std::unique_ptr<std::istream> source, InflateFormat format)
  : std::istream(nullptr)
  , buffer_(std::move(source), format) {
  rdbuf(&buffer_);
  exceptions(std::ios::badbit);
}

} // namespace streamkit::streams
