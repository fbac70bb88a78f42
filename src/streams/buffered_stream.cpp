#include "streams/buffered_stream.hpp"
#include <cstring>
#include <boost/log/trivial.hpp>
#include "streams/stream_error.hpp"

namespace streamkit::streams {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

BufferedStreambuf::BufferedStreambuf(std::ostream& sink, std::size_t capacity)
  : sink_(sink) {
  if (capacity == 0) {
    BOOST_LOG_TRIVIAL(error) << "Buffered stream: Buffer capacity must be greater than zero";
    throw InvalidArgumentError("capacity must be greater than zero.", "capacity");
  }

  buffer_.resize(capacity);
  setp(buffer_.data(), buffer_.data() + buffer_.size());
  BOOST_LOG_TRIVIAL(debug) << "Buffered stream: Created write buffer of " << capacity << " bytes";
}

BufferedStreambuf::~BufferedStreambuf() {
  if (!drain()) {
    BOOST_LOG_TRIVIAL(error) << "Buffered stream: Lost " << pending()
                             << " buffered bytes, sink rejected the final write";
  }
}


//==============================================
// STREAMBUF OVERRIDES
//==============================================

BufferedStreambuf::int_type BufferedStreambuf::overflow(int_type ch) {
  if (!drain()) {
    return traits_type::eof();
  }

  if (!traits_type::eq_int_type(ch, traits_type::eof())) {
    *pptr() = traits_type::to_char_type(ch);
    pbump(1);
  }
  return traits_type::not_eof(ch);
}

std::streamsize BufferedStreambuf::xsputn(const char* data, std::streamsize count) {
  if (count <= 0) {
    return 0;
  }

  const auto length = static_cast<std::size_t>(count);

  // Large writes skip the buffer
  if (length >= buffer_.size()) {
    if (!drain() || !forward(data, length)) {
      return 0;
    }
    return count;
  }

  if (length > static_cast<std::size_t>(epptr() - pptr()) && !drain()) {
    return 0;
  }

  std::memcpy(pptr(), data, length);
  pbump(static_cast<int>(length));
  BOOST_LOG_TRIVIAL(trace) << "Buffered stream: Buffered " << length << " bytes ("
                           << pending() << " pending)";
  return count;
}

int BufferedStreambuf::sync() {
  if (!drain()) {
    return -1;
  }
  return sink_.flush().good() ? 0 : -1;
}


//==============================================
// SINK FORWARDING
//==============================================

bool BufferedStreambuf::drain() {
  const std::size_t length = pending();
  if (length == 0) {
    return true;
  }

  if (!forward(pbase(), length)) {
    return false;
  }

  setp(buffer_.data(), buffer_.data() + buffer_.size());
  return true;
}

bool BufferedStreambuf::forward(const char* data, std::size_t length) {
  sink_.write(data, static_cast<std::streamsize>(length));
  if (!sink_.good()) {
    BOOST_LOG_TRIVIAL(error) << "Buffered stream: Sink rejected write of " << length << " bytes";
    return false;
  }

  bytes_forwarded_ += length;
  ++sink_writes_;
  BOOST_LOG_TRIVIAL(trace) << "Buffered stream: Forwarded " << length << " bytes to sink";
  return true;
}


//==============================================
// BUFFERED STREAM
//==============================================

BufferedStream::BufferedStream(std::ostream& sink, std::size_t capacity)
  : std::ostream(nullptr)
  , buffer_(sink, capacity) {
  rdbuf(&buffer_);
}

void BufferedStream::flush() {
  if (buffer_.pubsync() == -1) {
    setstate(std::ios::badbit);
    throw IOError("Buffered stream: Failed to flush to sink");
  }
}

} // namespace streamkit::streams
