#ifndef STREAMKIT_STREAMS_BUFFERED_STREAM_HPP
#define STREAMKIT_STREAMS_BUFFERED_STREAM_HPP

#include <cstddef>
#include <ostream>
#include <streambuf>
#include <vector>
#include "streams/stream_config.hpp"
#include "streams/stream_error.hpp"

namespace streamkit::streams {

// Accumulates writes in memory and hands them to the sink in chunks of
// up to `capacity` bytes. Writes of at least `capacity` bytes go to the
// sink directly once pending bytes are drained.
class BufferedStreambuf : public std::streambuf {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit BufferedStreambuf(std::ostream& sink, std::size_t capacity = BUFFER_SIZE);
  ~BufferedStreambuf() override;

  BufferedStreambuf(const BufferedStreambuf&) = delete;
  BufferedStreambuf& operator=(const BufferedStreambuf&) = delete;


  // ---- GETTERS ----
  std::size_t capacity() const { return buffer_.size(); }
  std::size_t pending() const { return static_cast<std::size_t>(pptr() - pbase()); }
  std::size_t bytes_forwarded() const { return bytes_forwarded_; }
  std::size_t sink_writes() const { return sink_writes_; }

protected:
  int_type overflow(int_type ch) override;
  std::streamsize xsputn(const char* data, std::streamsize count) override;
  int sync() override;

private:
  // ---- PARAMETERS ----
  std::ostream& sink_;
  std::vector<char> buffer_;
  std::size_t bytes_forwarded_{0};
  std::size_t sink_writes_{0};


  // Moves pending bytes to the sink and resets the put area
  bool drain();
  // Single write to the sink
  bool forward(const char* data, std::size_t length);
};

// Output stream decorator adding a write buffer in front of a raw sink
class BufferedStream : public std::ostream {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit BufferedStream(std::ostream& sink, std::size_t capacity = BUFFER_SIZE);
  ~BufferedStream() override = default;


  // ---- CONTROL ----
  // Pushes buffered bytes through to the sink and flushes it.
  // Sets badbit and throws IOError if the sink rejects them.
  void flush();


  // ---- GETTERS ----
  std::size_t capacity() const { return buffer_.capacity(); }
  std::size_t pending() const { return buffer_.pending(); }
  std::size_t bytes_forwarded() const { return buffer_.bytes_forwarded(); }
  std::size_t sink_writes() const { return buffer_.sink_writes(); }

private:
  BufferedStreambuf buffer_;
};

} // namespace streamkit::streams

#endif // STREAMKIT_STREAMS_BUFFERED_STREAM_HPP
