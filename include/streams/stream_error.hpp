#ifndef STREAMKIT_STREAMS_STREAM_ERROR_HPP
#define STREAMKIT_STREAMS_STREAM_ERROR_HPP

#include <stdexcept>
#include <string>

namespace streamkit::streams {

class StreamError : public std::runtime_error {
public:
  explicit StreamError(const std::string& message)
    : std::runtime_error(message) {}
};

// Blank path, blank or unsupported encoding/algorithm name
class InvalidArgumentError : public StreamError {
public:
  InvalidArgumentError(const std::string& message, const std::string& param_name)
    : StreamError(message)
    , param_name_(param_name) {}

  const std::string& param_name() const { return param_name_; }

private:
  std::string param_name_;
};

class FileNotFoundError : public StreamError {
public:
  explicit FileNotFoundError(const std::string& path)
    : StreamError("File '" + path + "' not found. Parameter name: source_path.")
    , path_(path) {}

  const std::string& path() const { return path_; }

private:
  std::string path_;
};

class IOError : public StreamError {
public:
  explicit IOError(const std::string& message)
    : StreamError("I/O error: " + message) {}
};

class DecompressionError : public StreamError {
public:
  explicit DecompressionError(const std::string& message)
    : StreamError("Decompression error: " + message) {}
};

} // namespace streamkit::streams

#endif // STREAMKIT_STREAMS_STREAM_ERROR_HPP
