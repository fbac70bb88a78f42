#ifndef STREAMKIT_STREAMS_DECOMPRESS_HPP
#define STREAMKIT_STREAMS_DECOMPRESS_HPP

#include <istream>
#include <memory>
#include <string>
#include "streams/stream_error.hpp"

namespace streamkit::streams {

enum class DecompressionMethod {
  None,
  Deflate,
  Gzip
};

const char* to_string(DecompressionMethod method);

// Opens `source_path` and wraps it in the decoder selected by `method`.
// None returns the raw binary file stream. The caller owns the returned
// stream, the file closes when it is destroyed.
//
// Throws InvalidArgumentError for a blank path, FileNotFoundError for a
// missing file. Decoding errors surface later, from reads on the stream.
std::unique_ptr<std::istream> decompress_stream(const std::string& source_path, DecompressionMethod method);

} // namespace streamkit::streams

#endif // STREAMKIT_STREAMS_DECOMPRESS_HPP
