#ifndef STREAMKIT_STREAMS_STREAM_CONFIG_HPP
#define STREAMKIT_STREAMS_STREAM_CONFIG_HPP

#include <cstddef>

namespace streamkit::streams {

// Chunk size for hashing and inflating, and the default buffered write capacity
inline constexpr std::size_t BUFFER_SIZE = 8192;

// Written between lines by line_copy
inline constexpr char LINE_SEPARATOR = '\n';

} // namespace streamkit::streams

#endif // STREAMKIT_STREAMS_STREAM_CONFIG_HPP
