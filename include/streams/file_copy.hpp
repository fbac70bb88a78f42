#ifndef STREAMKIT_STREAMS_FILE_COPY_HPP
#define STREAMKIT_STREAMS_FILE_COPY_HPP

#include <cstddef>
#include <string>
#include "streams/stream_error.hpp"

namespace streamkit::streams {

// All copies create the destination if absent and truncate it otherwise.
// They throw InvalidArgumentError for a blank source or destination path,
// FileNotFoundError for a missing source and IOError when the file system
// refuses a read or write.

// ---- BYTE AND BLOCK COPY ----
// Copies one byte at a time, returns the destination size after the copy
std::size_t byte_copy(const std::string& source_path, const std::string& destination_path);
// Reads the whole source into one buffer and writes it in one call, returns bytes read
std::size_t block_copy(const std::string& source_path, const std::string& destination_path);
// As block_copy, with the write going through a BufferedStream over an unbuffered file
std::size_t buffered_block_copy(const std::string& source_path, const std::string& destination_path);


// ---- TEXT COPY ----
// Copies line by line. "\n" and "\r\n" end a line in the source, lines are
// joined with LINE_SEPARATOR in the destination and the last line gets no
// separator. A source ending on a separator has a final empty line, which
// is counted. An empty source has no lines.
std::size_t line_copy(const std::string& source_path, const std::string& destination_path);

} // namespace streamkit::streams

#endif // STREAMKIT_STREAMS_FILE_COPY_HPP
