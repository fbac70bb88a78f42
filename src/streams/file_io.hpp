#ifndef STREAMKIT_STREAMS_FILE_IO_HPP
#define STREAMKIT_STREAMS_FILE_IO_HPP

#include <cstddef>
#include <fstream>
#include <string>
#include <vector>

namespace streamkit::streams::detail {

// Opens an existing file for binary reading, throws IOError on failure
std::ifstream open_source(const std::string& path);

// Creates or truncates a file for binary writing, throws IOError on failure.
// An unbuffered destination hands every write straight to the file.
std::ofstream open_destination(const std::string& path, bool unbuffered = false);

// Reads the whole remaining content of a file opened with open_source
std::vector<char> read_all(std::ifstream& source, const std::string& path);

// Writes a block and verifies the stream accepted it
void write_block(std::ostream& output, const char* data, std::size_t length, const std::string& path);

// Closes a destination file and verifies pending bytes reached it
void close_destination(std::ofstream& destination, const std::string& path);

} // namespace streamkit::streams::detail

#endif // STREAMKIT_STREAMS_FILE_IO_HPP
