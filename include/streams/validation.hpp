#ifndef STREAMKIT_STREAMS_VALIDATION_HPP
#define STREAMKIT_STREAMS_VALIDATION_HPP

#include <string>
#include "streams/stream_error.hpp"

namespace streamkit::streams {

// True for empty strings and strings made only of whitespace
bool is_blank(const std::string& value);

// Checks that source path is not blank and names an existing file.
// Throws InvalidArgumentError or FileNotFoundError.
void validate_input(const std::string& source_path);

// Same as above, then checks that destination path is not blank.
// The destination does not have to exist.
void validate_input(const std::string& source_path, const std::string& destination_path);

} // namespace streamkit::streams

#endif // STREAMKIT_STREAMS_VALIDATION_HPP
