#ifndef STREAMKIT_STREAMS_TEXT_READER_HPP
#define STREAMKIT_STREAMS_TEXT_READER_HPP

#include <string>
#include "streams/stream_error.hpp"

namespace streamkit::streams {

// Reads a file written in `encoding_name` (any charset name Boost.Locale
// resolves, e.g. "windows-1251", "koi8-r", "utf-16") and returns its content
// as UTF-8. A leading byte order mark is dropped, bytes invalid in the
// source encoding are skipped.
//
// Throws InvalidArgumentError for a blank path, a blank encoding name or an
// unsupported encoding, FileNotFoundError for a missing file.
std::string read_encoded_text(const std::string& source_path, const std::string& encoding_name);

// True if `encoding_name` names a charset the converter can decode
bool is_supported_encoding(const std::string& encoding_name);

} // namespace streamkit::streams

#endif // STREAMKIT_STREAMS_TEXT_READER_HPP
