#include "streams/decompress.hpp"
#include <fstream>
#include <boost/log/trivial.hpp>
#include "streams/inflate_stream.hpp"
#include "streams/validation.hpp"

namespace streamkit::streams {

const char* to_string(DecompressionMethod method) {
  switch (method) {
    case DecompressionMethod::None:    return "none";
    case DecompressionMethod::Deflate: return "deflate";
    case DecompressionMethod::Gzip:    return "gzip";
    default:                           return "unknown";
  }
}

std::unique_ptr<std::istream> decompress_stream(const std::string& source_path, DecompressionMethod method) {
  validate_input(source_path);
  BOOST_LOG_TRIVIAL(info) << "Decompress: Opening " << source_path << " with method " << to_string(method);

  auto source = std::make_unique<std::ifstream>(source_path, std::ios::binary);
  if (!source->is_open()) {
    BOOST_LOG_TRIVIAL(error) << "Decompress: Failed to open source file: " << source_path;
    throw IOError("Failed to open source file: " + source_path);
  }

  switch (method) {
    case DecompressionMethod::None:
      return source;
    case DecompressionMethod::Deflate:
      return std::make_unique<InflateStream>(std::move(source), InflateFormat::RawDeflate);
    case DecompressionMethod::Gzip:
      return std::make_unique<InflateStream>(std::move(source), InflateFormat::Gzip);
  }

  BOOST_LOG_TRIVIAL(error) << "Decompress: Unknown decompression method: " << static_cast<int>(method);
  throw InvalidArgumentError("Unknown decompression method.", "method");
}

} // namespace streamkit::streams
