#include "file_io.hpp"
#include <filesystem>
#include <system_error>
#include <boost/log/trivial.hpp>
#include "streams/stream_error.hpp"

namespace streamkit::streams::detail {

std::ifstream open_source(const std::string& path) {
  std::ifstream source(path, std::ios::binary);
  if (!source.is_open()) {
    BOOST_LOG_TRIVIAL(error) << "File I/O: Failed to open source file: " << path;
    throw IOError("Failed to open source file: " + path);
  }
  return source;
}

std::ofstream open_destination(const std::string& path, bool unbuffered) {
  std::ofstream destination;
  if (unbuffered) {
    // Must happen before open() to take effect
    destination.rdbuf()->pubsetbuf(nullptr, 0);
  }

  destination.open(path, std::ios::binary | std::ios::trunc);
  if (!destination.is_open()) {
    BOOST_LOG_TRIVIAL(error) << "File I/O: Failed to open destination file: " << path;
    throw IOError("Failed to open destination file: " + path);
  }
  return destination;
}

std::vector<char> read_all(std::ifstream& source, const std::string& path) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "File I/O: Failed to get size of " << path << ": " << ec.message();
    throw IOError("Failed to read source file: " + path);
  }
  const auto length = static_cast<std::size_t>(size);
  BOOST_LOG_TRIVIAL(debug) << "File I/O: Reading " << length << " bytes from " << path;

  std::vector<char> buffer(length);
  if (length == 0) {
    return buffer;
  }

  source.read(buffer.data(), static_cast<std::streamsize>(length));
  const auto bytes_read = static_cast<std::size_t>(source.gcount());

  if (source.bad() || bytes_read != length) {
    BOOST_LOG_TRIVIAL(error) << "File I/O: Short read from " << path << ": "
                             << bytes_read << " of " << length << " bytes";
    throw IOError("Failed to read source file: " + path);
  }
  return buffer;
}

void write_block(std::ostream& output, const char* data, std::size_t length, const std::string& path) {
  if (length == 0) {
    return;
  }

  output.write(data, static_cast<std::streamsize>(length));
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "File I/O: Failed to write " << length << " bytes to " << path;
    throw IOError("Failed to write destination file: " + path);
  }
}

void close_destination(std::ofstream& destination, const std::string& path) {
  destination.close();
  if (destination.fail()) {
    BOOST_LOG_TRIVIAL(error) << "File I/O: Failed to close destination file: " << path;
    throw IOError("Failed to close destination file: " + path);
  }
}

} // namespace streamkit::streams::detail
