#include "streams/file_copy.hpp"
#include <filesystem>
#include <fstream>
#include <boost/log/trivial.hpp>
#include "streams/buffered_stream.hpp"
#include "streams/stream_config.hpp"
#include "streams/validation.hpp"
#include "file_io.hpp"

namespace streamkit::streams {

//==============================================
// BYTE AND BLOCK COPY
//==============================================

std::size_t byte_copy(const std::string& source_path, const std::string& destination_path) {
  validate_input(source_path, destination_path);
  BOOST_LOG_TRIVIAL(info) << "Stream copy: Byte copy from " << source_path << " to " << destination_path;

  {
    std::ifstream source = detail::open_source(source_path);
    std::ofstream destination = detail::open_destination(destination_path);

    char byte;
    while (source.get(byte)) {
      if (!destination.put(byte)) {
        BOOST_LOG_TRIVIAL(error) << "Stream copy: Failed to write byte to " << destination_path;
        throw IOError("Failed to write destination file: " + destination_path);
      }
    }

    if (source.bad()) {
      BOOST_LOG_TRIVIAL(error) << "Stream copy: Failed to read from " << source_path;
      throw IOError("Failed to read source file: " + source_path);
    }

    detail::close_destination(destination, destination_path);
  }

  const auto bytes_written = static_cast<std::size_t>(std::filesystem::file_size(destination_path));
  BOOST_LOG_TRIVIAL(info) << "Stream copy: Byte copy wrote " << bytes_written << " bytes";
  return bytes_written;
}

std::size_t block_copy(const std::string& source_path, const std::string& destination_path) {
  validate_input(source_path, destination_path);
  BOOST_LOG_TRIVIAL(info) << "Stream copy: Block copy from " << source_path << " to " << destination_path;

  std::ifstream source = detail::open_source(source_path);
  std::vector<char> buffer = detail::read_all(source, source_path);

  std::ofstream destination = detail::open_destination(destination_path);
  detail::write_block(destination, buffer.data(), buffer.size(), destination_path);
  detail::close_destination(destination, destination_path);

  BOOST_LOG_TRIVIAL(info) << "Stream copy: Block copy read " << buffer.size() << " bytes";
  return buffer.size();
}

std::size_t buffered_block_copy(const std::string& source_path, const std::string& destination_path) {
  validate_input(source_path, destination_path);
  BOOST_LOG_TRIVIAL(info) << "Stream copy: Buffered block copy from " << source_path
                          << " to " << destination_path;

  std::ifstream source = detail::open_source(source_path);
  std::vector<char> buffer = detail::read_all(source, source_path);

  // The file itself is unbuffered, BufferedStream does all the buffering
  std::ofstream destination = detail::open_destination(destination_path, true);
  {
    BufferedStream buffered(destination);
    detail::write_block(buffered, buffer.data(), buffer.size(), destination_path);
    buffered.flush();

    BOOST_LOG_TRIVIAL(debug) << "Stream copy: Buffered stream forwarded " << buffered.bytes_forwarded()
                             << " bytes in " << buffered.sink_writes() << " writes";
  }
  detail::close_destination(destination, destination_path);

  BOOST_LOG_TRIVIAL(info) << "Stream copy: Buffered block copy read " << buffer.size() << " bytes";
  return buffer.size();
}


//==============================================
// TEXT COPY
//==============================================

std::size_t line_copy(const std::string& source_path, const std::string& destination_path) {
  validate_input(source_path, destination_path);
  BOOST_LOG_TRIVIAL(info) << "Stream copy: Line copy from " << source_path << " to " << destination_path;

  std::ifstream source = detail::open_source(source_path);
  std::ofstream destination = detail::open_destination(destination_path);

  std::size_t line_count = 0;

  // Empty source, nothing to copy
  if (source.peek() == std::ifstream::traits_type::eof()) {
    if (source.bad()) {
      throw IOError("Failed to read source file: " + source_path);
    }
    detail::close_destination(destination, destination_path);
    BOOST_LOG_TRIVIAL(info) << "Stream copy: Line copy found an empty source";
    return line_count;
  }

  // getline() only sets eof on the final segment, which may be empty
  // when the source ends on a separator
  std::string line;
  while (true) {
    std::getline(source, line);
    if (source.bad()) {
      BOOST_LOG_TRIVIAL(error) << "Stream copy: Failed to read line " << line_count << " from " << source_path;
      throw IOError("Failed to read source file: " + source_path);
    }

    // Only a "\r\n" pair is a separator, a final unterminated '\r' is data
    if (!source.eof() && !line.empty() && line.back() == '\r') {
      line.pop_back();
    }

    if (line_count > 0) {
      destination.put(LINE_SEPARATOR);
    }
    destination << line;
    if (!destination.good()) {
      BOOST_LOG_TRIVIAL(error) << "Stream copy: Failed to write line " << line_count << " to " << destination_path;
      throw IOError("Failed to write destination file: " + destination_path);
    }
    ++line_count;

    if (source.eof()) {
      break;
    }
  }

  detail::close_destination(destination, destination_path);
  BOOST_LOG_TRIVIAL(info) << "Stream copy: Line copy processed " << line_count << " lines";
  return line_count;
}

} // namespace streamkit::streams
