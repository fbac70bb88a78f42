#include "streams/text_reader.hpp"
#include <fstream>
#include <vector>
#include <boost/locale/encoding.hpp>
#include <boost/log/trivial.hpp>
#include "streams/validation.hpp"
#include "file_io.hpp"

namespace streamkit::streams {

namespace {

constexpr char UTF8_BOM[] = "\xEF\xBB\xBF";
constexpr std::size_t UTF8_BOM_SIZE = sizeof(UTF8_BOM) - 1;

} // namespace

bool is_supported_encoding(const std::string& encoding_name) {
  if (is_blank(encoding_name)) {
    return false;
  }

  // Converting nothing still opens the converter, which is what rejects
  // unknown charsets
  try {
    boost::locale::conv::to_utf<char>(std::string(), encoding_name);
    return true;
  }
  catch (const boost::locale::conv::invalid_charset_error&) {
    return false;
  }
}

std::string read_encoded_text(const std::string& source_path, const std::string& encoding_name) {
  validate_input(source_path);

  if (is_blank(encoding_name)) {
    BOOST_LOG_TRIVIAL(error) << "Text reader: Encoding name is empty or whitespace";
    throw InvalidArgumentError("encoding_name cannot be empty or whitespace.", "encoding_name");
  }

  if (!is_supported_encoding(encoding_name)) {
    BOOST_LOG_TRIVIAL(error) << "Text reader: Unsupported encoding: " << encoding_name;
    throw InvalidArgumentError("'" + encoding_name + "' is not a supported encoding name.", "encoding_name");
  }

  BOOST_LOG_TRIVIAL(info) << "Text reader: Reading " << source_path << " as " << encoding_name;

  std::ifstream source = detail::open_source(source_path);
  std::vector<char> content = detail::read_all(source, source_path);

  std::string text = boost::locale::conv::to_utf<char>(
    std::string(content.begin(), content.end()), encoding_name, boost::locale::conv::skip);

  if (text.compare(0, UTF8_BOM_SIZE, UTF8_BOM) == 0) {
    BOOST_LOG_TRIVIAL(debug) << "Text reader: Dropping byte order mark";
    text.erase(0, UTF8_BOM_SIZE);
  }

  BOOST_LOG_TRIVIAL(info) << "Text reader: Decoded " << content.size() << " bytes into "
                          << text.size() << " UTF-8 bytes";
  return text;
}

} // namespace streamkit::streams
