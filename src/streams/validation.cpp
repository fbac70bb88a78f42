#include "streams/validation.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>
#include <boost/log/trivial.hpp>

namespace streamkit::streams {

bool is_blank(const std::string& value) {
  return std::all_of(value.begin(), value.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

void validate_input(const std::string& source_path) {
  if (is_blank(source_path)) {
    BOOST_LOG_TRIVIAL(error) << "Validation: Source path is empty or whitespace";
    throw InvalidArgumentError("source_path cannot be empty or whitespace.", "source_path");
  }

  // Directories and broken links do not count as existing files
  std::error_code ec;
  auto status = std::filesystem::status(source_path, ec);
  if (!std::filesystem::exists(status) || std::filesystem::is_directory(status)) {
    BOOST_LOG_TRIVIAL(error) << "Validation: Source file not found: " << source_path;
    throw FileNotFoundError(source_path);
  }
}

void validate_input(const std::string& source_path, const std::string& destination_path) {
  validate_input(source_path);

  if (is_blank(destination_path)) {
    BOOST_LOG_TRIVIAL(error) << "Validation: Destination path is empty or whitespace";
    throw InvalidArgumentError("destination_path cannot be empty or whitespace.", "destination_path");
  }
}

} // namespace streamkit::streams
