#pragma once

#include <cstddef>
#include <istream>
#include <memory>
#include <string>
#include <vector>
#include "streams/stream_error.hpp"

namespace streamkit {
namespace streams {

// Forward declaration for OpenSSL digest state
struct DigestContext;

// Message digest resolved by name through OpenSSL ("MD5", "SHA1",
// "SHA256", "SHA-256", "SHA512", ... case-insensitive)
class DigestEngine {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Throws InvalidArgumentError if the algorithm is blank or unknown
  explicit DigestEngine(const std::string& algorithm_name);
  ~DigestEngine();

  DigestEngine(const DigestEngine&) = delete;
  DigestEngine& operator=(const DigestEngine&) = delete;


  // ---- DIGEST OPERATIONS ----
  void update(const char* data, std::size_t length);
  // Finalizes the digest, the engine cannot be updated afterwards
  std::vector<unsigned char> finish();


  // ---- GETTERS ----
  const std::string& algorithm() const { return algorithm_; }
  std::size_t digest_size() const;

private:
  std::string algorithm_;
  std::unique_ptr<DigestContext> context_;
  bool finished_ = false;
};

// Digests the remaining content of `stream` and returns it as uppercase hex
// without separators. The stream is read to its end and left open.
// Throws InvalidArgumentError for an unknown algorithm, IOError if the
// stream is bad or fails while reading.
std::string calculate_hash(std::istream& stream, const std::string& algorithm_name);

// Uppercase hex rendering of raw bytes
std::string to_hex(const std::vector<unsigned char>& bytes);

} // namespace streams
} // namespace streamkit
