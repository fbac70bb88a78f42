#include "streams/hash.hpp"
#include <openssl/err.h>
#include <openssl/evp.h>
#include <array>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>
#include "streams/stream_config.hpp"
#include "streams/validation.hpp"

namespace streamkit {
namespace streams {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD* md = nullptr;
  EVP_MD_CTX* ctx = nullptr;

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
    if (md) {
      EVP_MD_free(md);
    }
  }
};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

DigestEngine::DigestEngine(const std::string& algorithm_name)
  : algorithm_(algorithm_name)
  , context_(std::make_unique<DigestContext>()) {
  if (is_blank(algorithm_name)) {
    BOOST_LOG_TRIVIAL(error) << "Hash: Algorithm name is empty or whitespace";
    throw InvalidArgumentError("algorithm_name cannot be empty or whitespace.", "algorithm_name");
  }

  // Resolve the algorithm by name from the default provider
  context_->md = EVP_MD_fetch(nullptr, algorithm_name.c_str(), nullptr);
  if (!context_->md) {
    ERR_clear_error();
    BOOST_LOG_TRIVIAL(error) << "Hash: Unsupported hash algorithm: " << algorithm_name;
    throw InvalidArgumentError("'" + algorithm_name + "' is not a supported hash algorithm.", "algorithm_name");
  }

  context_->ctx = EVP_MD_CTX_new();
  if (!context_->ctx) {
    throw StreamError("Hash: Failed to create hash context");
  }

  if (!EVP_DigestInit_ex(context_->ctx, context_->md, nullptr)) {
    throw StreamError("Hash: Failed to initialize hash context for " + algorithm_name);
  }

  BOOST_LOG_TRIVIAL(debug) << "Hash: Initialized " << algorithm_name << " digest ("
                           << digest_size() << " bytes)";
}

DigestEngine::~DigestEngine() = default;


//==============================================
// DIGEST OPERATIONS
//==============================================

void DigestEngine::update(const char* data, std::size_t length) {
  if (finished_) {
    throw StreamError("Hash: Digest already finalized");
  }

  if (!EVP_DigestUpdate(context_->ctx, data, length)) {
    throw StreamError("Hash: Failed to update hash");
  }
}

std::vector<unsigned char> DigestEngine::finish() {
  if (finished_) {
    throw StreamError("Hash: Digest already finalized");
  }

  std::vector<unsigned char> digest(EVP_MAX_MD_SIZE);
  unsigned int digest_len = 0;

  if (!EVP_DigestFinal_ex(context_->ctx, digest.data(), &digest_len)) {
    throw StreamError("Hash: Failed to finalize hash");
  }

  finished_ = true;
  digest.resize(digest_len);
  return digest;
}

std::size_t DigestEngine::digest_size() const {
  return static_cast<std::size_t>(EVP_MD_get_size(context_->md));
}


//==============================================
// STREAM HASHING
//==============================================

std::string calculate_hash(std::istream& stream, const std::string& algorithm_name) {
  DigestEngine engine(algorithm_name);

  if (stream.bad()) {
    BOOST_LOG_TRIVIAL(error) << "Hash: Input stream is in a bad state";
    throw IOError("Hash: Invalid input stream");
  }

  BOOST_LOG_TRIVIAL(info) << "Hash: Calculating " << algorithm_name << " of stream";

  std::array<char, BUFFER_SIZE> buffer;
  std::size_t total_bytes = 0;

  // Read the stream in chunks, the last one may be partial
  while (stream.read(buffer.data(), buffer.size()) || stream.gcount() > 0) {
    const auto bytes_read = static_cast<std::size_t>(stream.gcount());
    engine.update(buffer.data(), bytes_read);
    total_bytes += bytes_read;
  }

  if (stream.bad()) {
    BOOST_LOG_TRIVIAL(error) << "Hash: Failed to read input stream after " << total_bytes << " bytes";
    throw IOError("Hash: Failed to read input stream");
  }

  std::string result = to_hex(engine.finish());
  BOOST_LOG_TRIVIAL(info) << "Hash: " << algorithm_name << " of " << total_bytes << " bytes: " << result;
  return result;
}

std::string to_hex(const std::vector<unsigned char>& bytes) {
  std::stringstream ss;
  ss << std::hex << std::uppercase;
  for (unsigned char byte : bytes) {
    ss << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

} // namespace streams
} // namespace streamkit
