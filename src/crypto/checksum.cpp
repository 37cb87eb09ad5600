#include "crypto/checksum.hpp"
#include "crypto/crypto_error.hpp"
#include "crypto/openssl_util.hpp"
#include <cstring>
#include <boost/asio/post.hpp>
#include <boost/log/trivial.hpp>
#include <openssl/evp.h>

namespace brightchain::crypto {

//==============================================
// CHECKSUM VALUE
//==============================================

Checksum Checksum::from_bytes(const uint8_t* data, std::size_t length) {
  if (length != constants::CHECKSUM_LENGTH) {
    throw ChecksumError(ChecksumErrorType::InvalidChecksumLength,
                        {{"expected", std::to_string(constants::CHECKSUM_LENGTH)},
                         {"actual", std::to_string(length)}});
  }
  Digest digest;
  std::memcpy(digest.data(), data, length);
  return Checksum(digest);
}

Checksum Checksum::from_bytes(const Bytes& data) {
  return from_bytes(data.data(), data.size());
}

Checksum Checksum::from_hex(const std::string& hex) {
  Bytes raw;
  try {
    raw = brightchain::from_hex(hex);
  } catch (const std::invalid_argument& e) {
    throw ChecksumError(ChecksumErrorType::InvalidChecksumHex, {{"detail", e.what()}});
  }
  return from_bytes(raw);
}

std::string Checksum::to_hex() const {
  return brightchain::to_hex(digest_.data(), digest_.size());
}

std::ostream& operator<<(std::ostream& os, const Checksum& checksum) {
  return os << checksum.to_hex();
}

std::size_t ChecksumHash::operator()(const Checksum& checksum) const {
  // Digest bytes are uniformly distributed already
  std::size_t value = 0;
  std::memcpy(&value, checksum.data(), sizeof(value));
  return value;
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ChecksumService::ChecksumService(std::size_t worker_threads)
  : pool_(worker_threads == 0 ? 1 : worker_threads) {
  BOOST_LOG_TRIVIAL(debug) << "Checksum service: Started with " << worker_threads << " worker threads";
}

ChecksumService::~ChecksumService() {
  pool_.join();
}

//==============================================
// DIGEST OPERATIONS
//==============================================

namespace {

struct DigestContext {
  MdCtxPtr ctx;

  DigestContext() : ctx(EVP_MD_CTX_new()) {
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha3_512(), nullptr) != 1) {
      throw ChecksumError(ChecksumErrorType::DigestFailed, {{"openssl", openssl_error_string()}});
    }
  }

  void update(const void* data, std::size_t length) {
    if (length > 0 && EVP_DigestUpdate(ctx.get(), data, length) != 1) {
      throw ChecksumError(ChecksumErrorType::DigestFailed, {{"openssl", openssl_error_string()}});
    }
  }

  Checksum finish() {
    Checksum::Digest digest;
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1
        || length != constants::CHECKSUM_LENGTH) {
      throw ChecksumError(ChecksumErrorType::DigestFailed, {{"openssl", openssl_error_string()}});
    }
    return Checksum(digest);
  }
};

} // namespace

Checksum ChecksumService::calculate_checksum(const uint8_t* data, std::size_t length) const {
  DigestContext digest;
  digest.update(data, length);
  return digest.finish();
}

Checksum ChecksumService::calculate_checksum(const Bytes& data) const {
  return calculate_checksum(data.data(), data.size());
}

Checksum ChecksumService::calculate_checksum(std::istream& input) const {
  DigestContext digest;
  char buffer[constants::STREAM_BUFFER_SIZE];
  std::size_t total = 0;

  while (input.read(buffer, sizeof(buffer))) {
    digest.update(buffer, static_cast<std::size_t>(input.gcount()));
    total += static_cast<std::size_t>(input.gcount());
  }
  // Final partial chunk
  if (input.gcount() > 0) {
    digest.update(buffer, static_cast<std::size_t>(input.gcount()));
    total += static_cast<std::size_t>(input.gcount());
  }

  BOOST_LOG_TRIVIAL(trace) << "Checksum service: Digested " << total << " bytes from stream";
  return digest.finish();
}

std::future<Checksum> ChecksumService::calculate_checksum_async(std::shared_ptr<std::istream> input) const {
  auto task = std::make_shared<std::packaged_task<Checksum()>>(
    [this, input]() { return calculate_checksum(*input); });
  std::future<Checksum> result = task->get_future();
  boost::asio::post(pool_, [task]() { (*task)(); });
  return result;
}

//==============================================
// VALIDATION
//==============================================

bool ChecksumService::validate_checksum(const Bytes& data, const Bytes& expected) const {
  if (expected.size() != constants::CHECKSUM_LENGTH) {
    BOOST_LOG_TRIVIAL(debug) << "Checksum service: Expected checksum has length " << expected.size();
    return false;
  }
  Checksum computed = calculate_checksum(data);
  return equal_bytes(computed.data(), computed.size(), expected.data(), expected.size());
}

bool ChecksumService::validate_checksum(const Bytes& data, const Checksum& expected) const {
  return calculate_checksum(data) == expected;
}

} // namespace brightchain::crypto
