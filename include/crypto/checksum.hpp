#ifndef BRIGHTCHAIN_CHECKSUM_HPP
#define BRIGHTCHAIN_CHECKSUM_HPP

#include <array>
#include <future>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <boost/asio/thread_pool.hpp>
#include "common/bytes.hpp"
#include "crypto/constants.hpp"

namespace brightchain::crypto {

// SHA3-512 digest used as block identity and content address
class Checksum {
public:
  using Digest = std::array<uint8_t, constants::CHECKSUM_LENGTH>;

  Checksum() { digest_.fill(0); }
  explicit Checksum(const Digest& digest) : digest_(digest) {}

  // Throws ChecksumError if length is not CHECKSUM_LENGTH
  static Checksum from_bytes(const uint8_t* data, std::size_t length);
  static Checksum from_bytes(const Bytes& data);
  static Checksum from_hex(const std::string& hex);

  const uint8_t* data() const { return digest_.data(); }
  static constexpr std::size_t size() { return constants::CHECKSUM_LENGTH; }
  const Digest& digest() const { return digest_; }

  Bytes to_bytes() const { return Bytes(digest_.begin(), digest_.end()); }
  std::string to_hex() const;

  bool operator==(const Checksum& other) const { return digest_ == other.digest_; }
  bool operator!=(const Checksum& other) const { return digest_ != other.digest_; }
  bool operator<(const Checksum& other) const { return digest_ < other.digest_; }

private:
  Digest digest_;
};

std::ostream& operator<<(std::ostream& os, const Checksum& checksum);

struct ChecksumHash {
  std::size_t operator()(const Checksum& checksum) const;
};

class ChecksumService {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit ChecksumService(std::size_t worker_threads = 2);
  ~ChecksumService();

  ChecksumService(const ChecksumService&) = delete;
  ChecksumService& operator=(const ChecksumService&) = delete;


  // ---- DIGEST OPERATIONS ----
  Checksum calculate_checksum(const Bytes& data) const;
  Checksum calculate_checksum(const uint8_t* data, std::size_t length) const;
  // Consumes the stream in STREAM_BUFFER_SIZE chunks
  Checksum calculate_checksum(std::istream& input) const;
  // Runs the stream digest on the worker pool; the stream is owned by the task
  std::future<Checksum> calculate_checksum_async(std::shared_ptr<std::istream> input) const;


  // ---- VALIDATION ----
  // False on any length mismatch of expected, never throws for bad input
  bool validate_checksum(const Bytes& data, const Bytes& expected) const;
  bool validate_checksum(const Bytes& data, const Checksum& expected) const;

private:
  mutable boost::asio::thread_pool pool_;
};

} // namespace brightchain::crypto

#endif // BRIGHTCHAIN_CHECKSUM_HPP
