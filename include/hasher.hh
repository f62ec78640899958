#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include <openssl/evp.h>

namespace dupscan {

inline namespace detail_v1 {

// RAII wrapper for a libcrypto digest context
class hasher_t {
  EVP_MD_CTX *_ctx;
  const EVP_MD *_md;

 public:
  /**
   * @param name digest algorithm supported by libcrypto
   * @throws std::runtime_error unknown algorithm or allocation failure
   */
  explicit hasher_t(const char *name);
  ~hasher_t() noexcept;

  hasher_t(const hasher_t &rhs) = delete;
  hasher_t(hasher_t &&rhs) = delete;
  hasher_t &operator=(const hasher_t &rhs) = delete;
  hasher_t &operator=(hasher_t &&rhs) = delete;

  void reset();
  void update(const char *data, const uint64_t size);
  // lowercase hex of the digest, the context must be reset before reuse
  std::string hex_digest();
};

// lowercase hex of size bytes
std::string to_hex(const unsigned char *data, std::size_t size);

/**
 * @brief digest of bytes [0, quick_digest_sz), or the whole file if smaller
 *
 * never reads past the window
 * @throws file_read_error
 */
std::string quick_digest(const std::filesystem::path &path);

/**
 * @brief streaming digest of the whole file, O(1) memory
 *
 * @throws file_read_error
 */
std::string full_digest(const std::filesystem::path &path);

}  // namespace detail_v1

}  // namespace dupscan
