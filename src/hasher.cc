#include "hasher.hh"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <system_error>
#include <vector>

#include "config.hh"
#include "errors.hh"

namespace dupscan {

inline namespace detail_v1 {

hasher_t::hasher_t(const char *name) {
  _md = EVP_get_digestbyname(name);
  if (_md == nullptr) {
    throw std::runtime_error(std::string("invalid hash algorithm: ") + name);
  }
  _ctx = EVP_MD_CTX_new();
  if (_ctx == nullptr) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  try {
    reset();
  } catch (...) {
    EVP_MD_CTX_free(_ctx);
    throw;
  }
}

hasher_t::~hasher_t() noexcept {
  if (_ctx != nullptr) {
    EVP_MD_CTX_free(_ctx);
  }
}

void hasher_t::reset() {
  if (EVP_DigestInit_ex(_ctx, _md, nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
}

void hasher_t::update(const char *data, const uint64_t size) {
  if (EVP_DigestUpdate(_ctx, data, size) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
}

std::string hasher_t::hex_digest() {
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int md_len = 0;
  if (EVP_DigestFinal_ex(_ctx, md, &md_len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  return to_hex(md, md_len);
}

std::string to_hex(const unsigned char *data, const std::size_t size) {
  constexpr char hex[] = "0123456789abcdef";
  std::string out;
  out.reserve(size * 2);
  for (auto i = 0UL; i < size; ++i) {
    out += hex[data[i] >> 4];
    out += hex[data[i] & 0x0f];
  }
  return out;
}

namespace {

std::error_code last_error() noexcept {
  if (errno != 0) {
    return {errno, std::generic_category()};
  }
  return std::make_error_code(std::errc::io_error);
}

// hash at most limit bytes from the start of the file
std::string digest_file(const std::filesystem::path &path,
                        const uint64_t limit) {
  errno = 0;
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs.is_open()) {
    throw file_read_error(path, last_error());
  }
  hasher_t hasher(digest_name);
  std::vector<char> buf(buf_sz);
  auto remain = limit;
  while (remain > 0) {
    const auto read_sz = std::min<uint64_t>(buf_sz, remain);
    const auto read_len = ifs.read(buf.data(), (int64_t)read_sz).gcount();
    if (ifs.bad()) {
      throw file_read_error(path, last_error());
    }
    hasher.update(buf.data(), (uint64_t)read_len);
    remain -= (uint64_t)read_len;
    if (ifs.eof()) {
      break;
    }
  }
  return hasher.hex_digest();
}

}  // namespace

std::string quick_digest(const std::filesystem::path &path) {
  return digest_file(path, quick_digest_sz);
}

std::string full_digest(const std::filesystem::path &path) {
  return digest_file(path, std::numeric_limits<uint64_t>::max());
}

}  // namespace detail_v1

}  // namespace dupscan
