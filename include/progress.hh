#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string_view>
#include <utility>

namespace dupscan {

inline namespace detail_v1 {

enum class phase_t { scanning, hashing };

std::string_view phase_name(phase_t phase) noexcept;

using progress_cb_t =
    std::function<void(uint64_t files_scanned, uint64_t groups_found,
                       phase_t phase)>;

/**
 * @brief thread-safe progress sink shared by walker and classifier
 *
 * every increment is forwarded to the callback, throttling is up to the
 * caller. callbacks are serialized, never run concurrently.
 */
class progress_t {
  progress_cb_t _cb;
  std::mutex _mtx;
  uint64_t _files_scanned = 0;
  uint64_t _groups_found = 0;

 public:
  progress_t() = default;
  explicit progress_t(progress_cb_t cb) : _cb(std::move(cb)) {}

  progress_t(const progress_t &) = delete;
  progress_t &operator=(const progress_t &) = delete;

  void file_scanned();
  void group_found();

  uint64_t files_scanned();
  uint64_t groups_found();
};

}  // namespace detail_v1

}  // namespace dupscan
