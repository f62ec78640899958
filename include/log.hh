#pragma once

#include <atomic>
#include <chrono>
#include <iostream>
#include <syncstream>

namespace dupscan {

inline namespace detail_v1 {

// one synced line per expression, lines from pool workers never interleave
using oss = std::osyncstream;

enum class lvl_t {
  log,   // progress and phase information
  warn,  // skipped entry, scan continues
  err    // failed operation
};

inline std::atomic_bool quiet_log{false};
inline std::ostream null_os{nullptr};

/**
 * @brief suppress [log] lines, warnings and errors are always printed
 */
inline void set_quiet(bool quiet) noexcept { quiet_log = quiet; }

/**
 * @brief start a prefixed diagnostic line on stderr
 *
 * @param lvl severity, selects the "[log] " / "[warn] " / "[err] " prefix
 * @return synced stream, flushed when it goes out of scope
 */
inline oss log_line(const lvl_t lvl) {
  if (lvl == lvl_t::log && quiet_log) {
    return oss(null_os);
  }
  oss os(std::cerr);
  switch (lvl) {
    case lvl_t::log:
      os << "[log] ";
      break;
    case lvl_t::warn:
      os << "[warn] ";
      break;
    case lvl_t::err:
      os << "[err] ";
      break;
  }
  return os;
}

class stopwatch_t {
  std::chrono::steady_clock::time_point _prev_time;

 public:
  stopwatch_t() noexcept : _prev_time(std::chrono::steady_clock::now()) {}
  // milliseconds since construction or the previous call
  std::chrono::milliseconds time() noexcept {
    auto cur_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        cur_time - _prev_time);
    _prev_time = cur_time;
    return duration;
  }
};

}  // namespace detail_v1

}  // namespace dupscan
