#pragma once

#include <atomic>
#include <exception>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace dupscan {

inline namespace detail_v1 {

// stat or read of a single file failed, the file is skipped
class file_read_error : public std::runtime_error {
  std::filesystem::path _path;
  std::error_code _code;

 public:
  file_read_error(const std::filesystem::path &path, const std::error_code code)
      : std::runtime_error("failed to read " + path.string() + ": " +
                           code.message()),
        _path(path),
        _code(code) {}

  const std::filesystem::path &path() const noexcept { return _path; }
  std::error_code code() const noexcept { return _code; }
};

// scan root missing or not a directory
class scan_error : public std::runtime_error {
  std::filesystem::path _path;

 public:
  scan_error(const std::filesystem::path &path, const std::string &what)
      : std::runtime_error(what + ": " + path.string()), _path(path) {}

  const std::filesystem::path &path() const noexcept { return _path; }
};

// scan index unavailable or corrupt
class index_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// delete/rename source vanished or rename target exists
class mutation_conflict_error : public std::runtime_error {
  std::filesystem::path _path;

 public:
  mutation_conflict_error(const std::filesystem::path &path,
                          const std::string &what)
      : std::runtime_error(what + ": " + path.string()), _path(path) {}

  const std::filesystem::path &path() const noexcept { return _path; }
};

/**
 * @brief first fatal error of a pool job, rethrown after join
 *
 * exceptions must not escape a job posted to the thread pool
 */
class first_error_t {
  std::mutex _mtx;
  std::exception_ptr _err;
  std::atomic_bool _failed{false};

 public:
  void capture(std::exception_ptr err) {
    std::lock_guard lk(_mtx);
    if (!_err) {
      _err = std::move(err);
    }
    _failed = true;
  }
  bool failed() const noexcept { return _failed; }
  void rethrow_if_failed() {
    std::lock_guard lk(_mtx);
    if (_err) {
      std::rethrow_exception(_err);
    }
  }
};

}  // namespace detail_v1

}  // namespace dupscan
