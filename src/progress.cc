#include "progress.hh"

namespace dupscan {

inline namespace detail_v1 {

std::string_view phase_name(const phase_t phase) noexcept {
  return phase == phase_t::scanning ? "scanning" : "hashing";
}

void progress_t::file_scanned() {
  std::lock_guard lk(_mtx);
  ++_files_scanned;
  if (_cb) {
    _cb(_files_scanned, _groups_found, phase_t::scanning);
  }
}

void progress_t::group_found() {
  std::lock_guard lk(_mtx);
  ++_groups_found;
  if (_cb) {
    _cb(_files_scanned, _groups_found, phase_t::hashing);
  }
}

uint64_t progress_t::files_scanned() {
  std::lock_guard lk(_mtx);
  return _files_scanned;
}

uint64_t progress_t::groups_found() {
  std::lock_guard lk(_mtx);
  return _groups_found;
}

}  // namespace detail_v1

}  // namespace dupscan
