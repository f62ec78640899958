#include "manager.hh"

#include <stdexcept>
#include <system_error>

#include "errors.hh"
#include "log.hh"

namespace dupscan {

inline namespace detail_v1 {

namespace fs = std::filesystem;

namespace {

bool exists_no_follow(const fs::path &path) {
  std::error_code ec;
  return fs::exists(fs::symlink_status(path, ec));
}

}  // namespace

std::vector<dupe_group_t> manager_t::groups() {
  return _index.get_duplicate_groups(_scan_id);
}

std::optional<scan_info_t> manager_t::scan_info() {
  return _index.get_scan_info(_scan_id);
}

bool manager_t::is_member(const fs::path &path) {
  for (const auto &group : groups()) {
    for (const auto &rec : group) {
      if (rec.path == path) {
        return true;
      }
    }
  }
  return false;
}

void manager_t::delete_file(const fs::path &path) {
  if (!_index.has_file(_scan_id, path)) {
    throw mutation_conflict_error(path, "file is not part of this scan");
  }
  if (!exists_no_follow(path)) {
    throw mutation_conflict_error(path, "file no longer exists");
  }
  fs::remove(path);
  log_line(lvl_t::log) << "removed: " << path << '\n';
  if (!_index.delete_file(path)) {
    log_line(lvl_t::warn) << "not in index: " << path << '\n';
  }
}

fs::path manager_t::rename_file(const fs::path &old_path,
                                const std::string &new_name) {
  if (new_name.empty() || new_name == "." || new_name == ".." ||
      new_name.find(fs::path::preferred_separator) != std::string::npos) {
    throw std::invalid_argument("invalid new filename: " + new_name);
  }
  if (!_index.has_file(_scan_id, old_path)) {
    throw mutation_conflict_error(old_path, "file is not part of this scan");
  }
  if (!exists_no_follow(old_path)) {
    throw mutation_conflict_error(old_path, "file no longer exists");
  }
  auto new_path = old_path.parent_path() / new_name;
  if (exists_no_follow(new_path)) {
    throw mutation_conflict_error(new_path,
                                  "a file with that name already exists");
  }
  fs::rename(old_path, new_path);
  log_line(lvl_t::log) << "renamed: " << old_path << " -> " << new_path
                       << '\n';
  if (!_index.update_file_path(old_path, new_path)) {
    log_line(lvl_t::warn) << "not in index: " << old_path << '\n';
  }
  return new_path;
}

}  // namespace detail_v1

}  // namespace dupscan
