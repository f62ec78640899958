#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "file_record.hh"
#include "scan_index.hh"

namespace dupscan {

inline namespace detail_v1 {

/**
 * @brief delete/rename duplicates of one indexed session
 *
 * the filesystem operation always happens first, the index is only
 * updated once it succeeded. groups are re-read from the index on every
 * call, nothing is cached here.
 */
class manager_t {
  scan_index_t &_index;
  int64_t _scan_id;

 public:
  manager_t(scan_index_t &index, const int64_t scan_id) noexcept
      : _index(index), _scan_id(scan_id) {}

  int64_t scan_id() const noexcept { return _scan_id; }
  const std::filesystem::path &index_path() const noexcept {
    return _index.path();
  }

  // groups that still have >= 2 indexed members
  std::vector<dupe_group_t> groups();
  std::optional<scan_info_t> scan_info();

  /**
   * @brief whether path is a member of a current group
   */
  bool is_member(const std::filesystem::path &path);

  /**
   * @brief remove the file, then its index row
   *
   * @throws mutation_conflict_error path has no row in this session, or
   * the file no longer exists
   * @throws std::filesystem::filesystem_error removal failed
   */
  void delete_file(const std::filesystem::path &path);

  /**
   * @brief rename within the same directory, then update the index row
   *
   * @param new_name file name only, no separator
   * @return the new path
   * @throws std::invalid_argument empty name or name with a separator
   * @throws mutation_conflict_error source not in this session, source
   * missing or target exists
   * @throws std::filesystem::filesystem_error rename failed
   */
  std::filesystem::path rename_file(const std::filesystem::path &old_path,
                                    const std::string &new_name);
};

}  // namespace detail_v1

}  // namespace dupscan
