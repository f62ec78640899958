#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dupscan {

inline namespace detail_v1 {

using file_time_t = std::chrono::system_clock::time_point;

/**
 * @brief one discovered regular file
 *
 * quick_hash is always set, full_hash only once the file survived the
 * size and quick hash buckets. id is the scan index row, if persisted.
 */
struct file_record_t {
  std::filesystem::path path;
  std::string name;
  uint64_t size = 0;
  file_time_t created;
  file_time_t modified;
  std::string quick_hash;
  std::optional<std::string> full_hash;
  std::optional<int64_t> id;

  std::string formatted_size() const;
};

// members share one full_hash, size() >= 2 when handed to callers
using dupe_group_t = std::vector<file_record_t>;

/**
 * @brief human readable size, two decimals and binary units
 *
 * @return e.g. "512.00 B", "1.00 MB"
 */
std::string format_size(uint64_t bytes);

}  // namespace detail_v1

}  // namespace dupscan
