#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "config.hh"
#include "file_record.hh"
#include "progress.hh"

namespace dupscan {

inline namespace detail_v1 {

struct scan_opts_t {
  std::filesystem::path root;
  bool recursive = false;
  // glob patterns relative to the working directory
  std::vector<std::string> exclude;
  // scan index file, empty for an in-memory scan
  std::filesystem::path index_path;
  // reopen the newest incomplete session of root in index_path
  bool resume = false;
  uint32_t max_thread = default_max_thread;
};

struct scan_result_t {
  std::vector<dupe_group_t> groups;
  uint64_t files_scanned = 0;
  // empty and nullopt when nothing was persisted
  std::filesystem::path index_path;
  std::optional<int64_t> scan_id;
};

/**
 * @brief detects duplicate files using size, quick hash and full hash
 *
 * unreadable files and directories are logged and skipped, a partial
 * scan still reports what it could classify.
 *
 * @param opts root, recursion, exclusions, optional index
 * @param on_progress called on every scanned file and found group
 * @return groups by descending size, plus the index session if any
 * @throws std::invalid_argument opts.resume without opts.index_path
 * @throws scan_error root missing or not a directory
 * @throws index_error index unusable, only with opts.index_path set
 */
scan_result_t scan(const scan_opts_t &opts,
                   const progress_cb_t &on_progress = {});

}  // namespace detail_v1

}  // namespace dupscan
