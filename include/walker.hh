#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "config.hh"
#include "file_record.hh"
#include "progress.hh"

namespace dupscan {

inline namespace detail_v1 {

struct walk_opts_t {
  bool recursive = false;
  // glob patterns, matched against the path relative to the working dir
  std::vector<std::string> exclude;
  // exact paths never recorded (the scan index and its side files)
  std::vector<std::filesystem::path> skip;
  // records of a resumed session keyed by path, reused when unchanged
  const std::unordered_map<std::string, file_record_t> *known = nullptr;
  uint32_t max_thread = default_max_thread;
};

// receives the records of one directory, called from pool workers
using batch_sink_t = std::function<void(std::vector<file_record_t> &&batch)>;

/**
 * @brief test path against glob patterns before any I/O on it
 *
 * a pattern matches either the path relative to cwd or the file name
 */
bool is_excluded(const std::filesystem::path &path,
                 const std::vector<std::string> &exclude,
                 const std::filesystem::path &cwd);

/**
 * @brief stat a regular file and build its record, quick hash included
 *
 * @param known resumed records, an unchanged entry is returned as is
 * @throws file_read_error
 */
file_record_t make_record(
    const std::filesystem::path &path,
    const std::unordered_map<std::string, file_record_t> *known = nullptr);

/**
 * @brief list directory, optionally recursive, on a thread pool
 *
 * one batch per directory is handed to sink, no order guarantee.
 * unreadable files and directories are logged and skipped, symlinks
 * and special files are never recorded.
 * @param root absolute directory path
 * @throws whatever sink or the progress callback threw, after the pool
 * drained
 */
void walk(const std::filesystem::path &root, const walk_opts_t &opts,
          progress_t &progress, const batch_sink_t &sink);

/**
 * @brief walk and collect every record
 */
std::vector<file_record_t> walk(const std::filesystem::path &root,
                                const walk_opts_t &opts, progress_t &progress);

}  // namespace detail_v1

}  // namespace dupscan
