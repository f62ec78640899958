#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "file_record.hh"

struct sqlite3;

namespace dupscan {

inline namespace detail_v1 {

// one scan's lifecycle, end_time empty while running or after a crash
struct scan_info_t {
  int64_t id = 0;
  std::filesystem::path base_directory;
  file_time_t start_time;
  std::optional<file_time_t> end_time;
  uint64_t files_scanned = 0;
  uint64_t groups_found = 0;

  bool complete() const noexcept { return end_time.has_value(); }
};

/**
 * @brief durable ledger of scans, backed by one sqlite file
 *
 * single writer per file. mutations are only issued after the matching
 * filesystem operation succeeded. every failure throws index_error.
 */
class scan_index_t {
  sqlite3 *_db = nullptr;
  std::filesystem::path _path;

  void exec(const char *sql);

 public:
  /**
   * @brief open or create the index file and its schema
   *
   * @throws index_error not a database, or unwritable
   */
  explicit scan_index_t(const std::filesystem::path &db_path);
  ~scan_index_t() noexcept;

  scan_index_t(const scan_index_t &) = delete;
  scan_index_t(scan_index_t &&) = delete;
  scan_index_t &operator=(const scan_index_t &) = delete;
  scan_index_t &operator=(scan_index_t &&) = delete;

  const std::filesystem::path &path() const noexcept { return _path; }

  // session lifecycle

  int64_t start_scan(const std::filesystem::path &base_directory);
  void update_progress(int64_t scan_id, uint64_t files_scanned,
                       uint64_t groups_found);
  void complete_scan(int64_t scan_id);

  std::optional<scan_info_t> get_scan_info(int64_t scan_id);
  std::optional<int64_t> latest_scan_id();
  // newest session for base_directory without end_time
  std::optional<scan_info_t> latest_incomplete(
      const std::filesystem::path &base_directory);

  // file rows

  /**
   * @brief append a row, path uniqueness per scan is not enforced
   *
   * @return row id
   */
  int64_t add_file(int64_t scan_id, const file_record_t &rec);
  void update_file_hash(int64_t file_id, const std::string &full_hash,
                        const std::string &group_id);
  std::vector<file_record_t> get_files(int64_t scan_id);
  // whether the session holds a row for path
  bool has_file(int64_t scan_id, const std::filesystem::path &path);
  // drop full hash and group of every row, before a resumed classification
  void reset_hashes(int64_t scan_id);

  /**
   * @brief groups with >= 2 rows sharing group_id
   *
   * same ordering as classify(): descending size, then the group's
   * smallest path, members by path
   */
  std::vector<dupe_group_t> get_duplicate_groups(int64_t scan_id);

  /**
   * @brief remove every row with this path, group ids are left alone
   *
   * @return whether a row was removed
   */
  bool delete_file(const std::filesystem::path &path);
  void delete_file_id(int64_t file_id);

  /**
   * @brief rename in place, hashes, group and size are kept
   *
   * @return whether a row was updated
   */
  bool update_file_path(const std::filesystem::path &old_path,
                        const std::filesystem::path &new_path);

  // RAII transaction, rolled back unless committed
  class transaction_t {
    scan_index_t &_idx;
    bool _done = false;

   public:
    explicit transaction_t(scan_index_t &idx);
    ~transaction_t() noexcept;

    transaction_t(const transaction_t &) = delete;
    transaction_t &operator=(const transaction_t &) = delete;

    void commit();
  };

  /**
   * @return <base_dir>/.dupscan.<8 random hex chars>
   */
  static std::filesystem::path generate_index_path(
      const std::filesystem::path &base_dir);
};

}  // namespace detail_v1

}  // namespace dupscan
