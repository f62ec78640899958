#include "dupscan.hh"

#include <algorithm>
#include <iterator>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <unordered_map>
#include <unordered_set>

#include "classify.hh"
#include "errors.hh"
#include "log.hh"
#include "scan_index.hh"
#include "walker.hh"

namespace dupscan {

inline namespace detail_v1 {

namespace fs = std::filesystem;

namespace {

fs::path normalize_dir(const fs::path &dir) {
  auto abs = fs::absolute(dir).lexically_normal();
  // "/a/b/" -> "/a/b", so session lookups compare equal
  if (!abs.has_filename() && abs != abs.root_path()) {
    abs = abs.parent_path();
  }
  return abs;
}

}  // namespace

scan_result_t DUPSCAN_EXPORT scan(const scan_opts_t &opts,
                                  const progress_cb_t &on_progress) {
  if (opts.resume && opts.index_path.empty()) {
    throw std::invalid_argument("resuming a scan needs an index file");
  }
  const auto root = normalize_dir(opts.root);
  {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
      throw scan_error(root, "invalid target directory");
    }
  }

  scan_result_t result;
  progress_t progress(on_progress);
  walk_opts_t walk_opts;
  walk_opts.recursive = opts.recursive;
  walk_opts.exclude = opts.exclude;
  walk_opts.max_thread = opts.max_thread;

  // open or resume the index session
  std::unique_ptr<scan_index_t> index;
  int64_t scan_id = 0;
  std::unordered_map<std::string, file_record_t> known;
  if (!opts.index_path.empty()) {
    auto index_path = fs::absolute(opts.index_path).lexically_normal();
    index = std::make_unique<scan_index_t>(index_path);
    // never record the index itself nor its journal files
    for (const auto *suffix : index_side_suffixes) {
      walk_opts.skip.emplace_back(index_path.string() + suffix);
    }

    std::optional<scan_info_t> prev;
    if (opts.resume) {
      prev = index->latest_incomplete(root);
    }
    if (prev) {
      scan_id = prev->id;
      for (auto &rec : index->get_files(scan_id)) {
        rec.full_hash.reset();
        known.emplace(rec.path.native(), std::move(rec));
      }
      walk_opts.known = &known;
      log_line(lvl_t::log) << "resume scan " << scan_id << " with "
                           << known.size() << " indexed files" << '\n';
    } else {
      if (opts.resume) {
        log_line(lvl_t::log) << "no incomplete scan of " << root
                             << ", starting a new one" << '\n';
      }
      scan_id = index->start_scan(root);
    }
    result.index_path = index_path;
    result.scan_id = scan_id;
  }

  // generate file list, persisting one directory batch at a time
  stopwatch_t timer;
  std::vector<file_record_t> records;
  std::mutex mtx;
  log_line(lvl_t::log) << "list files..." << '\n';
  walk(root, walk_opts, progress, [&](std::vector<file_record_t> &&batch) {
    std::lock_guard lk(mtx);
    if (index) {
      scan_index_t::transaction_t tx(*index);
      for (auto &rec : batch) {
        if (!rec.id) {
          rec.id = index->add_file(scan_id, rec);
        }
      }
      index->update_progress(scan_id, records.size() + batch.size(), 0);
      tx.commit();
    }
    records.insert(records.end(), std::make_move_iterator(batch.begin()),
                   std::make_move_iterator(batch.end()));
  });
  log_line(lvl_t::log) << "elapsed: " << timer.time().count() << "ms" << '\n';
  log_line(lvl_t::log) << "file count: " << records.size() << '\n';

  if (index && !known.empty()) {
    // drop rows of files that vanished or changed since the last attempt
    std::unordered_set<int64_t> seen;
    for (const auto &rec : records) {
      seen.insert(*rec.id);
    }
    scan_index_t::transaction_t tx(*index);
    for (const auto &[path, rec] : known) {
      if (!seen.contains(*rec.id)) {
        index->delete_file_id(*rec.id);
      }
    }
    index->reset_hashes(scan_id);
    tx.commit();
  }

  // discovery order is path order, so output is reproducible
  std::sort(records.begin(), records.end(),
            [](const auto &lhs, const auto &rhs) {
              return lhs.path.native() < rhs.path.native();
            });

  log_line(lvl_t::log) << "detect duplicates..." << '\n';
  result.groups = classify(records, progress, opts.max_thread);
  result.files_scanned = records.size();
  log_line(lvl_t::log) << "elapsed: " << timer.time().count() << "ms" << '\n';
  log_line(lvl_t::log) << "duplicate group count: " << result.groups.size()
                       << '\n';

  // assign group membership and close the session
  if (index) {
    scan_index_t::transaction_t tx(*index);
    for (const auto &rec : records) {
      if (rec.full_hash) {
        index->update_file_hash(*rec.id, *rec.full_hash, *rec.full_hash);
      }
    }
    index->update_progress(scan_id, records.size(), result.groups.size());
    index->complete_scan(scan_id);
    tx.commit();
  }

  return result;
}

}  // namespace detail_v1

}  // namespace dupscan
