#include "classify.hh"

#include <algorithm>
#include <functional>
#include <iterator>
#include <mutex>
#include <numeric>
#include <string>
#include <unordered_map>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>

#include "errors.hh"
#include "hasher.hh"
#include "log.hh"

namespace dupscan {

inline namespace detail_v1 {

namespace ba = boost::asio;

using idx_vec = std::vector<std::size_t>;

namespace {

struct classify_ctx_t {
  std::span<file_record_t> records;
  progress_t &progress;

  classify_ctx_t(std::span<file_record_t> records_, progress_t &progress_)
      : records(records_), progress(progress_) {}

  std::mutex mtx;
  std::vector<idx_vec> groups;
  first_error_t err;
};

/**
 * @brief visit every run of equal keys with at least 2 members
 *
 * @param idx indices sorted by key
 */
template <typename Key, typename Fn>
void for_each_union(const idx_vec &idx, Key &&key, Fn &&fn) {
  if (idx.size() < 2) {
    return;
  }
  auto union_st = idx.begin();
  auto union_ed = union_st + 1;
  while (true) {
    if (union_ed == idx.end() || key(*union_ed) != key(*union_st)) {
      // end of union
      if (std::distance(union_st, union_ed) > 1) {
        fn(idx_vec(union_st, union_ed));
      }
      if (union_ed == idx.end()) {
        break;
      }
      union_st = union_ed;
    }
    ++union_ed;
  }
}

/**
 * @brief full hash one size + quick hash bucket, regroup by full hash
 *
 * @param bucket ascending record indices, size >= 2
 */
void dedupe_same_quick(const idx_vec bucket, classify_ctx_t &ctx) {
  if (ctx.err.failed()) {
    return;
  }
  try {
    // full hash groups in order of first appearance
    std::vector<idx_vec> groups_tmp;
    std::unordered_map<std::string, std::size_t> group_pos;
    for (auto i : bucket) {
      auto &rec = ctx.records[i];
      try {
        rec.full_hash = full_digest(rec.path);
      } catch (const file_read_error &e) {
        log_line(lvl_t::warn) << "skip file: " << rec.path << " - "
                              << e.code().message() << '\n';
        continue;
      }
      auto [it, inserted] = group_pos.emplace(*rec.full_hash, groups_tmp.size());
      if (inserted) {
        groups_tmp.emplace_back();
      }
      groups_tmp[it->second].push_back(i);
    }

    // append to global list
    std::lock_guard lk(ctx.mtx);
    for (auto &group : groups_tmp) {
      if (group.size() > 1) {
        ctx.groups.emplace_back(std::move(group));
        ctx.progress.group_found();
      }
    }
  } catch (const std::exception &) {
    ctx.err.capture(std::current_exception());
  }
}

}  // namespace

std::vector<dupe_group_t> classify(std::span<file_record_t> records,
                                   progress_t &progress,
                                   const uint32_t max_thread) {
  classify_ctx_t ctx(records, progress);

  // bucket by size, stable so discovery order survives within a bucket
  idx_vec by_size(records.size());
  std::iota(by_size.begin(), by_size.end(), 0UL);
  std::stable_sort(by_size.begin(), by_size.end(), [&](auto lhs, auto rhs) {
    return records[lhs].size < records[rhs].size;
  });

  uint64_t job_count = 0;
  {
    ba::thread_pool pool(std::max(1U, max_thread));
    for_each_union(
        by_size, [&](auto i) { return records[i].size; },
        [&](idx_vec same_size) {
          // sub-bucket by quick hash
          std::stable_sort(
              same_size.begin(), same_size.end(), [&](auto lhs, auto rhs) {
                return records[lhs].quick_hash < records[rhs].quick_hash;
              });
          for_each_union(
              same_size,
              [&](auto i) -> const std::string & {
                return records[i].quick_hash;
              },
              [&](idx_vec same_quick) {
                // only point where full hashing happens
                ba::post(pool, std::bind(dedupe_same_quick,
                                         std::move(same_quick), std::ref(ctx)));
                ++job_count;
              });
        });
    log_line(lvl_t::log) << "job count: " << job_count << '\n';
    pool.join();
  }
  ctx.err.rethrow_if_failed();

  // largest first, ties by discovery order of the first member
  std::sort(ctx.groups.begin(), ctx.groups.end(),
            [&](const auto &lhs, const auto &rhs) {
              const auto lsz = records[lhs.front()].size;
              const auto rsz = records[rhs.front()].size;
              if (lsz != rsz) {
                return lsz > rsz;
              }
              return lhs.front() < rhs.front();
            });

  std::vector<dupe_group_t> dupe_list;
  dupe_list.reserve(ctx.groups.size());
  for (const auto &group : ctx.groups) {
    auto &dupe = dupe_list.emplace_back();
    dupe.reserve(group.size());
    for (auto i : group) {
      dupe.push_back(records[i]);
    }
  }
  return dupe_list;
}

}  // namespace detail_v1

}  // namespace dupscan
