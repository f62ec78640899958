#include "walker.hh"

#include <fcntl.h>
#include <fnmatch.h>
#include <sys/stat.h>

#include <algorithm>
#include <cerrno>
#include <iterator>
#include <mutex>
#include <system_error>

#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>

#include "errors.hh"
#include "hasher.hh"
#include "log.hh"

namespace dupscan {

inline namespace detail_v1 {

namespace fs = std::filesystem;
namespace ba = boost::asio;

namespace {

struct walk_ctx_t {
  const walk_opts_t &opts;
  const fs::path cwd;
  progress_t &progress;
  const batch_sink_t &sink;
  ba::thread_pool &pool;

  walk_ctx_t(const walk_opts_t &opts_, progress_t &progress_,
             const batch_sink_t &sink_, ba::thread_pool &pool_)
      : opts(opts_),
        cwd(fs::current_path()),
        progress(progress_),
        sink(sink_),
        pool(pool_) {}

  first_error_t err;
};

file_time_t to_time(const struct statx_timestamp &ts) {
  auto since_epoch =
      std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec);
  // index keeps milliseconds, truncate so resumed records compare equal
  return file_time_t(
      std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch));
}

bool is_skipped(const fs::path &path, const std::vector<fs::path> &skip) {
  return std::find(skip.begin(), skip.end(), path) != skip.end();
}

void ls_dir(const fs::path dir, walk_ctx_t &ctx) {
  if (ctx.err.failed()) {
    return;
  }
  std::vector<file_record_t> batch;
  try {
    for (const auto &dir_entry : fs::directory_iterator(dir)) {
      const auto &path = dir_entry.path();
      std::error_code ec;

      if (is_excluded(path, ctx.opts.exclude, ctx.cwd) ||
          is_skipped(path, ctx.opts.skip)) {
        // exclude, skip before touching it
        log_line(lvl_t::log) << "exclude: " << path << '\n';

      } else if (dir_entry.is_symlink(ec)) {
        // symlink, skip
        log_line(lvl_t::warn) << "skip symlink: " << path << '\n';

      } else if (dir_entry.is_directory(ec)) {
        // directory, recursive call when asked to
        if (ctx.opts.recursive) {
          ba::post(ctx.pool, std::bind(ls_dir, path, std::ref(ctx)));
        }

      } else if (dir_entry.is_regular_file(ec)) {
        // regular file, stat and quick hash
        try {
          batch.emplace_back(make_record(path, ctx.opts.known));
          ctx.progress.file_scanned();
        } catch (const file_read_error &e) {
          log_line(lvl_t::warn) << "skip file: " << path << " - "
                                << e.code().message() << '\n';
        }

      } else if (ec) {
        // error reading file type, skip
        log_line(lvl_t::warn) << "skip file: " << path << " - "
                              << ec.message() << '\n';

      } else {
        // other file type, skip
        log_line(lvl_t::warn) << "skip unsupported file: " << path << '\n';
      }
    }
  } catch (const fs::filesystem_error &e) {
    // error iterate directory, skip subtree, keep what was listed
    log_line(lvl_t::warn) << "skip directory: " << dir << " - "
                          << e.code().message() << '\n';
  } catch (const std::exception &) {
    // progress callback or digest setup failed, abort the walk
    ctx.err.capture(std::current_exception());
    return;
  }

  if (!batch.empty()) {
    try {
      ctx.sink(std::move(batch));
    } catch (const std::exception &) {
      ctx.err.capture(std::current_exception());
    }
  }
}

}  // namespace

bool is_excluded(const fs::path &path, const std::vector<std::string> &exclude,
                 const fs::path &cwd) {
  if (exclude.empty()) {
    return false;
  }
  const auto rel = path.lexically_relative(cwd).string();
  const auto name = path.filename().string();
  for (const auto &pattern : exclude) {
    if (fnmatch(pattern.c_str(), rel.c_str(), 0) == 0 ||
        fnmatch(pattern.c_str(), name.c_str(), 0) == 0) {
      return true;
    }
  }
  return false;
}

file_record_t make_record(
    const fs::path &path,
    const std::unordered_map<std::string, file_record_t> *known) {
  struct statx stx {};
  if (statx(AT_FDCWD, path.c_str(), AT_SYMLINK_NOFOLLOW,
            STATX_BASIC_STATS | STATX_BTIME, &stx) != 0) {
    throw file_read_error(path, {errno, std::generic_category()});
  }
  if (!S_ISREG(stx.stx_mode)) {
    throw file_read_error(path,
                          std::make_error_code(std::errc::invalid_argument));
  }

  file_record_t rec;
  rec.path = path;
  rec.name = path.filename().string();
  rec.size = stx.stx_size;
  rec.modified = to_time(stx.stx_mtime);
  // birth time is not reported by every filesystem
  rec.created = (stx.stx_mask & STATX_BTIME) ? to_time(stx.stx_btime)
                                             : to_time(stx.stx_ctime);

  if (known != nullptr) {
    auto it = known->find(path.native());
    if (it != known->end() && it->second.size == rec.size &&
        it->second.modified == rec.modified) {
      return it->second;
    }
  }
  rec.quick_hash = quick_digest(path);
  return rec;
}

void walk(const fs::path &root, const walk_opts_t &opts, progress_t &progress,
          const batch_sink_t &sink) {
  ba::thread_pool pool(std::max(1U, opts.max_thread));
  walk_ctx_t ctx(opts, progress, sink, pool);
  ba::post(pool, std::bind(ls_dir, root, std::ref(ctx)));
  pool.join();
  ctx.err.rethrow_if_failed();
}

std::vector<file_record_t> walk(const fs::path &root, const walk_opts_t &opts,
                                progress_t &progress) {
  std::vector<file_record_t> records;
  std::mutex mtx;
  walk(root, opts, progress, [&](std::vector<file_record_t> &&batch) {
    std::lock_guard lk(mtx);
    records.insert(records.end(), std::make_move_iterator(batch.begin()),
                   std::make_move_iterator(batch.end()));
  });
  return records;
}

}  // namespace detail_v1

}  // namespace dupscan
