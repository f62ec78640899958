#include "scan_index.hh"

#include <sqlite3.h>

#include <openssl/rand.h>

#include <chrono>
#include <string>

#include "config.hh"
#include "errors.hh"
#include "hasher.hh"
#include "log.hh"

namespace dupscan {

inline namespace detail_v1 {

namespace fs = std::filesystem;
namespace cn = std::chrono;

namespace {

constexpr auto schema_sql = R"sql(
CREATE TABLE IF NOT EXISTS scan_info (
    id INTEGER PRIMARY KEY,
    base_directory TEXT NOT NULL,
    start_time INTEGER NOT NULL,
    end_time INTEGER,
    files_scanned INTEGER DEFAULT 0,
    groups_found INTEGER DEFAULT 0
);

CREATE TABLE IF NOT EXISTS files (
    id INTEGER PRIMARY KEY,
    scan_id INTEGER,
    path TEXT NOT NULL,
    size INTEGER NOT NULL,
    created INTEGER NOT NULL,
    modified INTEGER NOT NULL,
    quick_hash TEXT NOT NULL,
    full_hash TEXT,
    group_id TEXT,
    FOREIGN KEY(scan_id) REFERENCES scan_info(id)
);

CREATE INDEX IF NOT EXISTS idx_files_group_id ON files(group_id);
CREATE INDEX IF NOT EXISTS idx_files_scan_id ON files(scan_id);
CREATE INDEX IF NOT EXISTS idx_files_path ON files(path);
)sql";

constexpr auto file_columns =
    "id, path, size, created, modified, quick_hash, full_hash";

int64_t to_ms(const file_time_t t) noexcept {
  return cn::duration_cast<cn::milliseconds>(t.time_since_epoch()).count();
}

file_time_t from_ms(const int64_t ms) noexcept {
  return file_time_t(cn::milliseconds(ms));
}

int64_t now_ms() noexcept { return to_ms(cn::system_clock::now()); }

// RAII wrapper for a prepared statement
class stmt_t {
  sqlite3 *_db;
  sqlite3_stmt *_stmt = nullptr;

  void check(const int rc) {
    if (rc != SQLITE_OK) {
      throw index_error(std::string("sqlite: ") + sqlite3_errmsg(_db));
    }
  }

 public:
  stmt_t(sqlite3 *db, const char *sql) : _db(db) {
    check(sqlite3_prepare_v2(_db, sql, -1, &_stmt, nullptr));
  }
  ~stmt_t() noexcept { sqlite3_finalize(_stmt); }

  stmt_t(const stmt_t &) = delete;
  stmt_t &operator=(const stmt_t &) = delete;

  stmt_t &bind_int(const int idx, const int64_t val) {
    check(sqlite3_bind_int64(_stmt, idx, val));
    return *this;
  }
  stmt_t &bind_text(const int idx, const std::string &val) {
    check(sqlite3_bind_text(_stmt, idx, val.c_str(), (int)val.size(),
                            SQLITE_TRANSIENT));
    return *this;
  }
  stmt_t &bind_text(const int idx, const std::optional<std::string> &val) {
    if (!val) {
      check(sqlite3_bind_null(_stmt, idx));
      return *this;
    }
    return bind_text(idx, *val);
  }

  // true while a row is available
  bool step() {
    const auto rc = sqlite3_step(_stmt);
    if (rc == SQLITE_ROW) {
      return true;
    }
    if (rc != SQLITE_DONE) {
      throw index_error(std::string("sqlite: ") + sqlite3_errmsg(_db));
    }
    return false;
  }
  // run to completion, number of rows changed
  int run() {
    while (step()) {
    }
    return sqlite3_changes(_db);
  }

  bool is_null(const int col) const {
    return sqlite3_column_type(_stmt, col) == SQLITE_NULL;
  }
  int64_t col_int(const int col) const {
    return sqlite3_column_int64(_stmt, col);
  }
  std::string col_text(const int col) const {
    auto text = sqlite3_column_text(_stmt, col);
    if (text == nullptr) {
      return {};
    }
    return {reinterpret_cast<const char *>(text),
            (std::size_t)sqlite3_column_bytes(_stmt, col)};
  }
  std::optional<std::string> col_opt_text(const int col) const {
    if (is_null(col)) {
      return std::nullopt;
    }
    return col_text(col);
  }
};

// columns as listed in file_columns
file_record_t read_file(const stmt_t &stmt) {
  file_record_t rec;
  rec.id = stmt.col_int(0);
  rec.path = stmt.col_text(1);
  rec.name = rec.path.filename().string();
  rec.size = (uint64_t)stmt.col_int(2);
  rec.created = from_ms(stmt.col_int(3));
  rec.modified = from_ms(stmt.col_int(4));
  rec.quick_hash = stmt.col_text(5);
  rec.full_hash = stmt.col_opt_text(6);
  return rec;
}

scan_info_t read_info(const stmt_t &stmt) {
  scan_info_t info;
  info.id = stmt.col_int(0);
  info.base_directory = stmt.col_text(1);
  info.start_time = from_ms(stmt.col_int(2));
  if (!stmt.is_null(3)) {
    info.end_time = from_ms(stmt.col_int(3));
  }
  info.files_scanned = (uint64_t)stmt.col_int(4);
  info.groups_found = (uint64_t)stmt.col_int(5);
  return info;
}

}  // namespace

scan_index_t::scan_index_t(const fs::path &db_path) : _path(db_path) {
  const auto rc =
      sqlite3_open_v2(_path.c_str(), &_db,
                      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = _db != nullptr ? sqlite3_errmsg(_db) : "out of memory";
    sqlite3_close(_db);
    _db = nullptr;
    throw index_error("cannot open index " + _path.string() + ": " + msg);
  }
  try {
    exec(schema_sql);
  } catch (const index_error &e) {
    sqlite3_close(_db);
    _db = nullptr;
    throw index_error("invalid or corrupted index " + _path.string() + ": " +
                      e.what());
  }
}

scan_index_t::~scan_index_t() noexcept {
  if (_db != nullptr) {
    sqlite3_close(_db);
  }
}

void scan_index_t::exec(const char *sql) {
  char *err = nullptr;
  if (sqlite3_exec(_db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err != nullptr ? err : sqlite3_errmsg(_db);
    sqlite3_free(err);
    throw index_error("sqlite: " + msg);
  }
}

int64_t scan_index_t::start_scan(const fs::path &base_directory) {
  stmt_t(_db, "INSERT INTO scan_info (base_directory, start_time) VALUES (?, ?)")
      .bind_text(1, base_directory.string())
      .bind_int(2, now_ms())
      .run();
  return sqlite3_last_insert_rowid(_db);
}

void scan_index_t::update_progress(const int64_t scan_id,
                                   const uint64_t files_scanned,
                                   const uint64_t groups_found) {
  stmt_t(_db,
         "UPDATE scan_info SET files_scanned = ?, groups_found = ? "
         "WHERE id = ?")
      .bind_int(1, (int64_t)files_scanned)
      .bind_int(2, (int64_t)groups_found)
      .bind_int(3, scan_id)
      .run();
}

void scan_index_t::complete_scan(const int64_t scan_id) {
  stmt_t(_db, "UPDATE scan_info SET end_time = ? WHERE id = ?")
      .bind_int(1, now_ms())
      .bind_int(2, scan_id)
      .run();
}

std::optional<scan_info_t> scan_index_t::get_scan_info(const int64_t scan_id) {
  stmt_t stmt(_db,
              "SELECT id, base_directory, start_time, end_time, "
              "files_scanned, groups_found FROM scan_info WHERE id = ?");
  stmt.bind_int(1, scan_id);
  if (!stmt.step()) {
    return std::nullopt;
  }
  return read_info(stmt);
}

std::optional<int64_t> scan_index_t::latest_scan_id() {
  stmt_t stmt(_db, "SELECT MAX(id) FROM scan_info");
  if (!stmt.step() || stmt.is_null(0)) {
    return std::nullopt;
  }
  return stmt.col_int(0);
}

std::optional<scan_info_t> scan_index_t::latest_incomplete(
    const fs::path &base_directory) {
  stmt_t stmt(_db,
              "SELECT id, base_directory, start_time, end_time, "
              "files_scanned, groups_found FROM scan_info "
              "WHERE base_directory = ? AND end_time IS NULL "
              "ORDER BY id DESC LIMIT 1");
  stmt.bind_text(1, base_directory.string());
  if (!stmt.step()) {
    return std::nullopt;
  }
  return read_info(stmt);
}

int64_t scan_index_t::add_file(const int64_t scan_id,
                               const file_record_t &rec) {
  stmt_t(_db,
         "INSERT INTO files (scan_id, path, size, created, modified, "
         "quick_hash, full_hash, group_id) VALUES (?, ?, ?, ?, ?, ?, ?, ?)")
      .bind_int(1, scan_id)
      .bind_text(2, rec.path.string())
      .bind_int(3, (int64_t)rec.size)
      .bind_int(4, to_ms(rec.created))
      .bind_int(5, to_ms(rec.modified))
      .bind_text(6, rec.quick_hash)
      .bind_text(7, rec.full_hash)
      .bind_text(8, std::optional<std::string>{})
      .run();
  return sqlite3_last_insert_rowid(_db);
}

void scan_index_t::update_file_hash(const int64_t file_id,
                                    const std::string &full_hash,
                                    const std::string &group_id) {
  stmt_t(_db, "UPDATE files SET full_hash = ?, group_id = ? WHERE id = ?")
      .bind_text(1, full_hash)
      .bind_text(2, group_id)
      .bind_int(3, file_id)
      .run();
}

std::vector<file_record_t> scan_index_t::get_files(const int64_t scan_id) {
  const auto sql = std::string("SELECT ") + file_columns +
                   " FROM files WHERE scan_id = ? ORDER BY id";
  stmt_t stmt(_db, sql.c_str());
  stmt.bind_int(1, scan_id);
  std::vector<file_record_t> records;
  while (stmt.step()) {
    records.emplace_back(read_file(stmt));
  }
  return records;
}

bool scan_index_t::has_file(const int64_t scan_id, const fs::path &path) {
  stmt_t stmt(_db,
              "SELECT 1 FROM files WHERE scan_id = ? AND path = ? LIMIT 1");
  stmt.bind_int(1, scan_id).bind_text(2, path.string());
  return stmt.step();
}

void scan_index_t::reset_hashes(const int64_t scan_id) {
  stmt_t(_db,
         "UPDATE files SET full_hash = NULL, group_id = NULL WHERE scan_id = ?")
      .bind_int(1, scan_id)
      .run();
}

std::vector<dupe_group_t> scan_index_t::get_duplicate_groups(
    const int64_t scan_id) {
  stmt_t stmt(_db, R"sql(
      WITH dup AS (
          SELECT group_id, MIN(path) AS first_path
          FROM files
          WHERE scan_id = ?1 AND group_id IS NOT NULL
          GROUP BY group_id
          HAVING COUNT(*) > 1
      )
      SELECT f.id, f.path, f.size, f.created, f.modified, f.quick_hash,
             f.full_hash, f.group_id
      FROM files f JOIN dup d ON f.group_id = d.group_id
      WHERE f.scan_id = ?1
      ORDER BY f.size DESC, d.first_path, f.group_id, f.path, f.id
  )sql");
  stmt.bind_int(1, scan_id);

  std::vector<dupe_group_t> dupe_list;
  std::string cur_group;
  while (stmt.step()) {
    auto group_id = stmt.col_text(7);
    if (dupe_list.empty() || group_id != cur_group) {
      dupe_list.emplace_back();
      cur_group = std::move(group_id);
    }
    dupe_list.back().emplace_back(read_file(stmt));
  }
  return dupe_list;
}

bool scan_index_t::delete_file(const fs::path &path) {
  return stmt_t(_db, "DELETE FROM files WHERE path = ?")
             .bind_text(1, path.string())
             .run() > 0;
}

void scan_index_t::delete_file_id(const int64_t file_id) {
  stmt_t(_db, "DELETE FROM files WHERE id = ?").bind_int(1, file_id).run();
}

bool scan_index_t::update_file_path(const fs::path &old_path,
                                    const fs::path &new_path) {
  return stmt_t(_db, "UPDATE files SET path = ? WHERE path = ?")
             .bind_text(1, new_path.string())
             .bind_text(2, old_path.string())
             .run() > 0;
}

scan_index_t::transaction_t::transaction_t(scan_index_t &idx) : _idx(idx) {
  _idx.exec("BEGIN");
}

scan_index_t::transaction_t::~transaction_t() noexcept {
  if (_done) {
    return;
  }
  try {
    _idx.exec("ROLLBACK");
  } catch (const index_error &e) {
    log_line(lvl_t::err) << "index rollback failed: " << e.what() << '\n';
  }
}

void scan_index_t::transaction_t::commit() {
  _idx.exec("COMMIT");
  _done = true;
}

fs::path scan_index_t::generate_index_path(const fs::path &base_dir) {
  unsigned char rnd[4];
  if (RAND_bytes(rnd, sizeof(rnd)) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return base_dir / (index_prefix + to_hex(rnd, sizeof(rnd)));
}

}  // namespace detail_v1

}  // namespace dupscan
