#include "walker.hh"

#include <sys/stat.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "errors.hh"
#include "hasher.hh"
#include "log.hh"
#include "tmp_dir.hh"

namespace dupscan {

namespace {

namespace fs = std::filesystem;

std::set<std::string> names(const std::vector<file_record_t> &records) {
  std::set<std::string> out;
  for (const auto &rec : records) {
    out.insert(rec.name);
  }
  return out;
}

class WalkerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    set_quiet(true);
    dir.write("a.txt", "hello");
    dir.write("b.log", "hello");
    dir.write("sub/c.txt", "world");
    dir.write("sub/deep/d.txt", "world");
  }
  test::tmp_dir_t dir;
};

TEST_F(WalkerTest, NonRecursiveSkipsSubdirectories) {
  walk_opts_t opts;
  progress_t progress;
  auto records = walk(dir.path(), opts, progress);
  EXPECT_EQ(names(records), (std::set<std::string>{"a.txt", "b.log"}));
  EXPECT_EQ(progress.files_scanned(), 2U);
}

TEST_F(WalkerTest, RecursiveListsEverything) {
  walk_opts_t opts;
  opts.recursive = true;
  progress_t progress;
  auto records = walk(dir.path(), opts, progress);
  EXPECT_EQ(records.size(), 4U);
  EXPECT_EQ(progress.files_scanned(), 4U);
  for (const auto &rec : records) {
    EXPECT_TRUE(rec.path.is_absolute());
    EXPECT_EQ(rec.name, rec.path.filename().string());
    EXPECT_EQ(rec.quick_hash, quick_digest(rec.path));
    EXPECT_FALSE(rec.full_hash);
    EXPECT_FALSE(rec.id);
  }
}

TEST_F(WalkerTest, ExcludeByNameAndDirectory) {
  walk_opts_t opts;
  opts.recursive = true;
  opts.exclude = {"*.log", "deep"};
  progress_t progress;
  auto records = walk(dir.path(), opts, progress);
  EXPECT_EQ(names(records), (std::set<std::string>{"a.txt", "c.txt"}));
}

TEST_F(WalkerTest, ExcludeRelativeToWorkingDirectory) {
  const auto cwd = dir.path();
  EXPECT_TRUE(is_excluded(cwd / "sub" / "c.txt", {"sub/*"}, cwd));
  EXPECT_TRUE(is_excluded(cwd / "sub" / "c.txt", {"c.*"}, cwd));
  EXPECT_FALSE(is_excluded(cwd / "a.txt", {"sub/*"}, cwd));
  EXPECT_FALSE(is_excluded(cwd / "a.txt", {}, cwd));
}

TEST_F(WalkerTest, SkipsSymlinksAndSpecialFiles) {
  fs::create_symlink(dir.path() / "a.txt", dir.path() / "link.txt");
  fs::create_directory_symlink(dir.path() / "sub", dir.path() / "sublink");
  ASSERT_EQ(mkfifo((dir.path() / "fifo").c_str(), 0600), 0);

  walk_opts_t opts;
  opts.recursive = true;
  progress_t progress;
  auto records = walk(dir.path(), opts, progress);
  EXPECT_EQ(records.size(), 4U);
  for (const auto &rec : records) {
    EXPECT_NE(rec.name, "link.txt");
    EXPECT_NE(rec.name, "fifo");
  }
}

TEST_F(WalkerTest, SkipExactPaths) {
  dir.write(".dupscan.0badcafe", "index");
  dir.write(".dupscan.0badcafe-journal", "journal");
  walk_opts_t opts;
  opts.skip = {dir.path() / ".dupscan.0badcafe",
               dir.path() / ".dupscan.0badcafe-journal"};
  progress_t progress;
  auto records = walk(dir.path(), opts, progress);
  EXPECT_EQ(names(records), (std::set<std::string>{"a.txt", "b.log"}));
}

TEST_F(WalkerTest, SkipDoesNotMatchNamePrefix) {
  dir.write("index", "index");
  dir.write("index.html", "page");
  dir.write("index_copy.html", "page");
  dir.write("indexes/x", "page");
  walk_opts_t opts;
  opts.recursive = true;
  opts.skip = {dir.path() / "index", dir.path() / "index-journal"};
  progress_t progress;
  auto records = walk(dir.path(), opts, progress);
  auto found = names(records);
  EXPECT_FALSE(found.contains("index"));
  EXPECT_TRUE(found.contains("index.html"));
  EXPECT_TRUE(found.contains("index_copy.html"));
  EXPECT_TRUE(found.contains("x"));
}

TEST_F(WalkerTest, UnreadableDirectoryIsSkipped) {
  if (geteuid() == 0) {
    GTEST_SKIP() << "permissions are not enforced for root";
  }
  dir.write("locked/hidden.txt", "hidden");
  dir.write("open/e.txt", "visible");
  fs::permissions(dir.path() / "locked", fs::perms::none);

  walk_opts_t opts;
  opts.recursive = true;
  progress_t progress;
  std::vector<file_record_t> records;
  EXPECT_NO_THROW(records = walk(dir.path(), opts, progress));
  fs::permissions(dir.path() / "locked", fs::perms::owner_all);

  EXPECT_EQ(names(records),
            (std::set<std::string>{"a.txt", "b.log", "c.txt", "d.txt",
                                   "e.txt"}));
}

TEST_F(WalkerTest, KnownRecordReusedWhenUnchanged) {
  auto known_rec = make_record(dir.path() / "a.txt");
  known_rec.quick_hash = "from-index";
  known_rec.id = 42;
  std::unordered_map<std::string, file_record_t> known{
      {known_rec.path.native(), known_rec}};

  auto rec = make_record(dir.path() / "a.txt", &known);
  EXPECT_EQ(rec.quick_hash, "from-index");
  EXPECT_EQ(rec.id, 42);

  // a size change means the file is stat'ed and hashed again
  dir.write("a.txt", "hello again");
  rec = make_record(dir.path() / "a.txt", &known);
  EXPECT_EQ(rec.quick_hash, quick_digest(dir.path() / "a.txt"));
  EXPECT_FALSE(rec.id);
}

TEST_F(WalkerTest, MakeRecordRejectsMissingFile) {
  EXPECT_THROW(make_record(dir.path() / "missing"), file_read_error);
}

TEST_F(WalkerTest, BatchesArePerDirectory) {
  walk_opts_t opts;
  opts.recursive = true;
  opts.max_thread = 3;
  progress_t progress;
  std::atomic<int> batches{0};
  walk(dir.path(), opts, progress, [&](std::vector<file_record_t> &&batch) {
    ++batches;
    auto parent = batch.front().path.parent_path();
    for (const auto &rec : batch) {
      EXPECT_EQ(rec.path.parent_path(), parent);
    }
  });
  EXPECT_EQ(batches, 3);
}

TEST_F(WalkerTest, SinkFailureIsRethrown) {
  walk_opts_t opts;
  opts.recursive = true;
  progress_t progress;
  EXPECT_THROW(walk(dir.path(), opts, progress,
                    [](std::vector<file_record_t> &&) {
                      throw std::runtime_error("sink failed");
                    }),
               std::runtime_error);
}

}  // namespace

}  // namespace dupscan
