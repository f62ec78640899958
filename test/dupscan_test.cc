#include "dupscan.hh"

#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>
#include <string>

#include "errors.hh"
#include "hasher.hh"
#include "log.hh"
#include "manager.hh"
#include "scan_index.hh"
#include "tmp_dir.hh"
#include "walker.hh"

namespace dupscan {

namespace {

namespace fs = std::filesystem;

using path_sets_t = std::set<std::set<std::string>>;

path_sets_t path_sets(const std::vector<dupe_group_t> &groups) {
  path_sets_t out;
  for (const auto &group : groups) {
    std::set<std::string> paths;
    for (const auto &rec : group) {
      paths.insert(rec.path.string());
    }
    out.insert(std::move(paths));
  }
  return out;
}

std::vector<std::vector<std::string>> shape(
    const std::vector<dupe_group_t> &groups) {
  std::vector<std::vector<std::string>> out;
  for (const auto &group : groups) {
    auto &paths = out.emplace_back();
    for (const auto &rec : group) {
      paths.push_back(rec.path.string());
    }
  }
  return out;
}

class DupscanTest : public ::testing::Test {
 protected:
  void SetUp() override { set_quiet(true); }

  scan_opts_t opts(bool recursive = false) {
    scan_opts_t o;
    o.root = dir.path();
    o.recursive = recursive;
    return o;
  }

  test::tmp_dir_t dir;
};

TEST_F(DupscanTest, TwoEqualOneUnique) {
  dir.write("a.txt", "hello");
  dir.write("b.txt", "hello");
  dir.write("c.txt", "world");
  auto result = scan(opts());

  ASSERT_EQ(result.groups.size(), 1U);
  ASSERT_EQ(result.groups[0].size(), 2U);
  EXPECT_EQ(result.groups[0][0].name, "a.txt");
  EXPECT_EQ(result.groups[0][1].name, "b.txt");
  EXPECT_EQ(result.files_scanned, 3U);
  EXPECT_FALSE(result.scan_id);
  EXPECT_TRUE(result.index_path.empty());
}

TEST_F(DupscanTest, EmptyDirectory) {
  auto result = scan(opts());
  EXPECT_TRUE(result.groups.empty());
  EXPECT_EQ(result.files_scanned, 0U);
}

TEST_F(DupscanTest, RecursionDecidesSubdirectoryDuplicates) {
  dir.write("top.txt", "same content");
  dir.write("sub/copy.txt", "same content");
  EXPECT_TRUE(scan(opts(false)).groups.empty());

  auto result = scan(opts(true));
  ASSERT_EQ(result.groups.size(), 1U);
  EXPECT_EQ(result.groups[0].size(), 2U);
}

TEST_F(DupscanTest, LargeFilesFullyHashed) {
  std::string content;
  content.reserve(5UL * 1024 * 1024);
  for (auto i = 0UL; i < 5UL * 1024 * 1024; ++i) {
    content.push_back((char)(i * 7 % 253));
  }
  auto a = dir.write("a.bin", content);
  auto b = dir.write("b.bin", content);
  auto result = scan(opts());

  ASSERT_EQ(result.groups.size(), 1U);
  ASSERT_EQ(result.groups[0].size(), 2U);
  const auto full = full_digest(a);
  hasher_t hasher(digest_name);
  hasher.update(content.data(), quick_digest_sz);
  const auto quick = hasher.hex_digest();
  for (const auto &rec : result.groups[0]) {
    EXPECT_EQ(rec.full_hash, full);
    EXPECT_EQ(rec.quick_hash, quick);
    EXPECT_NE(rec.quick_hash, *rec.full_hash);
  }
}

TEST_F(DupscanTest, EveryGroupSharesContent) {
  dir.write("x1", "one");
  dir.write("x2", "one");
  dir.write("x3", "one");
  dir.write("y1", "two");
  dir.write("y2", "two");
  dir.write("z", "three");
  dir.write("e1", "");
  dir.write("e2", "");
  for (const auto &group : scan(opts()).groups) {
    ASSERT_GE(group.size(), 2U);
    for (const auto &rec : group) {
      EXPECT_EQ(full_digest(rec.path), full_digest(group.front().path));
    }
  }
}

TEST_F(DupscanTest, OutOfScopeNeverGrouped) {
  dir.write("a.txt", "dup");
  dir.write("b.log", "dup");
  dir.write("sub/c.txt", "dup");
  fs::create_symlink(dir.path() / "a.txt", dir.path() / "link.txt");

  auto o = opts(false);
  o.exclude = {"*.log"};
  auto result = scan(o);
  EXPECT_TRUE(result.groups.empty());

  o.recursive = true;
  result = scan(o);
  ASSERT_EQ(result.groups.size(), 1U);
  EXPECT_EQ(path_sets(result.groups),
            (path_sets_t{{(dir.path() / "a.txt").string(),
                          (dir.path() / "sub/c.txt").string()}}));
}

TEST_F(DupscanTest, Idempotent) {
  dir.write("a", "alpha");
  dir.write("b", "alpha");
  dir.write("d/c", "alpha");
  dir.write("d/e", "beta");
  dir.write("f", "beta");
  auto o = opts(true);
  o.max_thread = 1;
  auto first = scan(o);
  o.max_thread = 8;
  auto second = scan(o);
  EXPECT_EQ(shape(first.groups), shape(second.groups));
  EXPECT_EQ(path_sets(first.groups), path_sets(second.groups));
}

TEST_F(DupscanTest, MissingRootThrows) {
  auto o = opts();
  o.root = dir.path() / "missing";
  EXPECT_THROW(scan(o), scan_error);

  o.root = dir.write("file", "not a directory");
  EXPECT_THROW(scan(o), scan_error);
}

TEST_F(DupscanTest, ProgressIsReported) {
  dir.write("a", "hello");
  dir.write("b", "hello");
  dir.write("c", "world");
  uint64_t last_files = 0;
  uint64_t last_groups = 0;
  bool saw_hashing = false;
  scan(opts(), [&](uint64_t files, uint64_t groups, phase_t phase) {
    last_files = files;
    last_groups = groups;
    saw_hashing |= phase == phase_t::hashing;
  });
  EXPECT_EQ(last_files, 3U);
  EXPECT_EQ(last_groups, 1U);
  EXPECT_TRUE(saw_hashing);
}

class DupscanIndexTest : public DupscanTest {
 protected:
  scan_opts_t indexed(bool recursive = true) {
    auto o = opts(recursive);
    o.index_path = index_dir.path() / "index.db";
    return o;
  }

  test::tmp_dir_t index_dir;
};

TEST_F(DupscanIndexTest, IndexMatchesInMemoryResult) {
  dir.write("a", "alpha");
  dir.write("b", "alpha");
  dir.write("d/c", "alpha");
  dir.write("d/e", "bigger beta");
  dir.write("f", "bigger beta");
  dir.write("g", "unique");
  auto result = scan(indexed());
  ASSERT_TRUE(result.scan_id);
  EXPECT_EQ(result.index_path, index_dir.path() / "index.db");

  scan_index_t index(result.index_path);
  EXPECT_EQ(shape(index.get_duplicate_groups(*result.scan_id)),
            shape(result.groups));
  EXPECT_EQ(shape(result.groups), shape(scan(opts(true)).groups));

  auto info = index.get_scan_info(*result.scan_id);
  ASSERT_TRUE(info);
  EXPECT_TRUE(info->complete());
  EXPECT_EQ(info->base_directory, dir.path());
  EXPECT_EQ(info->files_scanned, 6U);
  EXPECT_EQ(info->groups_found, 2U);
  EXPECT_EQ(index.get_files(*result.scan_id).size(), 6U);
}

TEST_F(DupscanIndexTest, IndexInsideRootIsNotScanned) {
  dir.write("a", "alpha");
  dir.write("b", "alpha");
  auto o = opts();
  o.index_path = scan_index_t::generate_index_path(dir.path());
  auto result = scan(o);
  EXPECT_EQ(result.files_scanned, 2U);
  EXPECT_TRUE(fs::exists(o.index_path));

  // a second session in the same file still ignores it
  result = scan(o);
  EXPECT_EQ(result.files_scanned, 2U);
  ASSERT_EQ(result.groups.size(), 1U);
}

TEST_F(DupscanIndexTest, FilesNamedLikeIndexAreScanned) {
  dir.write("index.html", "page");
  dir.write("index_copy.html", "page");
  dir.write("indexes/x", "page");
  auto o = opts(true);
  o.index_path = dir.path() / "index";
  auto result = scan(o);
  EXPECT_EQ(result.files_scanned, 3U);
  ASSERT_EQ(result.groups.size(), 1U);
  EXPECT_EQ(result.groups[0].size(), 3U);
}

TEST_F(DupscanIndexTest, ResumeNeedsIndex) {
  dir.write("a", "alpha");
  auto o = opts();
  o.resume = true;
  EXPECT_THROW(scan(o), std::invalid_argument);
}

TEST_F(DupscanIndexTest, DeleteRemovesFromGroups) {
  auto a = dir.write("a", "pair");
  dir.write("b", "pair");
  dir.write("c", "triple");
  dir.write("d", "triple");
  dir.write("e", "triple");
  auto result = scan(indexed());
  scan_index_t index(result.index_path);
  manager_t mgr(index, *result.scan_id);
  ASSERT_EQ(mgr.groups().size(), 2U);

  mgr.delete_file(a);
  EXPECT_FALSE(fs::exists(a));
  auto groups = mgr.groups();
  ASSERT_EQ(groups.size(), 1U);
  EXPECT_EQ(groups[0].size(), 3U);
  for (const auto &rec : groups[0]) {
    EXPECT_NE(rec.path, a);
  }
}

TEST_F(DupscanIndexTest, ResumeReusesRowsWithoutDuplicates) {
  dir.write("a", "alpha");
  dir.write("b", "alpha");
  auto gone = dir.write("gone", "soon removed");
  auto o = indexed();

  // an interrupted session: rows recorded, never completed
  scan_index_t index(o.index_path);
  auto interrupted = index.start_scan(dir.path());
  std::map<std::string, int64_t> ids;
  for (const auto *name : {"a", "b", "gone"}) {
    ids[name] = index.add_file(interrupted, make_record(dir.path() / name));
  }
  fs::remove(gone);
  dir.write("c", "alpha");

  o.resume = true;
  auto result = scan(o);
  ASSERT_EQ(result.scan_id, interrupted);

  auto files = index.get_files(interrupted);
  std::set<std::string> paths;
  for (const auto &rec : files) {
    paths.insert(rec.path.filename().string());
  }
  EXPECT_EQ(files.size(), 3U);
  EXPECT_EQ(paths, (std::set<std::string>{"a", "b", "c"}));
  // unchanged files kept their rows
  for (const auto &rec : files) {
    if (rec.name != "c") {
      EXPECT_EQ(rec.id, ids[rec.name]);
    }
  }
  ASSERT_EQ(result.groups.size(), 1U);
  EXPECT_EQ(result.groups[0].size(), 3U);
  EXPECT_TRUE(index.get_scan_info(interrupted)->complete());
  EXPECT_EQ(shape(index.get_duplicate_groups(interrupted)),
            shape(result.groups));
}

TEST_F(DupscanIndexTest, ResumeWithoutIncompleteStartsNewSession) {
  dir.write("a", "alpha");
  dir.write("b", "alpha");
  auto o = indexed();
  auto first = scan(o);
  o.resume = true;
  auto second = scan(o);
  ASSERT_TRUE(first.scan_id);
  ASSERT_TRUE(second.scan_id);
  EXPECT_NE(*first.scan_id, *second.scan_id);

  scan_index_t index(o.index_path);
  EXPECT_EQ(index.get_files(*second.scan_id).size(), 2U);
}

TEST_F(DupscanIndexTest, CorruptIndexThrows) {
  dir.write("a", "alpha");
  auto o = indexed();
  index_dir.write("index.db", std::string(4096, 'z'));
  EXPECT_THROW(scan(o), index_error);
}

}  // namespace

}  // namespace dupscan
