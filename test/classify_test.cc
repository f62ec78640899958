#include "classify.hh"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>

#include "hasher.hh"
#include "log.hh"
#include "tmp_dir.hh"
#include "walker.hh"

namespace dupscan {

namespace {

namespace fs = std::filesystem;

class ClassifyTest : public ::testing::Test {
 protected:
  void SetUp() override { set_quiet(true); }

  // records in path order, the engine's discovery order
  std::vector<file_record_t> records() {
    walk_opts_t opts;
    opts.recursive = true;
    progress_t progress;
    auto out = walk(dir.path(), opts, progress);
    std::sort(out.begin(), out.end(), [](const auto &lhs, const auto &rhs) {
      return lhs.path.native() < rhs.path.native();
    });
    return out;
  }

  const file_record_t &find(const std::vector<file_record_t> &recs,
                            const std::string &name) {
    return *std::find_if(recs.begin(), recs.end(),
                         [&](const auto &rec) { return rec.name == name; });
  }

  test::tmp_dir_t dir;
};

TEST_F(ClassifyTest, NoRecords) {
  std::vector<file_record_t> recs;
  progress_t progress;
  EXPECT_TRUE(classify(recs, progress).empty());
  EXPECT_EQ(progress.groups_found(), 0U);
}

TEST_F(ClassifyTest, GroupsShareFullDigest) {
  dir.write("a.txt", "hello");
  dir.write("b.txt", "hello");
  dir.write("c.txt", "world");
  dir.write("d/e.txt", "hello");
  auto recs = records();
  progress_t progress;
  auto groups = classify(recs, progress);

  ASSERT_EQ(groups.size(), 1U);
  ASSERT_EQ(groups[0].size(), 3U);
  EXPECT_EQ(progress.groups_found(), 1U);
  for (const auto &rec : groups[0]) {
    ASSERT_TRUE(rec.full_hash);
    EXPECT_EQ(*rec.full_hash, full_digest(rec.path));
    EXPECT_EQ(*rec.full_hash, *groups[0][0].full_hash);
  }
  // members in discovery order
  EXPECT_EQ(groups[0][0].name, "a.txt");
  EXPECT_EQ(groups[0][1].name, "b.txt");
  EXPECT_EQ(groups[0][2].name, "e.txt");
}

TEST_F(ClassifyTest, DifferentSizesNeverGrouped) {
  dir.write("a", "hello");
  dir.write("b", "hello!");
  auto recs = records();
  progress_t progress;
  EXPECT_TRUE(classify(recs, progress).empty());
  for (const auto &rec : recs) {
    EXPECT_FALSE(rec.full_hash);
  }
}

TEST_F(ClassifyTest, SameSizeDifferentQuickHashNotFullyHashed) {
  dir.write("a", "hello");
  dir.write("b", "world");
  auto recs = records();
  progress_t progress;
  EXPECT_TRUE(classify(recs, progress).empty());
  for (const auto &rec : recs) {
    EXPECT_FALSE(rec.full_hash);
  }
}

TEST_F(ClassifyTest, SameQuickHashDifferentTail) {
  std::string head(quick_digest_sz, 'q');
  dir.write("a", head + "tail-1");
  dir.write("b", head + "tail-2");
  auto recs = records();
  progress_t progress;
  EXPECT_TRUE(classify(recs, progress).empty());
  // the candidates were promoted, then split by full digest
  EXPECT_TRUE(find(recs, "a").full_hash);
  EXPECT_TRUE(find(recs, "b").full_hash);
  EXPECT_NE(*find(recs, "a").full_hash, *find(recs, "b").full_hash);
}

TEST_F(ClassifyTest, SingletonBucketsSkipFullHash) {
  dir.write("a", "same");
  dir.write("b", "same");
  dir.write("lonely", "unique content");
  auto recs = records();
  progress_t progress;
  auto groups = classify(recs, progress);
  ASSERT_EQ(groups.size(), 1U);
  EXPECT_FALSE(find(recs, "lonely").full_hash);
  EXPECT_TRUE(find(recs, "a").full_hash);
}

TEST_F(ClassifyTest, ZeroByteFilesGroupTogether) {
  dir.write("e1", "");
  dir.write("e2", "");
  auto recs = records();
  progress_t progress;
  auto groups = classify(recs, progress);
  ASSERT_EQ(groups.size(), 1U);
  EXPECT_EQ(groups[0].size(), 2U);
  EXPECT_EQ(groups[0][0].size, 0U);
}

TEST_F(ClassifyTest, OrderedBySizeThenDiscovery) {
  dir.write("a1", "xx");
  dir.write("a2", "xx");
  dir.write("b1", "yy");
  dir.write("b2", "yy");
  dir.write("c1", "longer content");
  dir.write("c2", "longer content");
  auto recs = records();
  progress_t progress;
  auto groups = classify(recs, progress, 3);

  ASSERT_EQ(groups.size(), 3U);
  EXPECT_EQ(groups[0][0].name, "c1");
  EXPECT_EQ(groups[1][0].name, "a1");
  EXPECT_EQ(groups[2][0].name, "b1");
  EXPECT_EQ(progress.groups_found(), 3U);
}

TEST_F(ClassifyTest, UnreadableCandidateIsLeftOut) {
  dir.write("a", "same");
  dir.write("b", "same");
  dir.write("c", "same");
  auto recs = records();
  fs::remove(dir.path() / "c");
  progress_t progress;
  auto groups = classify(recs, progress);
  ASSERT_EQ(groups.size(), 1U);
  EXPECT_EQ(groups[0].size(), 2U);
  EXPECT_FALSE(find(recs, "c").full_hash);
}

}  // namespace

}  // namespace dupscan
