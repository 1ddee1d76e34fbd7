// Seeded selection: reproducibility, sampling modes, BGM pick.

#include <gtest/gtest.h>

#include <set>

#include "clip_mix/segment_selector.hpp"

namespace clip_mix {
namespace {

std::vector<SourceAsset> make_assets(int n) {
  std::vector<SourceAsset> assets;
  for (int i = 0; i < n; ++i) {
    SourceAsset a;
    a.stem = "clip" + std::to_string(i);
    a.path = "/videos/" + a.stem + ".mp4";
    assets.push_back(a);
  }
  return assets;
}

std::vector<std::string> paths_of(const SegmentSelection &selection) {
  std::vector<std::string> out;
  for (const auto &c : selection)
    out.push_back(c.asset.path);
  return out;
}

TEST(SegmentSelectorTest, SameSeedSameSelectionAndOrder) {
  auto assets = make_assets(10);
  std::vector<std::string> bgm = {"/bgm/a.mp3", "/bgm/b.mp3", "/bgm/c.mp3"};
  SegmentSelector selector(assets, bgm, TrimSpec{0.0, 1.0});
  selector.set_count(4);

  std::uint64_t seed = derive_job_seed(42, 1);
  JobDraw first = selector.draw(seed);
  JobDraw second = selector.draw(seed);

  EXPECT_EQ(paths_of(first.selection), paths_of(second.selection));
  EXPECT_EQ(first.bgm_path, second.bgm_path);
}

TEST(SegmentSelectorTest, DistinctClipsWhenEnoughAvailable) {
  auto assets = make_assets(10);
  std::vector<std::string> bgm = {"/bgm/a.mp3"};
  SegmentSelector selector(assets, bgm, TrimSpec{0.5, 1.0});
  selector.set_count(10);

  JobDraw draw = selector.draw(7);
  auto paths = paths_of(draw.selection);
  ASSERT_EQ(paths.size(), 10u);
  EXPECT_EQ(std::set<std::string>(paths.begin(), paths.end()).size(), 10u);
  for (const auto &c : draw.selection) {
    EXPECT_EQ(c.trim, TrimSpec({0.5, 1.0}));
  }
}

TEST(SegmentSelectorTest, SamplesWithReplacementWhenCountExceedsCatalog) {
  auto assets = make_assets(3);
  std::vector<std::string> bgm = {"/bgm/a.mp3"};
  SegmentSelector selector(assets, bgm, TrimSpec{});
  selector.set_count(8);

  JobDraw draw = selector.draw(123);
  ASSERT_EQ(draw.selection.size(), 8u);
  std::set<std::string> distinct;
  for (const auto &p : paths_of(draw.selection))
    distinct.insert(p);
  EXPECT_LE(distinct.size(), 3u);
}

TEST(SegmentSelectorTest, JobsOfOneRunDoNotAllMatch) {
  auto assets = make_assets(10);
  std::vector<std::string> bgm = {"/bgm/a.mp3"};
  SegmentSelector selector(assets, bgm, TrimSpec{});
  selector.set_count(4);

  std::set<std::vector<std::string>> seen;
  for (int job = 1; job <= 5; ++job) {
    seen.insert(paths_of(selector.draw(derive_job_seed(42, job)).selection));
  }
  EXPECT_GT(seen.size(), 1u);
}

TEST(SegmentSelectorTest, BgmComesFromTheResolvedList) {
  auto assets = make_assets(2);
  std::vector<std::string> bgm = {"/bgm/a.mp3", "/bgm/b.mp3"};
  SegmentSelector selector(assets, bgm, TrimSpec{});

  std::set<std::string> picked;
  for (int job = 1; job <= 20; ++job) {
    picked.insert(selector.draw(derive_job_seed(9, job)).bgm_path);
  }
  for (const auto &p : picked) {
    EXPECT_TRUE(p == bgm[0] || p == bgm[1]) << p;
  }
}

TEST(SegmentSelectorTest, SelectMatchesDrawForSameSeed) {
  auto assets = make_assets(6);
  std::vector<std::string> bgm = {"/bgm/a.mp3"};
  SegmentSelector selector(assets, bgm, TrimSpec{});
  selector.set_count(3);

  EXPECT_EQ(paths_of(selector.select(3, 99)),
            paths_of(selector.draw(99).selection));
}

TEST(JobSeedTest, DeterministicAndDistinctPerJob) {
  EXPECT_EQ(derive_job_seed(42, 1), derive_job_seed(42, 1));
  EXPECT_NE(derive_job_seed(42, 1), derive_job_seed(42, 2));
  EXPECT_NE(derive_job_seed(42, 1), derive_job_seed(43, 1));
}

} // namespace
} // namespace clip_mix
