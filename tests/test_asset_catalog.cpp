// Input discovery: recursive video listing, BGM resolution, grouping.

#include <gtest/gtest.h>

#include "clip_mix/asset_catalog.hpp"
#include "clip_mix/errors.hpp"
#include "support/fakes.hpp"

namespace clip_mix {
namespace {

using test::TempDir;
using test::write_file;

TEST(AssetCatalogTest, ListsVideosRecursivelyInPathOrder) {
  TempDir tmp;
  write_file(tmp.str("videos/b.mp4"), 10);
  write_file(tmp.str("videos/a.MOV"), 10);
  write_file(tmp.str("videos/sub/c.mkv"), 10);
  write_file(tmp.str("videos/readme.txt"), 10);
  write_file(tmp.str("videos/sub/song.mp3"), 10);

  auto assets = AssetCatalog::list_videos({tmp.str("videos")});

  ASSERT_EQ(assets.size(), 3u);
  EXPECT_EQ(assets[0].stem, "a");
  EXPECT_EQ(assets[0].extension, ".mov");
  EXPECT_EQ(assets[1].stem, "b");
  EXPECT_EQ(assets[2].stem, "c");
  EXPECT_EQ(assets[2].size_bytes, 10u);
  EXPECT_TRUE(std::filesystem::path(assets[0].path).is_absolute());
}

TEST(AssetCatalogTest, EmptyDirectoryIsRejected) {
  TempDir tmp;
  write_file(tmp.str("full/a.mp4"), 1);
  std::filesystem::create_directories(tmp.str("empty"));

  try {
    AssetCatalog::list_videos({tmp.str("full"), tmp.str("empty")});
    FAIL() << "expected EmptyCatalog";
  } catch (const EmptyCatalog &e) {
    EXPECT_EQ(e.location(), tmp.str("empty"));
  }
}

TEST(AssetCatalogTest, BgmFileResolvesToItself) {
  TempDir tmp;
  write_file(tmp.str("music.mp3"), 5);

  auto tracks = AssetCatalog::resolve_bgm(tmp.str("music.mp3"));
  ASSERT_EQ(tracks.size(), 1u);
  EXPECT_EQ(std::filesystem::path(tracks[0]).filename().string(), "music.mp3");
}

TEST(AssetCatalogTest, BgmDirectoryResolvesToEveryAudioFile) {
  TempDir tmp;
  write_file(tmp.str("bgm/z.flac"), 5);
  write_file(tmp.str("bgm/a.m4a"), 5);
  write_file(tmp.str("bgm/cover.jpg"), 5);

  auto tracks = AssetCatalog::resolve_bgm(tmp.str("bgm"));
  ASSERT_EQ(tracks.size(), 2u);
  EXPECT_EQ(std::filesystem::path(tracks[0]).filename().string(), "a.m4a");
  EXPECT_EQ(std::filesystem::path(tracks[1]).filename().string(), "z.flac");
}

TEST(AssetCatalogTest, BgmWithoutAudioIsRejected) {
  TempDir tmp;
  write_file(tmp.str("bgm/cover.jpg"), 5);
  write_file(tmp.str("clip.mp4"), 5);

  EXPECT_THROW(AssetCatalog::resolve_bgm(tmp.str("bgm")), EmptyCatalog);
  EXPECT_THROW(AssetCatalog::resolve_bgm(tmp.str("clip.mp4")), EmptyCatalog);
}

TEST(AssetCatalogTest, ChangedFileChangesSignature) {
  TempDir tmp;
  write_file(tmp.str("a.mp4"), 10);
  SourceAsset before = AssetCatalog::make_asset(tmp.str("a.mp4"));
  write_file(tmp.str("a.mp4"), 20);
  SourceAsset after = AssetCatalog::make_asset(tmp.str("a.mp4"));

  EXPECT_NE(before.signature(), after.signature());
}

TEST(AssetCatalogTest, GroupsByProbedResolutionLargestFirst) {
  TempDir tmp;
  test::FakeMediaProber prober;
  for (int i = 0; i < 3; ++i)
    write_file(tmp.str("v/wide" + std::to_string(i) + ".mp4"), 1);
  for (int i = 0; i < 2; ++i) {
    std::string path = tmp.str("v/tall" + std::to_string(i) + ".mp4");
    write_file(path, 1);
    prober.by_path[path] = MediaInfo{1080, 1920, 25.0, 5.0};
  }
  write_file(tmp.str("v/broken.mp4"), 1);
  prober.unreadable.insert(tmp.str("v/broken.mp4"));

  write_file(tmp.str("bgm.mp3"), 1);

  AssetCatalog catalog = AssetCatalog::scan({tmp.str("v")}, tmp.str("bgm.mp3"));
  auto groups = catalog.group_by_resolution(prober);

  ASSERT_EQ(groups.size(), 2u);
  EXPECT_EQ(groups[0].label(), "1920x1080");
  EXPECT_EQ(groups[0].assets.size(), 3u);
  EXPECT_EQ(groups[1].label(), "1080x1920");
  EXPECT_EQ(groups[1].assets.size(), 2u);
}

} // namespace
} // namespace clip_mix
