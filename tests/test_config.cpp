// Output naming, derived locations and settings validation.

#include <gtest/gtest.h>

#include "clip_mix/config.hpp"
#include "clip_mix/errors.hpp"
#include "support/fakes.hpp"

namespace clip_mix {
namespace {

RunSettings valid_settings(const test::TempDir &tmp) {
  std::filesystem::create_directories(tmp.str("videos"));
  test::write_file(tmp.str("bgm.mp3"), 10);
  RunSettings s;
  s.video_dirs = {tmp.str("videos")};
  s.bgm_path = tmp.str("bgm.mp3");
  s.output = tmp.str("out");
  return s;
}

TEST(RunSettingsTest, FileOutputGetsIndexSuffix) {
  RunSettings s;
  s.video_dirs = {"/data/videos"};
  s.output = "/data/final/mix.mp4";

  EXPECT_EQ(s.output_dir(), "/data/final");
  EXPECT_EQ(s.output_path_for(1), "/data/final/mix_1.mp4");
  EXPECT_EQ(s.output_path_for(12), "/data/final/mix_12.mp4");
}

TEST(RunSettingsTest, DirectoryOutputUsesClipCountName) {
  RunSettings s;
  s.video_dirs = {"/data/videos"};
  s.output = "/data/final";
  s.clips_per_output = 6;

  EXPECT_EQ(s.output_path_for(3), "/data/final/mix_6clips_3.mp4");
}

TEST(RunSettingsTest, DefaultLocationsSitBesideFirstInput) {
  RunSettings s;
  s.video_dirs = {"/data/videos/"};

  EXPECT_EQ(s.output_dir(), "/data/videos_longvideo");
  EXPECT_EQ(s.resolved_cache_dir(), "/data/videos_ts_cache");
  EXPECT_EQ(s.resolved_work_dir(), "/data/videos_longvideo/_work");
  EXPECT_EQ(s.output_path_for(2), "/data/videos_longvideo/mix_5clips_2.mp4");

  s.cache_dir = "/fast/cache";
  s.work_dir = "/fast/work";
  EXPECT_EQ(s.resolved_cache_dir(), "/fast/cache");
  EXPECT_EQ(s.resolved_work_dir(), "/fast/work");
}

TEST(RunSettingsTest, SeveralInputsDefaultToCombinedDirectory) {
  RunSettings s;
  s.video_dirs = {"/data/videos", "/data/more"};

  EXPECT_EQ(s.output_dir(), "/data/videos_longvideo_combined");
  EXPECT_EQ(s.resolved_work_dir(), "/data/videos_longvideo_combined/_work");
  EXPECT_EQ(s.resolved_cache_dir(), "/data/videos_ts_cache");
}

TEST(ValidateSettingsTest, AcceptsSaneSettings) {
  test::TempDir tmp;
  EXPECT_NO_THROW(validate_settings(valid_settings(tmp)));
}

TEST(ValidateSettingsTest, RejectsBadValues) {
  test::TempDir tmp;
  const RunSettings good = valid_settings(tmp);

  RunSettings s = good;
  s.outputs = 0;
  EXPECT_THROW(validate_settings(s), InvalidSettings);

  s = good;
  s.clips_per_output = 0;
  EXPECT_THROW(validate_settings(s), InvalidSettings);

  s = good;
  s.profile.fps = 0;
  EXPECT_THROW(validate_settings(s), InvalidSettings);

  s = good;
  s.trim.tail_seconds = -1.0;
  EXPECT_THROW(validate_settings(s), InvalidSettings);

  s = good;
  s.video_dirs = {tmp.str("missing")};
  EXPECT_THROW(validate_settings(s), InvalidSettings);

  s = good;
  s.bgm_path = tmp.str("nope.mp3");
  EXPECT_THROW(validate_settings(s), InvalidSettings);
}

TEST(ValidateSettingsTest, SeveralInputsNeedAnOutputDirectory) {
  test::TempDir tmp;
  RunSettings s = valid_settings(tmp);
  std::filesystem::create_directories(tmp.str("videos2"));
  s.video_dirs.push_back(tmp.str("videos2"));

  s.output = tmp.str("final.mp4");
  EXPECT_THROW(validate_settings(s), InvalidSettings);

  s.output = tmp.str("out");
  EXPECT_NO_THROW(validate_settings(s));
}

} // namespace
} // namespace clip_mix
