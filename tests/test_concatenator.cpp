// Concatenation order, profile check and failure reporting.

#include <gtest/gtest.h>

#include "clip_mix/concatenator.hpp"
#include "clip_mix/errors.hpp"
#include "support/fakes.hpp"

namespace clip_mix {
namespace {

using test::CommandKind;

CacheEntry segment(const std::string &path, NormalizationProfile profile = {}) {
  CacheEntry e;
  e.path = path;
  e.profile = profile;
  return e;
}

TEST(ConcatenatorTest, ListFollowsSelectionOrder) {
  test::TempDir tmp;
  test::FakeCommandRunner runner;
  Concatenator concatenator(runner, "ffmpeg");

  std::vector<CacheEntry> segments = {segment("/cache/c.ts"), segment("/cache/a.ts"),
                                      segment("/cache/c.ts"), segment("/cache/b.ts")};
  std::string out = tmp.str("silent.mp4");
  EXPECT_EQ(concatenator.concat(segments, out), out);

  EXPECT_EQ(runner.concat_list(out), "file '/cache/c.ts'\n"
                                     "file '/cache/a.ts'\n"
                                     "file '/cache/c.ts'\n"
                                     "file '/cache/b.ts'\n");
  auto calls = runner.calls(CommandKind::Concat);
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(test::arg_after(calls[0], "-c"), "copy");
  EXPECT_TRUE(test::has_arg(calls[0], "-an"));
  EXPECT_EQ(calls[0].back(), out);
}

TEST(ConcatenatorTest, QuotesApostrophesInPaths) {
  std::vector<CacheEntry> segments = {segment("/cache/it's.ts")};
  EXPECT_EQ(Concatenator::build_list(segments), "file '/cache/it'\\''s.ts'\n");
}

TEST(ConcatenatorTest, MixedProfilesAreRejectedBeforeRunning) {
  test::FakeCommandRunner runner;
  Concatenator concatenator(runner, "ffmpeg");

  NormalizationProfile other;
  other.fps = 30;
  std::vector<CacheEntry> segments = {segment("/cache/a.ts"),
                                      segment("/cache/b.ts", other)};

  EXPECT_THROW(concatenator.concat(segments, "/tmp/never.mp4"), ProfileMismatch);
  EXPECT_EQ(runner.count(CommandKind::Concat), 0);
}

TEST(ConcatenatorTest, FailureRemovesPartialOutput) {
  test::TempDir tmp;
  test::FakeCommandRunner runner;
  runner.fail_when = [](const test::Args &a) { return test::has_arg(a, "concat"); };
  Concatenator concatenator(runner, "ffmpeg");

  std::string out = tmp.str("silent.mp4");
  test::write_file(out, 10);
  EXPECT_THROW(concatenator.concat({segment("/cache/a.ts")}, out), Error);
  EXPECT_FALSE(std::filesystem::exists(out));
}

TEST(ConcatenatorTest, NothingToConcatenate) {
  test::FakeCommandRunner runner;
  Concatenator concatenator(runner, "ffmpeg");
  EXPECT_THROW(concatenator.concat({}, "/tmp/never.mp4"), Error);
}

} // namespace
} // namespace clip_mix
