// Compression ratio of a finished job.

#include <gtest/gtest.h>

#include "clip_mix/compression_reporter.hpp"
#include "support/fakes.hpp"

namespace clip_mix {
namespace {

TEST(CompressionReporterTest, SumsSourcesIncludingRepeats) {
  test::TempDir tmp;
  test::write_file(tmp.str("a.mp4"), 1000);
  test::write_file(tmp.str("b.mp4"), 3000);
  test::write_file(tmp.str("out.mp4"), 1400);

  CompressionStats s = CompressionReporter::report(
      {tmp.str("a.mp4"), tmp.str("b.mp4"), tmp.str("b.mp4")}, tmp.str("out.mp4"));

  ASSERT_TRUE(s.known);
  EXPECT_EQ(s.input_bytes, 7000u);
  EXPECT_EQ(s.output_bytes, 1400u);
  EXPECT_DOUBLE_EQ(s.ratio, 0.2);
}

TEST(CompressionReporterTest, VanishedSourceDegradesToUnknown) {
  test::TempDir tmp;
  test::write_file(tmp.str("out.mp4"), 10);

  CompressionStats s =
      CompressionReporter::report({tmp.str("gone.mp4")}, tmp.str("out.mp4"));
  EXPECT_FALSE(s.known);
}

TEST(CompressionReporterTest, ReportsFromJobResult) {
  test::TempDir tmp;
  test::write_file(tmp.str("a.mp4"), 400);
  test::write_file(tmp.str("out.mp4"), 100);

  JobResult r;
  r.sources = {tmp.str("a.mp4")};
  r.output_path = tmp.str("out.mp4");
  CompressionStats s = CompressionReporter::report(r);
  ASSERT_TRUE(s.known);
  EXPECT_DOUBLE_EQ(s.ratio, 0.25);
}

} // namespace
} // namespace clip_mix
