// Encoder probe, quality table and hardware-to-software fallback.

#include <gtest/gtest.h>

#include "clip_mix/encoding_profile.hpp"
#include "clip_mix/errors.hpp"
#include "support/fakes.hpp"

namespace clip_mix {
namespace {

using test::CommandKind;

TEST(QualityTableTest, RowsPerProfile) {
  EncoderOverrides none;
  EXPECT_EQ(hardware_profile(QualityProfile::Visual, none).quality_value, 30);
  EXPECT_EQ(hardware_profile(QualityProfile::Visual, none).preset, "p5");
  EXPECT_EQ(hardware_profile(QualityProfile::Size, none).quality_value, 34);
  EXPECT_EQ(software_profile(QualityProfile::Balanced, none).quality_value, 30);
  EXPECT_EQ(software_profile(QualityProfile::Balanced, none).preset, "slow");
  EXPECT_EQ(software_profile(QualityProfile::Size, none).preset, "veryslow");
}

TEST(QualityTableTest, OverridesOnlyTouchTheirFamily) {
  EncoderOverrides o;
  o.nvenc_cq = 25;
  o.preset_gpu = "p4";

  EncodingProfile hw = hardware_profile(QualityProfile::Balanced, o);
  EncodingProfile sw = software_profile(QualityProfile::Balanced, o);
  EXPECT_EQ(hw.quality_value, 25);
  EXPECT_EQ(hw.preset, "p4");
  EXPECT_EQ(sw.quality_value, 30);
  EXPECT_EQ(sw.preset, "slow");
}

TEST(EncodingProfileResolverTest, PicksHardwareWhenListed) {
  test::FakeCommandRunner runner;
  runner.hardware_listed = true;
  EncodingProfileResolver resolver(runner, "ffmpeg", QualityProfile::Balanced, {});

  EncodingProfile p = resolver.resolve(true);
  EXPECT_TRUE(p.is_hardware());
  EXPECT_EQ(p.codec, "hevc_nvenc");
  EXPECT_EQ(p.quality_value, 32);
}

TEST(EncodingProfileResolverTest, FallsBackToSoftwareWhenNotListed) {
  test::FakeCommandRunner runner;
  EncodingProfileResolver resolver(runner, "ffmpeg", QualityProfile::Visual, {});

  EncodingProfile p = resolver.resolve(true);
  EXPECT_FALSE(p.is_hardware());
  EXPECT_EQ(p.codec, "libx265");
  EXPECT_EQ(p.quality_value, 28);
}

TEST(EncodingProfileResolverTest, NoProbeWhenHardwareNotPreferred) {
  test::FakeCommandRunner runner;
  runner.hardware_listed = true;
  EncodingProfileResolver resolver(runner, "ffmpeg", QualityProfile::Balanced, {});

  EXPECT_FALSE(resolver.resolve(false).is_hardware());
  EXPECT_EQ(runner.count(CommandKind::Encoders), 0);
}

TEST(EncodingProfileResolverTest, EncodersProbedOnce) {
  test::FakeCommandRunner runner;
  runner.hardware_listed = true;
  EncodingProfileResolver resolver(runner, "ffmpeg", QualityProfile::Balanced, {});

  resolver.resolve(true);
  resolver.resolve(true);
  EXPECT_TRUE(resolver.hardware_available());
  EXPECT_EQ(runner.count(CommandKind::Encoders), 1);
}

TEST(EncodingProfileResolverTest, FallbackUsesSoftwareRowNotHardwareNumber) {
  test::FakeCommandRunner runner;
  EncoderOverrides o;
  o.nvenc_cq = 19;
  EncodingProfileResolver resolver(runner, "ffmpeg", QualityProfile::Size, o);

  EncodingProfile hw = hardware_profile(QualityProfile::Size, o);
  EncodingProfile sw = resolver.fallback(hw);
  EXPECT_FALSE(sw.is_hardware());
  EXPECT_EQ(sw.codec, "libx265");
  EXPECT_EQ(sw.quality_value, 32);
  EXPECT_EQ(sw.preset, "veryslow");
  EXPECT_EQ(sw.quality, QualityProfile::Size);

  EXPECT_EQ(resolver.fallback(sw).quality_value, sw.quality_value);
}

TEST(EncodingProfileResolverTest, MissingExecutableIsRunFatal) {
  test::FakeCommandRunner runner;
  runner.tool_present = false;
  EncodingProfileResolver resolver(runner, "/nowhere/ffmpeg", QualityProfile::Balanced, {});

  try {
    resolver.ensure_tool();
    FAIL() << "expected ExternalToolMissing";
  } catch (const ExternalToolMissing &e) {
    EXPECT_EQ(e.tool(), "/nowhere/ffmpeg");
  }
}

TEST(EncodingProfileResolverTest, RealRunnerReportsMissingExecutable) {
  ProcessCommandRunner runner;
  EncodingProfileResolver resolver(runner, "/nonexistent/clip_mix_ffmpeg",
                                   QualityProfile::Balanced, {});
  EXPECT_THROW(resolver.ensure_tool(), ExternalToolMissing);
}

} // namespace
} // namespace clip_mix
