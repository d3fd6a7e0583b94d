// Tests for audio/schedule.hpp -- segment timing in sample frames.

#include "audio/schedule.hpp"

#include <gtest/gtest.h>

namespace audio {
namespace {

tone::ConversionResult two_notes() {
  tone::ConversionResult r;
  r.segments = {{262, 1000, 0}, {330, 500, 250}};
  r.totalMs = 1750;
  return r;
}

TEST(ScheduleTest, MillisecondsToFrames) {
  EXPECT_EQ(ms_to_frames(0), 0u);
  EXPECT_EQ(ms_to_frames(1000), kSampleRate);
  EXPECT_EQ(ms_to_frames(10), 441u);
}

TEST(ScheduleTest, DelaysShiftLaterTones) {
  const Schedule s = build_schedule(two_notes());
  ASSERT_EQ(s.tones.size(), 2u);
  EXPECT_EQ(s.tones[0].startFrame, 0u);
  EXPECT_EQ(s.tones[0].endFrame, 44100u);
  EXPECT_DOUBLE_EQ(s.tones[0].freqHz, 262.0);
  EXPECT_EQ(s.tones[1].startFrame, 44100u + 11025u);
  EXPECT_EQ(s.tones[1].endFrame, 44100u + 11025u + 22050u);
}

TEST(ScheduleTest, EndLeavesTailAfterLastTone) {
  const Schedule s = build_schedule(two_notes());
  ASSERT_FALSE(s.tones.empty());
  EXPECT_GT(s.endFrame, s.tones.back().endFrame);
  EXPECT_EQ(s.endFrame, s.tones.back().endFrame + ms_to_frames(kTailMs));
}

TEST(ScheduleTest, EmptyResultHasNothingToPlay) {
  const Schedule s = build_schedule(tone::ConversionResult{});
  EXPECT_TRUE(s.tones.empty());
  EXPECT_EQ(s.endFrame, 0u);
}

} // namespace
} // namespace audio
