// Tests for tone/segmenter.hpp -- intervals to beeper commands.

#include "tone/segmenter.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <optional>
#include <vector>

namespace tone {
namespace {

PitchInterval tone_iv(double start, double end, int pitch) {
  return PitchInterval{start, end, pitch};
}

PitchInterval rest(double start, double end) {
  return PitchInterval{start, end, std::nullopt};
}

TEST(SegmenterTest, PitchToHzUsesEqualTemperament) {
  EXPECT_EQ(pitch_to_hz(69), 440);
  EXPECT_EQ(pitch_to_hz(81), 880);
  EXPECT_EQ(pitch_to_hz(57), 220);
  EXPECT_EQ(pitch_to_hz(60), 262); // 261.63
  EXPECT_EQ(pitch_to_hz(62), 294); // 293.66
  EXPECT_EQ(pitch_to_hz(64), 330); // 329.63
  EXPECT_EQ(pitch_to_hz(0), 8);    // 8.18
  EXPECT_EQ(pitch_to_hz(127), 12544);
}

TEST(SegmenterTest, SingleToneBecomesOneSegment) {
  auto r = segment_tones({tone_iv(0.0, 1.0, 64)});
  ASSERT_EQ(r.segments.size(), 1u);
  EXPECT_EQ(r.segments[0], (ToneSegment{330, 1000, 0}));
  EXPECT_EQ(r.totalMs, 1000);
}

TEST(SegmenterTest, AdjacentSamePitchIsMerged) {
  auto r = segment_tones({tone_iv(0.0, 0.4, 60), tone_iv(0.4, 0.7, 60),
                          tone_iv(0.7, 1.0, 60)});
  ASSERT_EQ(r.segments.size(), 1u);
  EXPECT_EQ(r.segments[0], (ToneSegment{262, 1000, 0}));
}

TEST(SegmenterTest, PitchChangeStartsNewSegment) {
  auto r = segment_tones({tone_iv(0.0, 0.5, 60), tone_iv(0.5, 1.0, 64)});
  ASSERT_EQ(r.segments.size(), 2u);
  EXPECT_EQ(r.segments[0], (ToneSegment{262, 500, 0}));
  EXPECT_EQ(r.segments[1], (ToneSegment{330, 500, 0}));
}

TEST(SegmenterTest, LeadingSilenceBecomesDelay) {
  auto r = segment_tones({rest(0.0, 0.25), tone_iv(0.25, 0.75, 69)});
  ASSERT_EQ(r.segments.size(), 1u);
  EXPECT_EQ(r.segments[0], (ToneSegment{440, 500, 250}));
  EXPECT_EQ(r.totalMs, 750);
}

TEST(SegmenterTest, GapBecomesDelayOnNextTone) {
  auto r = segment_tones({tone_iv(0.0, 1.0, 60), rest(1.0, 1.5),
                          tone_iv(1.5, 2.5, 64)});
  ASSERT_EQ(r.segments.size(), 2u);
  EXPECT_EQ(r.segments[1].delayMs, 500);
  EXPECT_EQ(r.segments[1].freqHz, 330);
  for (const auto &s : r.segments) {
    EXPECT_GT(s.freqHz, 0) << "silence must not become a segment";
  }
}

TEST(SegmenterTest, ConsecutiveSilencesAddUp) {
  auto r = segment_tones({tone_iv(0.0, 0.1, 60), rest(0.1, 0.2), rest(0.2, 0.35),
                          tone_iv(0.35, 0.5, 60)});
  ASSERT_EQ(r.segments.size(), 2u);
  EXPECT_EQ(r.segments[1], (ToneSegment{262, 150, 250}));
}

TEST(SegmenterTest, TrailingSilenceIsDropped) {
  auto r = segment_tones({tone_iv(0.0, 0.5, 60), rest(0.5, 3.0)});
  ASSERT_EQ(r.segments.size(), 1u);
  EXPECT_EQ(r.totalMs, 500);
}

TEST(SegmenterTest, VeryShortToneLastsAtLeastOneMillisecond) {
  auto r = segment_tones({tone_iv(0.0, 0.0002, 60)});
  ASSERT_EQ(r.segments.size(), 1u);
  EXPECT_EQ(r.segments[0].durationMs, 1);
}

TEST(SegmenterTest, OnlySilenceGivesNothing) {
  auto r = segment_tones({rest(0.0, 2.0)});
  EXPECT_TRUE(r.empty());
  EXPECT_EQ(r.totalMs, 0);
}

TEST(SegmenterTest, CoverageStaysWithinOneMillisecondPerSegment) {
  // Irregular boundaries that do not fall on whole milliseconds.
  std::vector<PitchInterval> ivs;
  double t = 0.0;
  for (int i = 0; i < 200; ++i) {
    const double len = 0.0013 + 0.0371 * ((i * 7) % 11);
    if (i % 5 == 4)
      ivs.push_back(rest(t, t + len));
    else
      ivs.push_back(tone_iv(t, t + len, 48 + (i % 13)));
    t += len;
  }
  // End on a tone so nothing trailing is dropped.
  ivs.push_back(tone_iv(t, t + 0.1234, 90));
  t += 0.1234;

  auto r = segment_tones(ivs);
  std::int64_t sum = 0;
  for (const auto &s : r.segments) {
    EXPECT_GE(s.durationMs, 1);
    EXPECT_GE(s.delayMs, 0);
    sum += s.durationMs + s.delayMs;
  }
  EXPECT_EQ(sum, r.totalMs);
  const std::int64_t expected = std::llround(t * 1000.0);
  EXPECT_LE(std::llabs(sum - expected),
            static_cast<long long>(r.segments.size()));
}

} // namespace
} // namespace tone
