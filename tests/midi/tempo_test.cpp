// Tests for midi/tempo.hpp -- tempo map construction and tick->seconds.

#include "midi/tempo.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "common/error.hpp"

namespace midi {
namespace {

constexpr double kEps = 1e-9;

common::ErrorKind kind_of(unsigned ppqn, const std::vector<TempoEv> &tempi) {
  try {
    build_tempo_map(ppqn, tempi);
  } catch (const common::Error &e) {
    return e.kind();
  }
  ADD_FAILURE() << "build_tempo_map did not throw";
  return common::ErrorKind::Playback;
}

TEST(TempoTest, DefaultsTo120BpmWithoutTempoEvents) {
  TempoMap map = build_tempo_map(480, {});
  ASSERT_EQ(map.segments.size(), 1u);
  EXPECT_EQ(map.segments[0].startTick, 0u);
  EXPECT_NEAR(ticks_to_seconds(0, map), 0.0, kEps);
  EXPECT_NEAR(ticks_to_seconds(480, map), 0.5, kEps);
  EXPECT_NEAR(ticks_to_seconds(240, map), 0.25, kEps);
}

TEST(TempoTest, TempoChangeSplitsTimeline) {
  // 120 BPM for two beats, then 240 BPM.
  TempoMap map = build_tempo_map(480, {{960, 250000}});
  ASSERT_EQ(map.segments.size(), 2u);
  EXPECT_NEAR(map.segments[1].startSec, 1.0, kEps);
  EXPECT_NEAR(ticks_to_seconds(960, map), 1.0, kEps);
  EXPECT_NEAR(ticks_to_seconds(1440, map), 1.25, kEps);
  EXPECT_NEAR(ticks_to_seconds(1200, map), 1.125, kEps);
}

TEST(TempoTest, ArbitraryTicksAcrossManySegments) {
  // Tempo doubles its quarter-note length every 100 ticks.
  std::vector<TempoEv> tempi;
  std::uint32_t us = 100000;
  for (std::uint32_t tick = 0; tick <= 1000; tick += 100, us += 100000) {
    tempi.push_back({tick, us});
  }
  TempoMap map = build_tempo_map(100, tempi);
  ASSERT_EQ(map.segments.size(), 11u);

  // Reference: walk tick by tick.
  double expected = 0.0;
  for (std::uint32_t tick = 0; tick < 1234; ++tick) {
    EXPECT_NEAR(ticks_to_seconds(tick, map), expected, 1e-6) << "tick " << tick;
    const std::size_t seg = std::min<std::size_t>(tick / 100, 10);
    expected += (1.0 / 100) * (tempi[seg].usPerQN * 1e-6);
  }
}

TEST(TempoTest, TempoBeyondLastChangeContinues) {
  TempoMap map = build_tempo_map(480, {{0, 1000000}});
  EXPECT_NEAR(ticks_to_seconds(480 * 100, map), 100.0, 1e-6);
}

TEST(TempoTest, SameTickChangesLastOneWins) {
  TempoMap map = build_tempo_map(480, {{0, 500000}, {0, 1000000}});
  ASSERT_EQ(map.segments.size(), 1u);
  EXPECT_NEAR(ticks_to_seconds(480, map), 1.0, kEps);

  map = build_tempo_map(480, {{480, 250000}, {480, 2000000}});
  ASSERT_EQ(map.segments.size(), 2u);
  EXPECT_NEAR(ticks_to_seconds(960, map), 0.5 + 2.0, kEps);
}

TEST(TempoTest, ZeroTicksPerQuarterIsMalformed) {
  EXPECT_EQ(kind_of(0, {}), common::ErrorKind::MalformedTempoMap);
}

TEST(TempoTest, OutOfOrderTempoIsMalformedAndNamesTick) {
  try {
    build_tempo_map(480, {{960, 500000}, {480, 400000}});
    FAIL() << "expected MalformedTempoMap";
  } catch (const common::Error &e) {
    EXPECT_EQ(e.kind(), common::ErrorKind::MalformedTempoMap);
    EXPECT_NE(std::string(e.what()).find("480"), std::string::npos);
  }
}

TEST(TempoTest, ZeroTempoIsMalformed) {
  EXPECT_EQ(kind_of(480, {{0, 0}}), common::ErrorKind::MalformedTempoMap);
}

TEST(TempoTest, SongTempiFromSeveralTracksAreMerged) {
  Song song;
  song.header.ppqn = 480;
  song.tempi = {{960, 250000}, {0, 1000000}}; // track 1 then track 0 order
  TempoMap map = build_tempo_map(song);
  EXPECT_NEAR(ticks_to_seconds(960, map), 2.0, kEps);
  EXPECT_NEAR(ticks_to_seconds(1440, map), 2.25, kEps);
}

TEST(TempoTest, SmpteSongUsesFixedTickRate) {
  Song song;
  song.header.isPPQN = false;
  song.header.smpte_fps = 25;
  song.header.smpte_sub = 40; // 1000 ticks per second
  song.tempi = {{0, 250000}}; // ignored under SMPTE
  TempoMap map = build_tempo_map(song);
  EXPECT_NEAR(ticks_to_seconds(500, map), 0.5, kEps);
  EXPECT_NEAR(ticks_to_seconds(3000, map), 3.0, kEps);
}

TEST(TempoTest, SmpteWithZeroSubframesIsMalformed) {
  Song song;
  song.header.isPPQN = false;
  song.header.smpte_fps = 25;
  song.header.smpte_sub = 0;
  EXPECT_THROW(build_tempo_map(song), common::Error);
}

} // namespace
} // namespace midi
