// Tests for midi/smf.hpp -- SMF chunk and event decoding.

#include "midi/smf.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "common/error.hpp"
#include "test_helpers.hpp"

namespace midi {
namespace {

using test_helpers::TrackBuilder;

common::ErrorKind kind_of(const std::vector<std::uint8_t> &bytes) {
  try {
    parse_smf(bytes);
  } catch (const common::Error &e) {
    return e.kind();
  }
  ADD_FAILURE() << "parse_smf did not throw";
  return common::ErrorKind::Playback;
}

// ---------------------------------------------------------------------------
// Header
// ---------------------------------------------------------------------------

TEST(SmfTest, RejectsDataWithoutMThd) {
  std::vector<std::uint8_t> bytes(20, 0);
  EXPECT_EQ(kind_of(bytes), common::ErrorKind::MalformedMidi);
}

TEST(SmfTest, RejectsTooShortData) {
  EXPECT_EQ(kind_of({'M', 'T', 'h', 'd'}), common::ErrorKind::MalformedMidi);
}

TEST(SmfTest, ParsesPpqnHeader) {
  Song song = parse_smf(test_helpers::smf({TrackBuilder{}}, 96));
  EXPECT_EQ(song.header.format, 0);
  EXPECT_EQ(song.header.nTracks, 1);
  EXPECT_TRUE(song.header.isPPQN);
  EXPECT_EQ(song.header.ppqn, 96u);
}

TEST(SmfTest, ParsesSmpteHeader) {
  // -25 fps (0xE7), 40 subframes
  Song song = parse_smf(test_helpers::smf({TrackBuilder{}}, 0xE728));
  EXPECT_FALSE(song.header.isPPQN);
  EXPECT_EQ(song.header.smpte_fps, 25);
  EXPECT_EQ(song.header.smpte_sub, 40);
}

TEST(SmfTest, HeaderWithNoTracksGivesEmptySong) {
  Song song = parse_smf(test_helpers::header(0, 0, 480));
  EXPECT_TRUE(song.notes.empty());
  EXPECT_TRUE(song.tempi.empty());
}

// ---------------------------------------------------------------------------
// Events
// ---------------------------------------------------------------------------

TEST(SmfTest, ReadsNotesAndTempoWithAbsoluteTicks) {
  TrackBuilder conductor;
  conductor.tempo(0, 600000).tempo(960, 300000);
  TrackBuilder melody;
  melody.on(0, 60).off(480, 60).on(0, 64, 90, 2).off(240, 64, 2);

  Song song = parse_smf(test_helpers::smf({conductor, melody}));
  ASSERT_EQ(song.tempi.size(), 2u);
  EXPECT_EQ(song.tempi[0].tick, 0u);
  EXPECT_EQ(song.tempi[0].usPerQN, 600000u);
  EXPECT_EQ(song.tempi[1].tick, 960u);
  EXPECT_EQ(song.tempi[1].usPerQN, 300000u);

  ASSERT_EQ(song.notes.size(), 4u);
  EXPECT_EQ(song.notes[0].tick, 0u);
  EXPECT_EQ(song.notes[0].type, EvType::NoteOn);
  EXPECT_EQ(song.notes[1].tick, 480u);
  EXPECT_EQ(song.notes[1].type, EvType::NoteOff);
  EXPECT_EQ(song.notes[2].ch, 2);
  EXPECT_EQ(song.notes[2].vel, 90);
  EXPECT_EQ(song.notes[3].tick, 720u);
  for (const auto &n : song.notes) {
    EXPECT_EQ(n.track, 1) << "notes live in the second track";
  }
}

TEST(SmfTest, RunningStatusReusesPreviousStatus) {
  TrackBuilder t;
  t.raw(0, {0x90, 60, 100}).raw(0, {64, 100}).raw(10, {60, 0});
  Song song = parse_smf(test_helpers::smf({t}));
  ASSERT_EQ(song.notes.size(), 3u);
  EXPECT_EQ(song.notes[1].note, 64);
  EXPECT_EQ(song.notes[1].type, EvType::NoteOn);
  EXPECT_EQ(song.notes[2].tick, 10u);
}

TEST(SmfTest, FormatTwoPatternsPlayOneAfterAnother) {
  TrackBuilder first, second;
  first.on(0, 60).off(480, 60).raw(240, {0xFF, 0x01, 0x00}); // ends at 720
  second.tempo(0, 250000).on(0, 64).off(240, 64);
  std::vector<std::uint8_t> bytes = test_helpers::header(2, 2, 480);
  for (const auto &t : {first, second}) {
    const auto c = t.chunk();
    bytes.insert(bytes.end(), c.begin(), c.end());
  }

  Song song = parse_smf(bytes);
  ASSERT_EQ(song.notes.size(), 4u);
  EXPECT_EQ(song.notes[1].tick, 480u);
  EXPECT_EQ(song.notes[2].tick, 720u);
  EXPECT_EQ(song.notes[3].tick, 960u);
  ASSERT_EQ(song.tempi.size(), 1u);
  EXPECT_EQ(song.tempi[0].tick, 720u);
}

TEST(SmfTest, FormatOneTracksShareTimeline) {
  TrackBuilder first, second;
  first.on(0, 60).off(480, 60);
  second.on(0, 64).off(240, 64);
  Song song = parse_smf(test_helpers::smf({first, second}));
  ASSERT_EQ(song.notes.size(), 4u);
  EXPECT_EQ(song.notes[2].tick, 0u);
  EXPECT_EQ(song.notes[3].tick, 240u);
}

TEST(SmfTest, NoteOnWithZeroVelocityIsKeptRaw) {
  TrackBuilder t;
  t.on(0, 60).on(10, 60, 0);
  Song song = parse_smf(test_helpers::smf({t}));
  ASSERT_EQ(song.notes.size(), 2u);
  EXPECT_EQ(song.notes[1].type, EvType::NoteOn);
  EXPECT_EQ(song.notes[1].vel, 0);
}

TEST(SmfTest, SkipsOtherMessagesAndMetaEvents) {
  TrackBuilder t;
  t.raw(0, {0xFF, 0x03, 0x04, 'L', 'e', 'a', 'd'}) // track name
      .raw(0, {0xC0, 5})                           // program change
      .raw(0, {0xB0, 7, 100})                      // CC volume
      .raw(0, {0xF0, 0x02, 0x7E, 0xF7})            // SysEx
      .raw(0, {0xE0, 0x00, 0x40})                  // pitch bend
      .on(0, 72);
  Song song = parse_smf(test_helpers::smf({t}));
  ASSERT_EQ(song.notes.size(), 1u);
  EXPECT_EQ(song.notes[0].note, 72);
}

TEST(SmfTest, SkipsUnknownChunks) {
  std::vector<std::uint8_t> bytes = test_helpers::header(0, 1, 480);
  bytes.insert(bytes.end(), {'X', 'F', 'I', 'H', 0, 0, 0, 2, 0xAA, 0xBB});
  TrackBuilder t;
  t.on(0, 60).off(480, 60);
  const auto c = t.chunk();
  bytes.insert(bytes.end(), c.begin(), c.end());

  Song song = parse_smf(bytes);
  EXPECT_EQ(song.notes.size(), 2u);
}

TEST(SmfTest, TrackWithoutEndOfTrackStillParses) {
  TrackBuilder t;
  t.on(0, 60).off(480, 60);
  std::vector<std::uint8_t> bytes = test_helpers::header(0, 1, 480);
  const auto c = t.chunk(false);
  bytes.insert(bytes.end(), c.begin(), c.end());
  EXPECT_EQ(parse_smf(bytes).notes.size(), 2u);
}

// ---------------------------------------------------------------------------
// Malformed input
// ---------------------------------------------------------------------------

TEST(SmfTest, TruncatedEventReportsOffset) {
  TrackBuilder t;
  t.raw(0, {0x90, 60}); // missing velocity byte
  std::vector<std::uint8_t> bytes = test_helpers::header(0, 1, 480);
  const auto c = t.chunk(false);
  bytes.insert(bytes.end(), c.begin(), c.end());
  try {
    parse_smf(bytes);
    FAIL() << "expected MalformedMidi";
  } catch (const common::Error &e) {
    EXPECT_EQ(e.kind(), common::ErrorKind::MalformedMidi);
    EXPECT_NE(std::string(e.what()).find("offset"), std::string::npos);
  }
}

TEST(SmfTest, MissingTracksThrows) {
  // Header promises two tracks but the file holds one.
  std::vector<std::uint8_t> bytes = test_helpers::header(1, 2, 480);
  const auto c = TrackBuilder{}.chunk();
  bytes.insert(bytes.end(), c.begin(), c.end());
  EXPECT_EQ(kind_of(bytes), common::ErrorKind::MalformedMidi);
}

TEST(SmfTest, RunningStatusWithoutStatusThrows) {
  TrackBuilder t;
  t.raw(0, {60, 100});
  EXPECT_EQ(kind_of(test_helpers::smf({t})), common::ErrorKind::MalformedMidi);
}

TEST(SmfTest, MetaEventCancelsRunningStatus) {
  TrackBuilder t;
  t.raw(0, {0x90, 60, 100}).raw(0, {0xFF, 0x01, 0x00}).raw(0, {64, 100});
  EXPECT_EQ(kind_of(test_helpers::smf({t})), common::ErrorKind::MalformedMidi);
}

TEST(SmfTest, SysExCancelsRunningStatus) {
  TrackBuilder t;
  t.raw(0, {0x90, 60, 100}).raw(0, {0xF0, 0x01, 0xF7}).raw(0, {64, 100});
  EXPECT_EQ(kind_of(test_helpers::smf({t})), common::ErrorKind::MalformedMidi);
}

TEST(SmfTest, OverlongVlqThrows) {
  std::vector<std::uint8_t> bytes = test_helpers::header(0, 1, 480);
  std::vector<std::uint8_t> body{0x80, 0x80, 0x80, 0x80, 0x00, 0x90, 60, 100};
  bytes.insert(bytes.end(), {'M', 'T', 'r', 'k'});
  test_helpers::put_be32(bytes, static_cast<std::uint32_t>(body.size()));
  bytes.insert(bytes.end(), body.begin(), body.end());
  EXPECT_EQ(kind_of(bytes), common::ErrorKind::MalformedMidi);
}

} // namespace
} // namespace midi
