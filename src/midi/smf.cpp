// src/midi/smf.cpp
// Standard MIDI File reader: MThd + MTrk chunks -> midi::Song.
// Every failure is common::Error(MalformedMidi) naming the byte offset.

#include "midi/smf.hpp"
#include "common/error.hpp"
#include "common/reader.hpp"
#include "midi/events.hpp"

#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

namespace {

constexpr std::uint32_t kMThd = 0x4D546864; // "MThd"
constexpr std::uint32_t kMTrk = 0x4D54726B; // "MTrk"

[[noreturn]] void fail(const std::string &what, std::size_t offset) {
  throw common::Error(common::ErrorKind::MalformedMidi,
                      what + " at offset " + std::to_string(offset));
}

// MThd. Leaves r at the first chunk after the header.
midi::SMFHeader parse_header(Bytes &r) {
  if (r.size < 14 || r.be32() != kMThd) {
    fail("Not a MIDI file (missing 'MThd')", 0);
  }

  const std::uint32_t length = r.be32();
  if (length < 6) {
    fail("Header chunk length must be at least 6", 4);
  }

  midi::SMFHeader h{};
  h.format = r.be16();
  h.nTracks = r.be16();
  h.division = r.be16();
  r.skip(length - 6); // future header fields

  if (h.format > 2) {
    fail("Unsupported SMF format " + std::to_string(h.format), 8);
  }

  if ((h.division & 0x8000) == 0) {
    // Bit 15 clear: ticks per quarter note.
    h.isPPQN = true;
    h.ppqn = static_cast<unsigned>(h.division & 0x7FFF);
  } else {
    // Bit 15 set: negative frame rate in the high byte, subframes below.
    h.isPPQN = false;
    h.smpte_fps = 256 - ((h.division >> 8) & 0xFF); // e.g., 24, 25, 29, 30
    h.smpte_sub = static_cast<int>(h.division & 0xFF);
  }

  return h;
}

// Walk a single MTrk payload and append events to the song, with absolute
// ticks counted from startTick. Returns the tick the track ended on.
std::uint32_t walk_one_track(Bytes tr, std::uint16_t trackIndex,
                             std::uint32_t startTick, midi::Song &song) {
  std::uint32_t tick = startTick;
  std::uint8_t running = 0;

  while (!tr.done()) {
    tick += read_vlq(tr);

    const std::size_t at = tr.file_offset();
    std::uint8_t first = tr.u8();
    std::uint8_t status = 0;
    bool haveData1 = false;
    std::uint8_t data1 = 0;

    if (first & 0x80) {
      status = first;
      // Meta and SysEx events cancel running status.
      running = (status & 0xF0) < 0xF0 ? status : 0;
    } else {
      // A data byte here reuses the last channel status.
      if (running == 0) {
        fail("Running status used before any status", at);
      }
      status = running;
      haveData1 = true;
      data1 = first;
    }

    const std::uint8_t type = status & 0xF0;
    const std::uint8_t ch = status & 0x0F;

    // Note Off/On, poly pressure, control change, pitch bend.
    if (type == 0x80 || type == 0x90 || type == 0xA0 || type == 0xB0 ||
        type == 0xE0) {
      std::uint8_t d1 = haveData1 ? data1 : tr.u8();
      std::uint8_t d2 = tr.u8();
      if ((d1 | d2) & 0x80) {
        fail("Data byte with high bit set", at);
      }

      if (type == 0x90) {
        song.notes.push_back(
            midi::NoteEv{tick, ch, d1, d2, midi::EvType::NoteOn, trackIndex});
      } else if (type == 0x80) {
        song.notes.push_back(
            midi::NoteEv{tick, ch, d1, d2, midi::EvType::NoteOff, trackIndex});
      }
      // Poly AT, CC, Pitch Bend: nothing a beeper can express
      continue;
    }

    // Program change, channel pressure.
    if (type == 0xC0 || type == 0xD0) {
      if (!haveData1) {
        tr.skip(1);
      }
      continue;
    }

    if (status == 0xFF) {
      std::uint8_t metaType = tr.u8();
      std::uint32_t mlen = read_vlq(tr);

      if (metaType == 0x2F) { // End of Track
        tr.skip(mlen);
        break;
      }
      if (metaType == 0x51 && mlen == 3) { // Set Tempo, us per quarter
        std::uint32_t t0 = tr.u8(), t1 = tr.u8(), t2 = tr.u8();
        song.tempi.push_back(midi::TempoEv{tick, (t0 << 16) | (t1 << 8) | t2});
      } else {
        tr.skip(mlen);
      }
      continue;
    }

    if (status == 0xF0 || status == 0xF7) {
      tr.skip(read_vlq(tr));
      continue;
    }

    std::ostringstream oss;
    oss << "Unsupported or malformed status byte 0x" << std::hex
        << int(status) << " in track " << std::dec << trackIndex;
    fail(oss.str(), at);
  }
  return tick;
}

} // namespace

namespace midi {

Song parse_smf(const std::vector<std::uint8_t> &bytes) {
  Bytes r(bytes);

  Song song;
  song.header = parse_header(r);
  song.notes.reserve(4096);
  song.tempi.reserve(64);

  // Format 0/1 tracks share one timeline. Format 2 tracks are independent
  // patterns; play them one after another.
  const bool sequential = song.header.format == 2;
  std::uint32_t nextStart = 0;

  std::uint16_t found = 0;
  while (found < song.header.nTracks) {
    if (r.done()) {
      fail("Expected " + std::to_string(song.header.nTracks) +
               " tracks, found " + std::to_string(found),
           r.file_offset());
    }
    const std::uint32_t id = r.be32();
    const std::uint32_t len = r.be32();
    Bytes chunk = r.take(len);
    if (id != kMTrk) {
      continue; // alien chunk
    }
    const std::uint32_t end = walk_one_track(chunk, found, nextStart, song);
    if (sequential)
      nextStart = end;
    ++found;
  }

  return song;
}

} // namespace midi
