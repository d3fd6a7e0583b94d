// src/midi/events.hpp
// Core MIDI domain types shared across the app.
// Keep this header light: plain structs, no implementation details.

#pragma once
#include <cstdint>
#include <vector>

namespace midi {

enum class EvType { NoteOn, NoteOff };

// A channel note event exactly as read from the file (Note On/Off).
// NoteOn with vel == 0 is kept as NoteOn here; the extractor reclassifies it.
struct NoteEv {
  std::uint32_t tick;      // absolute tick in its track timeline
  std::uint8_t ch;         // MIDI channel 0..15
  std::uint8_t note;       // MIDI note number 0..127
  std::uint8_t vel;        // velocity 0..127
  EvType type;
  std::uint16_t track = 0; // index of the MTrk chunk it came from
};

// A tempo meta event: microseconds per quarter note at a given tick
struct TempoEv {
  std::uint32_t tick;    // absolute tick where tempo takes effect
  std::uint32_t usPerQN; // microseconds per quarter note
};

// Default tempo when a file has no tempo event at tick 0 (120 BPM).
inline constexpr std::uint32_t kDefaultUsPerQN = 500000;

// Parsed SMF header (subset we need)
struct SMFHeader {
  std::uint16_t format = 0;   // 0, 1, or 2
  std::uint16_t nTracks = 0;  // number of track chunks
  std::uint16_t division = 0; // raw division field

  bool isPPQN = true;  // true if PPQN timing, false if SMPTE
  unsigned ppqn = 480; // valid when isPPQN == true
  int smpte_fps = 0;   // valid when isPPQN == false
  int smpte_sub = 0;   // valid when isPPQN == false
};

// The parsed song: header + events flattened across tracks, in track order.
struct Song {
  SMFHeader header;
  std::vector<NoteEv> notes;  // absolute ticks, track 0 first
  std::vector<TempoEv> tempi; // as found, per track (not globally sorted)
};

// One checkpoint of the tempo map: cumulative seconds at a tempo change.
struct TempoSeg {
  std::uint32_t startTick = 0; // segment begins at this absolute tick
  double startSec = 0;         // time in seconds at startTick
  double usPerQN = kDefaultUsPerQN;
};

struct TempoMap {
  unsigned ppqn = 480;            // ticks per quarter note
  std::vector<TempoSeg> segments; // ascending by startTick, first at tick 0
};

// A note event on the wall clock, after tick->time conversion.
struct TimedEv {
  double sec;        // >= 0
  std::uint8_t note; // 0..127
  EvType type;
};

} // namespace midi
