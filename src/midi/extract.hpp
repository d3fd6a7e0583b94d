// src/midi/extract.hpp
// Flatten a Song into one wall-clock ordered stream of note events.
//
// Ordering: by tick. On one tick, NoteOffs that end a note begun earlier come
// first; everything else keeps track order then file order. A NoteOn and
// NoteOff of one pitch on the same tick therefore pair up as a zero-length
// note. Tick->seconds is strictly increasing, so this is also the time order.
//
// Cleanup performed on the way:
//  - NoteOn with velocity 0 becomes NoteOff.
//  - NoteOff with no sounding NoteOn on that channel/pitch is dropped.
//  - Notes still sounding at the end are closed at the time of the last
//    event, so nothing is left stuck on.

#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "midi/events.hpp"

namespace midi {

// General MIDI percussion lives on channel 10 (index 9).
inline constexpr std::uint8_t kDrumChannel = 9;

struct ExtractOptions {
  std::optional<std::uint8_t> channel; // keep only this channel (0..15)
  bool skipDrums = false;              // drop kDrumChannel
};

struct ExtractStats {
  std::size_t filtered = 0;        // dropped by channel/drum filters
  std::size_t unmatchedOffs = 0;   // NoteOff without a sounding note
  std::size_t unterminatedOns = 0; // closed implicitly at the end
  std::size_t noteOns = 0;         // soundable NoteOn events kept
};

std::vector<TimedEv> extract_events(const Song &song, const TempoMap &tempo,
                                    const ExtractOptions &opts = {},
                                    ExtractStats *stats = nullptr);

} // namespace midi
