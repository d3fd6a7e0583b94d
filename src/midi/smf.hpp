// src/midi/smf.hpp
// Public API: parse a Standard MIDI File (SMF) from memory into a Song.
// - No printing here; pure data extraction.
// - Throws common::Error(MalformedMidi) on malformed input, with the offset.

#pragma once
#include <cstdint>
#include <vector>

#include "midi/events.hpp"

namespace midi {

// Parse an entire Standard MIDI File (format 0, 1 or 2) already in memory.
// On success, returns a Song containing:
//   - header: SMFHeader (format, nTracks, timing division info)
//   - notes : raw NoteOn/NoteOff events of every track, tagged with the
//             track index, in file order
//   - tempi : tempo changes from every track, in file order
// Unknown chunk types are skipped, as SMF 1.0 asks readers to do.
// Format 2 tracks are independent patterns and are laid end to end: each
// starts at the tick where the previous one's End of Track fell.
Song parse_smf(const std::vector<std::uint8_t> &bytes);

} // namespace midi
