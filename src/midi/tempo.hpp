// src/midi/tempo.hpp
// Timing utilities: build a tempo map and convert ticks -> seconds.
//
// Contract:
//  - build_tempo_map(ppqn, tempi): tempi must already be tick-ordered.
//      * ppqn == 0, an out-of-order entry, or a zero tempo throws
//        common::Error(MalformedTempoMap) naming the offending tick.
//      * Several changes at one tick: the last one wins.
//      * No change at tick 0: 120 BPM until the first one.
//  - build_tempo_map(song): merges the tempo events of every track (stable,
//    so track order breaks ties) and then calls the above. SMPTE files get a
//    fixed-rate map of fps * subframes ticks per second; tempo events do not
//    apply to them.
//  - ticks_to_seconds(tick, map): binary search over the segment checkpoints.
//    Beyond the last tempo change we continue with the last tempo.

#pragma once
#include "midi/events.hpp"

#include <cstdint>
#include <vector>

namespace midi {

TempoMap build_tempo_map(unsigned ppqn, const std::vector<TempoEv> &tempi);

TempoMap build_tempo_map(const Song &song);

double ticks_to_seconds(std::uint32_t tick, const TempoMap &tempo);

} // namespace midi
