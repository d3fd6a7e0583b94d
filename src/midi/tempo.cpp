// src/midi/tempo.cpp
// Implementation of timing utilities.

#include "midi/tempo.hpp"
#include "common/error.hpp"

#include <algorithm>
#include <iterator>
#include <string>
#include <vector>

namespace midi {

namespace {

[[noreturn]] void malformed(const std::string &what) {
  throw common::Error(common::ErrorKind::MalformedTempoMap, what);
}

} // namespace

TempoMap build_tempo_map(unsigned ppqn, const std::vector<TempoEv> &tempi) {
  if (ppqn == 0) {
    malformed("Ticks per quarter note must be positive");
  }

  double current_usPerQN = kDefaultUsPerQN;
  double accSec = 0.0;
  std::uint32_t lastTick = 0;

  TempoMap map;
  map.ppqn = ppqn;
  map.segments.push_back(TempoSeg{0u, 0.0, current_usPerQN});

  for (const auto &t : tempi) {
    if (t.tick < lastTick) {
      malformed("Tempo change at tick " + std::to_string(t.tick) +
                " comes after tick " + std::to_string(lastTick));
    }
    if (t.usPerQN == 0) {
      malformed("Zero tempo at tick " + std::to_string(t.tick));
    }

    current_usPerQN = static_cast<double>(t.usPerQN);
    if (t.tick == map.segments.back().startTick) {
      // Same tick as the previous checkpoint (or the implicit one at 0):
      // the newer tempo replaces it.
      map.segments.back().usPerQN = current_usPerQN;
      continue;
    }

    // Advance accumulated seconds from lastTick to this tempo-change tick
    // using the tempo that was in force until now.
    const TempoSeg &prev = map.segments.back();
    const double deltaQN = (t.tick - lastTick) / static_cast<double>(ppqn);
    accSec += deltaQN * (prev.usPerQN * 1e-6);

    lastTick = t.tick;
    map.segments.push_back(TempoSeg{t.tick, accSec, current_usPerQN});
  }

  return map;
}

TempoMap build_tempo_map(const Song &song) {
  if (!song.header.isPPQN) {
    // SMPTE: ticks are a fixed fraction of a second. Model it as one
    // "quarter note" per second with fps * subframes ticks per quarter.
    const int ticksPerSec = song.header.smpte_fps * song.header.smpte_sub;
    if (ticksPerSec <= 0) {
      malformed("Invalid SMPTE division " +
                std::to_string(song.header.smpte_fps) + " fps x " +
                std::to_string(song.header.smpte_sub));
    }
    return build_tempo_map(static_cast<unsigned>(ticksPerSec),
                           {TempoEv{0, 1000000}});
  }

  std::vector<TempoEv> tempi = song.tempi;
  std::stable_sort(
      tempi.begin(), tempi.end(),
      [](const TempoEv &a, const TempoEv &b) { return a.tick < b.tick; });
  return build_tempo_map(song.header.ppqn, tempi);
}

double ticks_to_seconds(std::uint32_t tick, const TempoMap &tempo) {
  if (tempo.segments.empty()) {
    return tick / static_cast<double>(tempo.ppqn) * (kDefaultUsPerQN * 1e-6);
  }

  // Last segment whose startTick <= tick. segments[0] starts at 0, so the
  // upper_bound result is never begin().
  auto it = std::upper_bound(
      tempo.segments.begin(), tempo.segments.end(), tick,
      [](std::uint32_t t, const TempoSeg &s) { return t < s.startTick; });
  const TempoSeg &seg = *std::prev(it);

  const double deltaQN = (tick - seg.startTick) / static_cast<double>(tempo.ppqn);
  return seg.startSec + deltaQN * (seg.usPerQN * 1e-6);
}

} // namespace midi
