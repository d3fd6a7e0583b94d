// src/app/preview.hpp
// Compact console summary of a conversion.
// - One line: segment count, total length, policy
// - In verbose mode, the first 10 segments as they will be played

#pragma once
#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <iostream>

#include "midi/events.hpp"
#include "tone/policy.hpp"
#include "tone/types.hpp"

namespace app {

inline void print_summary(const midi::Song &song,
                          const tone::ConversionResult &result,
                          tone::Policy policy, bool verbose) {
  std::cout << song.header.nTracks << " track(s), " << song.notes.size()
            << " note event(s) -> " << result.segments.size()
            << " tone(s), " << std::fixed << std::setprecision(3)
            << result.totalMs / 1000.0 << "s [" << tone::to_string(policy)
            << "]\n";

  if (!verbose)
    return;

  const std::size_t limit = std::min<std::size_t>(10, result.segments.size());
  std::int64_t at = 0;
  for (std::size_t i = 0; i < limit; ++i) {
    const auto &s = result.segments[i];
    at += s.delayMs;
    std::cout << "  t=" << std::setw(8) << at << "ms  " << std::setw(5)
              << s.freqHz << " Hz  " << s.durationMs << " ms\n";
    at += s.durationMs;
  }
  if (result.segments.size() > limit) {
    std::cout << "  ... " << result.segments.size() - limit << " more\n";
  }
}

} // namespace app
