// src/tone/segmenter.cpp

#include "tone/segmenter.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace tone {

namespace {

std::int64_t to_ms(double sec) { return std::llround(sec * 1000.0); }

} // namespace

int pitch_to_hz(int pitch) {
  return static_cast<int>(std::lround(440.0 * std::pow(2.0, (pitch - 69) / 12.0)));
}

ConversionResult segment_tones(const std::vector<PitchInterval> &intervals) {
  ConversionResult result;

  std::int64_t cursorMs = 0; // where the previous tone ended
  std::size_t i = 0;
  while (i < intervals.size()) {
    const PitchInterval &first = intervals[i];
    if (!first.pitch) {
      ++i; // silence is accounted for by the next tone's delay
      continue;
    }

    // Extend the run while the next interval continues the same pitch.
    double endSec = first.endSec;
    std::size_t j = i + 1;
    while (j < intervals.size() && intervals[j].pitch == first.pitch &&
           to_ms(intervals[j].startSec) <= to_ms(endSec)) {
      endSec = intervals[j].endSec;
      ++j;
    }

    const std::int64_t startMs = to_ms(first.startSec);
    const std::int64_t endMs = to_ms(endSec);
    ToneSegment seg;
    seg.freqHz = pitch_to_hz(*first.pitch);
    seg.delayMs = std::max<std::int64_t>(0, startMs - cursorMs);
    seg.durationMs = std::max<std::int64_t>(1, endMs - startMs);
    result.segments.push_back(seg);

    cursorMs = std::max(cursorMs, startMs) + seg.durationMs;
    result.totalMs += seg.delayMs + seg.durationMs;
    i = j;
  }

  return result;
}

} // namespace tone
