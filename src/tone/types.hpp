// src/tone/types.hpp
// Data passed between the monophonic conversion stages.

#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace tone {

// A stretch of time with one effective pitch; nullopt means silence.
struct PitchInterval {
  double startSec;
  double endSec; // > startSec
  std::optional<int> pitch;
};

// One beeper command: wait delayMs, then sound freqHz for durationMs.
struct ToneSegment {
  int freqHz;             // > 0
  std::int64_t durationMs; // >= 1
  std::int64_t delayMs;    // >= 0, silence before the tone

  bool operator==(const ToneSegment &o) const {
    return freqHz == o.freqHz && durationMs == o.durationMs &&
           delayMs == o.delayMs;
  }
};

// Things the pipeline recovered from without failing.
struct Diagnostics {
  std::size_t filteredEvents = 0;
  std::size_t unmatchedNoteOffs = 0;
  std::size_t unterminatedNoteOns = 0;
  bool noSoundableEvents = false;
};

struct ConversionResult {
  std::vector<ToneSegment> segments;
  std::int64_t totalMs = 0; // sum of every delay and duration
  Diagnostics diagnostics;

  [[nodiscard]] bool empty() const { return segments.empty(); }
};

} // namespace tone
