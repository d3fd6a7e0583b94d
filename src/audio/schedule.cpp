// src/audio/schedule.cpp

#include "audio/schedule.hpp"

namespace audio {

std::uint64_t ms_to_frames(std::int64_t ms) {
  return static_cast<std::uint64_t>(ms) * kSampleRate / 1000;
}

Schedule build_schedule(const tone::ConversionResult &result) {
  Schedule schedule;
  schedule.tones.reserve(result.segments.size());
  std::uint64_t cursor = 0;
  for (const auto &s : result.segments) {
    cursor += ms_to_frames(s.delayMs);
    const std::uint64_t end = cursor + ms_to_frames(s.durationMs);
    schedule.tones.push_back(
        ScheduledTone{cursor, end, static_cast<double>(s.freqHz)});
    cursor = end;
  }
  if (!schedule.tones.empty())
    schedule.endFrame = cursor + ms_to_frames(kTailMs);
  return schedule;
}

} // namespace audio
