// src/audio/schedule.hpp
// Tone segments laid out on the output timeline, in sample frames.
//
// Kept apart from player.cpp so the timing can be checked without opening a
// sound device.

#pragma once
#include <cstdint>
#include <vector>

#include "tone/types.hpp"

namespace audio {

inline constexpr std::uint32_t kSampleRate = 44100;

// Silence rendered after the last tone so the device has played out every
// queued buffer before it is stopped.
inline constexpr std::int64_t kTailMs = 250;

struct ScheduledTone {
  std::uint64_t startFrame;
  std::uint64_t endFrame;
  double freqHz;
};

struct Schedule {
  std::vector<ScheduledTone> tones;
  std::uint64_t endFrame = 0; // last tone's end plus the tail; 0 when empty
};

std::uint64_t ms_to_frames(std::int64_t ms);

Schedule build_schedule(const tone::ConversionResult &result);

} // namespace audio
