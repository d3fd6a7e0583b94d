// src/audio/player.hpp
// Software beeper: plays a ConversionResult through the sound card with
// miniaudio, for machines that have no PC speaker (or no `beep`).
//
// Public API (one function):
//   audio::play(result, cancel);
//
// Design notes:
// - Output is what the hardware beeper would make: a 50% duty square wave at
//   the segment frequency, nothing during delays. One pitch at a time.
// - Blocking: returns when the last tone has finished or `cancel` turns true.
// - The .cpp holds the single-header library implementation and the device
//   callback, so headers elsewhere stay clean.

#pragma once
#include <atomic>

#include "tone/types.hpp"

namespace audio {

// Throws std::runtime_error on device errors.
void play(const tone::ConversionResult &result, const std::atomic<bool> &cancel);

} // namespace audio
