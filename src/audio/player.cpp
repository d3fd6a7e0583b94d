// src/audio/player.cpp
// Render tone segments as square pulses with miniaudio.
// Blocking call: returns once the last segment and a short silent tail have
// been rendered, or on cancel.

#define MINIAUDIO_IMPLEMENTATION
#include "miniaudio.h"

#include "audio/player.hpp"
#include "audio/schedule.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

namespace {

using audio::kSampleRate;
using audio::ScheduledTone;

constexpr float kAmplitude = 0.25f; // square waves are loud; leave headroom

// Shared playback state the audio thread uses.
struct PlaybackState {
  std::vector<ScheduledTone> tones;
  std::size_t current = 0;  // first tone not yet finished
  double phase = 0.0;       // 0..1 position within the square period
  std::uint64_t frame = 0;  // frames rendered so far
  std::uint64_t endFrame = 0;
  std::atomic<bool> finished{false};
};

// Real-time callback: mono f32, one sample per frame.
void data_callback(ma_device *device, void *pOutput, const void * /*pInput*/,
                   ma_uint32 frameCount) {
  auto *st = reinterpret_cast<PlaybackState *>(device->pUserData);
  float *out = reinterpret_cast<float *>(pOutput);

  for (ma_uint32 i = 0; i < frameCount; ++i, ++st->frame) {
    while (st->current < st->tones.size() &&
           st->frame >= st->tones[st->current].endFrame) {
      ++st->current;
      st->phase = 0.0;
    }

    float sample = 0.0f;
    if (st->current < st->tones.size() &&
        st->frame >= st->tones[st->current].startFrame) {
      const double freq = st->tones[st->current].freqHz;
      sample = st->phase < 0.5 ? kAmplitude : -kAmplitude;
      st->phase += freq / kSampleRate;
      st->phase -= static_cast<int>(st->phase);
    }
    out[i] = sample;
  }

  if (st->frame >= st->endFrame) {
    st->finished.store(true, std::memory_order_relaxed);
  }
}

} // namespace

namespace audio {

void play(const tone::ConversionResult &result, const std::atomic<bool> &cancel) {
  Schedule schedule = build_schedule(result);
  if (schedule.tones.empty())
    return;
  PlaybackState state;
  state.tones = std::move(schedule.tones);
  state.endFrame = schedule.endFrame; // includes the silent tail

  // --- Miniaudio device setup ---
  ma_device_config config = ma_device_config_init(ma_device_type_playback);
  config.playback.format = ma_format_f32;
  config.playback.channels = 1;
  config.sampleRate = kSampleRate;
  config.dataCallback = data_callback;
  config.pUserData = &state;

  ma_device device;
  if (ma_device_init(nullptr, &config, &device) != MA_SUCCESS) {
    throw std::runtime_error("Failed to open playback device");
  }

  if (ma_device_start(&device) != MA_SUCCESS) {
    ma_device_uninit(&device);
    throw std::runtime_error("Failed to start playback device");
  }

  // --- Block until done ---
  // The frame clock advances only inside the callback; poll it.
  const auto start = std::chrono::steady_clock::now();
  const double expectedSec = static_cast<double>(state.endFrame) / kSampleRate;
  while (!state.finished.load(std::memory_order_relaxed) &&
         !cancel.load(std::memory_order_relaxed)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    const auto elapsed =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start)
            .count();
    if (elapsed > expectedSec + 10.0)
      break; // device stalled
  }

  ma_device_stop(&device);
  ma_device_uninit(&device);
}

} // namespace audio
