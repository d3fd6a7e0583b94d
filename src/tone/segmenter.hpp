// src/tone/segmenter.hpp
// Turn resolved pitch intervals into beeper commands.
//
//  - pitch -> Hz with equal temperament, A4 (69) = 440 Hz, rounded.
//  - Adjacent intervals of the same pitch become one tone.
//  - Silence never becomes its own command: leading and inner silences are
//    carried as delayMs on the next tone, trailing silence is dropped.
//  - Interval edges are rounded to whole milliseconds before differencing, so
//    rounding error stays within 1 ms per segment instead of accumulating.
//  - Durations are at least 1 ms.

#pragma once
#include <vector>

#include "tone/types.hpp"

namespace tone {

int pitch_to_hz(int pitch);

ConversionResult segment_tones(const std::vector<PitchInterval> &intervals);

} // namespace tone
