// src/tone/convert.hpp
// The whole MIDI -> monophonic tone pipeline behind one call.
//
//   Song -> tempo map -> ordered timed events -> pitch intervals -> segments
//
// Synchronous and free of shared state: safe to run on a worker thread.
// Throws common::Error (MalformedTempoMap, InvalidPolicy); on failure nothing
// is returned. A song without soundable notes is not an error: the result is
// empty and diagnostics.noSoundableEvents is set.

#pragma once
#include "midi/events.hpp"
#include "midi/extract.hpp"
#include "tone/policy.hpp"
#include "tone/types.hpp"

namespace tone {

struct ConvertOptions {
  Policy policy = Policy::Highest;
  midi::ExtractOptions extract;
};

ConversionResult convert(const midi::Song &song, const ConvertOptions &opts = {});

} // namespace tone
