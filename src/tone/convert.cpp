// src/tone/convert.cpp

#include "tone/convert.hpp"
#include "common/log.hpp"
#include "midi/tempo.hpp"
#include "tone/resolver.hpp"
#include "tone/segmenter.hpp"

#include <vector>

namespace tone {

ConversionResult convert(const midi::Song &song, const ConvertOptions &opts) {
  // Constructing the resolver first validates the policy before any work.
  OverlapResolver resolver(opts.policy);

  const midi::TempoMap tempo = midi::build_tempo_map(song);
  LOGD("tempo map: ", tempo.segments.size(), " segment(s), ", tempo.ppqn,
       " ticks/qn");

  midi::ExtractStats stats;
  const std::vector<midi::TimedEv> events =
      midi::extract_events(song, tempo, opts.extract, &stats);

  for (const auto &ev : events) {
    resolver.feed(ev);
  }
  const std::vector<PitchInterval> intervals = resolver.finish();
  LOGD("resolved ", events.size(), " event(s) into ", intervals.size(),
       " interval(s) using '", to_string(opts.policy), "'");

  ConversionResult result = segment_tones(intervals);
  result.diagnostics.filteredEvents = stats.filtered;
  result.diagnostics.unmatchedNoteOffs = stats.unmatchedOffs;
  result.diagnostics.unterminatedNoteOns = stats.unterminatedOns;
  result.diagnostics.noSoundableEvents = stats.noteOns == 0;
  return result;
}

} // namespace tone
