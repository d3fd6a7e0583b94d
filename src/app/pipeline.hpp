// src/app/pipeline.hpp
// File -> Song -> ConversionResult, plus the diagnostics chatter both
// executables print along the way.

#pragma once
#include "app/cli.hpp"
#include "common/log.hpp"
#include "io/io.hpp"
#include "midi/smf.hpp"
#include "tone/convert.hpp"

namespace app {

inline void report_diagnostics(const tone::Diagnostics &d) {
  if (d.noSoundableEvents) {
    LOGW("no soundable notes in this file");
  }
  if (d.filteredEvents > 0) {
    LOGD(d.filteredEvents, " note event(s) dropped by channel filters");
  }
  if (d.unmatchedNoteOffs > 0) {
    LOGD(d.unmatchedNoteOffs, " note-off(s) without a matching note-on ignored");
  }
  if (d.unterminatedNoteOns > 0) {
    LOGI(d.unterminatedNoteOns, " note(s) never released; closed at the end");
  }
}

inline tone::ConversionResult convert_file(const Cli &cli, midi::Song &song) {
  LOGD("reading ", cli.midiPath.string());
  song = midi::parse_smf(io::read_all(cli.midiPath));

  tone::ConvertOptions opts;
  opts.policy = cli.policy;
  opts.extract.channel = cli.channel;
  opts.extract.skipDrums = cli.skipDrums;

  tone::ConversionResult result = tone::convert(song, opts);
  report_diagnostics(result.diagnostics);
  return result;
}

} // namespace app
