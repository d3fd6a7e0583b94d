// src/tone/script.hpp
// Render tone segments as text for an external beeper.
//
// Shell (default): a POSIX sh script, one command per segment and line:
//     #!/bin/sh
//     beep -f <hz> -l <ms> -D <delay ms>
// Lines run strictly one after another; nothing is backgrounded.
//
// Grub: a GRUB_INIT_TUNE line, "<tempo> <hz> <len> ...". Tempo 60000 makes
// one length unit one millisecond; delays become "0 <ms>" rests.
//
// Pure formatting, no timing decisions. Zero segments throws
// common::Error(EmptySequence); callers may treat that as "nothing to play".

#pragma once
#include <string>
#include <vector>

#include "tone/types.hpp"

namespace tone {

enum class ScriptFormat { Shell, Grub };

struct ScriptOptions {
  ScriptFormat format = ScriptFormat::Shell;
  std::string beepProgram = "beep"; // Shell only
};

// Tempo that makes GRUB_INIT_TUNE durations read as milliseconds.
inline constexpr int kGrubTempoMs = 60000;

std::string emit_script(const std::vector<ToneSegment> &segments,
                        const ScriptOptions &opts = {});

// File extension for a format: ".sh" or ".grub".
const char *script_extension(ScriptFormat format);

} // namespace tone
