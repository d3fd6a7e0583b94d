// src/tone/script.cpp

#include "tone/script.hpp"
#include "common/error.hpp"

#include <sstream>

namespace tone {

namespace {

// Single-quote a word for sh unless it only holds obviously safe characters.
std::string shell_quote(const std::string &word) {
  bool safe = !word.empty();
  for (char c : word) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') || c == '_' || c == '-' ||
                    c == '.' || c == '/' || c == '+' || c == ':';
    if (!ok) {
      safe = false;
      break;
    }
  }
  if (safe)
    return word;

  std::string quoted = "'";
  for (char c : word) {
    if (c == '\'')
      quoted += "'\\''";
    else
      quoted += c;
  }
  quoted += "'";
  return quoted;
}

std::string emit_shell(const std::vector<ToneSegment> &segments,
                       const std::string &program) {
  const std::string beep = shell_quote(program);
  std::ostringstream oss;
  oss << "#!/bin/sh\n";
  for (const auto &s : segments) {
    oss << beep << " -f " << s.freqHz << " -l " << s.durationMs << " -D "
        << s.delayMs << "\n";
  }
  return oss.str();
}

std::string emit_grub(const std::vector<ToneSegment> &segments) {
  std::ostringstream oss;
  oss << kGrubTempoMs;
  for (const auto &s : segments) {
    if (s.delayMs > 0)
      oss << " 0 " << s.delayMs;
    oss << " " << s.freqHz << " " << s.durationMs;
  }
  oss << "\n";
  return oss.str();
}

} // namespace

std::string emit_script(const std::vector<ToneSegment> &segments,
                        const ScriptOptions &opts) {
  if (segments.empty()) {
    throw common::Error(common::ErrorKind::EmptySequence,
                        "No tone segments to emit");
  }
  if (opts.format == ScriptFormat::Grub)
    return emit_grub(segments);
  return emit_shell(segments, opts.beepProgram);
}

const char *script_extension(ScriptFormat format) {
  return format == ScriptFormat::Grub ? ".grub" : ".sh";
}

} // namespace tone
