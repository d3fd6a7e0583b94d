// src/common/log.hpp
// Level-gated diagnostics on stderr.
//
//   LOGE("could not open ", path);   // always shown
//   LOGW(...), LOGI(...), LOGD(...)  // gated by logging::set_level()
//
// Arguments are streamed with operator<<, so anything printable works.
// stdout stays reserved for results (summaries, previews).

#pragma once
#include <atomic>
#include <iostream>
#include <sstream>

namespace logging {

enum class Level { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Read by every LOG call; the playback thread logs while main may set it.
inline std::atomic<Level> &threshold() {
  static std::atomic<Level> level{Level::Info};
  return level;
}

inline void set_level(Level level) {
  threshold().store(level, std::memory_order_relaxed);
}

inline bool enabled(Level level) {
  return level <= threshold().load(std::memory_order_relaxed);
}

inline const char *prefix(Level level) {
  switch (level) {
  case Level::Error:
    return "error: ";
  case Level::Warn:
    return "warning: ";
  case Level::Info:
    return "";
  case Level::Debug:
    return "debug: ";
  }
  return "";
}

template <typename... Args> void write(Level level, const Args &...args) {
  if (!enabled(level))
    return;
  // Build the whole line first so concurrent writers don't interleave.
  std::ostringstream oss;
  oss << prefix(level);
  (oss << ... << args);
  oss << '\n';
  std::cerr << oss.str() << std::flush;
}

} // namespace logging

#define LOGE(...) ::logging::write(::logging::Level::Error, __VA_ARGS__)
#define LOGW(...) ::logging::write(::logging::Level::Warn, __VA_ARGS__)
#define LOGI(...) ::logging::write(::logging::Level::Info, __VA_ARGS__)
#define LOGD(...) ::logging::write(::logging::Level::Debug, __VA_ARGS__)
