// src/common/error.hpp
// Structured failures raised by the conversion pipeline and playback layer.
// Everything derives from std::runtime_error so callers that only care about
// the message can keep catching std::exception.

#pragma once
#include <stdexcept>
#include <string>

namespace common {

enum class ErrorKind {
  MalformedMidi,     // SMF bytes could not be decoded
  MalformedTempoMap, // bad division or non-monotonic tempo entries
  InvalidPolicy,     // unknown overlap resolution policy
  EmptySequence,     // script emitter given zero segments
  InvalidSweep,      // resolver fed out of time order or after finish()
  Playback           // external process could not be spawned
};

inline const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::MalformedMidi:
    return "MalformedMidi";
  case ErrorKind::MalformedTempoMap:
    return "MalformedTempoMap";
  case ErrorKind::InvalidPolicy:
    return "InvalidPolicy";
  case ErrorKind::EmptySequence:
    return "EmptySequence";
  case ErrorKind::InvalidSweep:
    return "InvalidSweep";
  case ErrorKind::Playback:
    return "Playback";
  }
  return "Unknown";
}

class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

} // namespace common
