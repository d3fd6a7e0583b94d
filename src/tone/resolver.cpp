// src/tone/resolver.cpp

#include "tone/resolver.hpp"
#include "common/error.hpp"
#include "common/log.hpp"

#include <string>
#include <utility>

namespace tone {

OverlapResolver::OverlapResolver(Policy policy) : policy_(policy) {
  // Reject out-of-range values cast into the enum before any event arrives.
  if (policy != Policy::Highest && policy != Policy::Lowest &&
      policy != Policy::Average) {
    throw common::Error(common::ErrorKind::InvalidPolicy,
                        "Invalid note mode value " +
                            std::to_string(static_cast<int>(policy)));
  }
}

void OverlapResolver::feed(const midi::TimedEv &ev) {
  if (finished_) {
    throw common::Error(common::ErrorKind::InvalidSweep,
                        "OverlapResolver: feed() after finish()");
  }
  if (ev.sec < openStart_) {
    throw common::Error(common::ErrorKind::InvalidSweep,
                        "OverlapResolver: event at " + std::to_string(ev.sec) +
                            "s precedes " + std::to_string(openStart_) + "s");
  }

  if (ev.type == midi::EvType::NoteOn) {
    active_.insert(ev.note);
  } else {
    auto it = active_.find(ev.note);
    if (it == active_.end()) {
      return; // nothing sounding at that pitch; the set is unchanged
    }
    active_.erase(it); // one instance only
  }
  reopen(ev.sec);
}

void OverlapResolver::reopen(double now) {
  if (now > openStart_) {
    out_.push_back(PitchInterval{openStart_, now, openPitch_});
  }
  openStart_ = now;
  openPitch_.reset();
  if (!active_.empty()) {
    openPitch_ = select_pitch(policy_, active_);
  }
}

std::vector<PitchInterval> OverlapResolver::finish() {
  if (finished_) {
    throw common::Error(common::ErrorKind::InvalidSweep,
                        "OverlapResolver: finish() called twice");
  }
  finished_ = true;
  if (!active_.empty()) {
    LOGD("resolver: ", active_.size(), " note(s) still sounding at ",
         openStart_, "s, dropped");
    active_.clear();
  }
  openPitch_.reset();
  return std::move(out_);
}

std::vector<PitchInterval> resolve_overlaps(const std::vector<midi::TimedEv> &events,
                                            Policy policy) {
  OverlapResolver resolver(policy);
  for (const auto &ev : events) {
    resolver.feed(ev);
  }
  return resolver.finish();
}

} // namespace tone
