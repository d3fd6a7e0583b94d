// src/tone/resolver.hpp
// Sweep-line merge of overlapping notes into one pitch per instant.
//
// OverlapResolver is an explicit state machine:
//   feed(ev)  for every event, in time order (NoteOff before NoteOn at ties)
//   finish()  once, to take the intervals out
//
// State between events: the multiset of sounding pitches and the interval
// opened at the last event. Each event closes the open interval at its own
// time and opens the next one with the pitch the policy picks for the new
// set. Zero-length intervals are never emitted. The sweep starts at t=0 with
// an open silence interval, so a late first note yields leading silence.

#pragma once
#include <cstddef>
#include <optional>
#include <set>
#include <vector>

#include "midi/events.hpp"
#include "tone/policy.hpp"
#include "tone/types.hpp"

namespace tone {

class OverlapResolver {
public:
  explicit OverlapResolver(Policy policy);

  // Throws common::Error(InvalidSweep) if ev goes back in time or comes
  // after finish().
  void feed(const midi::TimedEv &ev);

  // Ends the sweep. Any note still sounding is dropped from the set (the
  // extractor closes them first, so this only matters for hand-built input).
  // Calling it twice throws common::Error(InvalidSweep).
  std::vector<PitchInterval> finish();

  [[nodiscard]] std::size_t active_count() const { return active_.size(); }
  [[nodiscard]] bool finished() const { return finished_; }

private:
  void reopen(double now);

  Policy policy_;
  std::multiset<int> active_;
  double openStart_ = 0.0;
  std::optional<int> openPitch_; // pitch of the interval opened at openStart_
  std::vector<PitchInterval> out_;
  bool finished_ = false;
};

// Run a whole sweep over an ordered event list.
std::vector<PitchInterval> resolve_overlaps(const std::vector<midi::TimedEv> &events,
                                            Policy policy);

} // namespace tone
