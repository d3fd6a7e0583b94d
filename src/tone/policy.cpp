// src/tone/policy.cpp

#include "tone/policy.hpp"
#include "common/error.hpp"

#include <iterator>

namespace tone {

Policy parse_policy(const std::string &name) {
  if (name == "highest")
    return Policy::Highest;
  if (name == "lowest")
    return Policy::Lowest;
  if (name == "average")
    return Policy::Average;
  throw common::Error(common::ErrorKind::InvalidPolicy,
                      "Unknown note mode '" + name +
                          "' (expected highest, lowest or average)");
}

const char *to_string(Policy policy) {
  switch (policy) {
  case Policy::Highest:
    return "highest";
  case Policy::Lowest:
    return "lowest";
  case Policy::Average:
    return "average";
  }
  return "?";
}

int select_pitch(Policy policy, const std::multiset<int> &active) {
  switch (policy) {
  case Policy::Highest:
    return *std::prev(active.end());
  case Policy::Lowest:
    return *active.begin();
  case Policy::Average: {
    // round(sum / n) with ties upward, in integers: floor((2*sum + n) / 2n).
    // Pitches are 0..127 so the sum is never negative.
    long sum = 0;
    for (int p : active)
      sum += p;
    const long n = static_cast<long>(active.size());
    return static_cast<int>((2 * sum + n) / (2 * n));
  }
  }
  throw common::Error(common::ErrorKind::InvalidPolicy, "Invalid note mode");
}

} // namespace tone
