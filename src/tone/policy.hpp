// src/tone/policy.hpp
// How simultaneous notes collapse into the single pitch a beeper can play.

#pragma once
#include <set>
#include <string>

namespace tone {

enum class Policy { Highest, Lowest, Average };

// "highest" | "lowest" | "average" (case-sensitive).
// Throws common::Error(InvalidPolicy) for anything else.
Policy parse_policy(const std::string &name);

const char *to_string(Policy policy);

// Effective pitch of a non-empty set of sounding pitches.
// Average rounds the mean to the nearest pitch, halves going up.
int select_pitch(Policy policy, const std::multiset<int> &active);

} // namespace tone
