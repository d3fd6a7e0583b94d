// src/midi/extract.cpp

#include "midi/extract.hpp"
#include "midi/tempo.hpp"

#include <algorithm>
#include <map>
#include <utility>
#include <vector>

namespace midi {

namespace {

bool is_off(const NoteEv &n) {
  return n.type == EvType::NoteOff || n.vel == 0;
}

bool keep(const NoteEv &n, const ExtractOptions &opts) {
  if (opts.channel && n.ch != *opts.channel)
    return false;
  if (opts.skipDrums && n.ch == kDrumChannel)
    return false;
  return true;
}

} // namespace

std::vector<TimedEv> extract_events(const Song &song, const TempoMap &tempo,
                                    const ExtractOptions &opts,
                                    ExtractStats *stats) {
  ExtractStats local;
  ExtractStats &st = stats ? *stats : local;
  st = ExtractStats{};

  std::vector<NoteEv> evs;
  evs.reserve(song.notes.size());
  for (const auto &n : song.notes) {
    if (keep(n, opts))
      evs.push_back(n);
    else
      ++st.filtered;
  }

  // Stable: events on one tick stay in track order, then file order.
  std::stable_sort(evs.begin(), evs.end(),
                   [](const NoteEv &a, const NoteEv &b) {
                     if (a.tick != b.tick)
                       return a.tick < b.tick;
                     return a.track < b.track;
                   });

  // Sounding note count per (channel, pitch). Ordered map so the implicit
  // note-offs at the end come out in a deterministic order.
  std::map<std::pair<std::uint8_t, std::uint8_t>, int> sounding;
  auto release = [&sounding](const NoteEv &n) {
    auto it = sounding.find(std::make_pair(n.ch, n.note));
    if (it == sounding.end())
      return false;
    if (--it->second == 0)
      sounding.erase(it);
    return true;
  };

  std::vector<TimedEv> out;
  out.reserve(evs.size());
  std::vector<bool> released;
  for (std::size_t begin = 0, end = 0; begin < evs.size(); begin = end) {
    end = begin;
    while (end < evs.size() && evs[end].tick == evs[begin].tick)
      ++end;
    const double sec = ticks_to_seconds(evs[begin].tick, tempo);

    // NoteOffs that end a note begun on an earlier tick go first. A NoteOff
    // that only matches a NoteOn of this same tick keeps its file position,
    // so the pair becomes a zero-length note instead of a stuck one.
    released.assign(end - begin, false);
    for (std::size_t i = begin; i < end; ++i) {
      if (is_off(evs[i]) && release(evs[i])) {
        released[i - begin] = true;
        out.push_back(TimedEv{sec, evs[i].note, EvType::NoteOff});
      }
    }

    for (std::size_t i = begin; i < end; ++i) {
      if (released[i - begin])
        continue;
      const NoteEv &n = evs[i];
      if (!is_off(n)) {
        ++sounding[std::make_pair(n.ch, n.note)];
        ++st.noteOns;
        out.push_back(TimedEv{sec, n.note, EvType::NoteOn});
      } else if (release(n)) {
        out.push_back(TimedEv{sec, n.note, EvType::NoteOff});
      } else {
        ++st.unmatchedOffs;
      }
    }
  }

  const double endSec = out.empty() ? 0.0 : out.back().sec;
  for (const auto &[key, count] : sounding) {
    for (int i = 0; i < count; ++i) {
      out.push_back(TimedEv{endSec, key.second, EvType::NoteOff});
      ++st.unterminatedOns;
    }
  }

  return out;
}

} // namespace midi
