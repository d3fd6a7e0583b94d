// src/io/io.hpp
// Thin I/O layer over common/util.hpp.
//
// - io::read_all(path)               -> whole file as bytes
// - io::write_script(path, text)     -> write, then mark executable (u+x,g+x,o+x)
// - io::script_path(midi, dir, ext)  -> "<dir>/<midi stem><ext>"
//
// Throws std::runtime_error on errors.

#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include "common/util.hpp"

namespace io {

inline std::vector<std::uint8_t> read_all(const std::string &path) {
  return ::read_all(path);
}

inline std::vector<std::uint8_t> read_all(const std::filesystem::path &p) {
  return ::read_all(p.string());
}

inline std::filesystem::path script_path(const std::filesystem::path &midi,
                                         const std::filesystem::path &outDir,
                                         const std::string &ext) {
  std::filesystem::path name = midi.stem();
  name += ext;
  return outDir / name;
}

// The text is fully rendered before we get here, so a failed conversion never
// leaves a half-written script behind.
inline void write_script(const std::filesystem::path &p,
                         const std::string &text, bool executable = true) {
  ::write_all(p.string(), text);
  if (!executable)
    return;

  namespace fs = std::filesystem;
  std::error_code ec;
  fs::permissions(p,
                  fs::perms::owner_exec | fs::perms::group_exec |
                      fs::perms::others_exec,
                  fs::perm_options::add, ec);
  if (ec) {
    throw std::runtime_error("Could not mark executable: " + p.string() +
                             " (" + ec.message() + ")");
  }
}

} // namespace io
