// src/app/cli.hpp
// Command-line parsing shared by midibeep and midibeep-play.
// Responsibilities:
//  - Extract the positional MIDI path and validate that it exists.
//  - Parse conversion, output and logging options.
//
// Design notes:
//  * Header-only, like the rest of the app layer.
//  * Bad usage throws app::UsageError (main prints usage, exits 2). A bad
//    --mode value throws common::Error(InvalidPolicy) from tone::parse_policy.
//
// Usage from main.cpp:
//   app::Cli cli = app::parse_cli(argc, argv);
//   if (cli.help) { std::cout << app::usage(argv[0]); return 0; }

#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

#include "common/log.hpp"
#include "tone/policy.hpp"
#include "tone/script.hpp"

namespace app {

struct UsageError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct Cli {
  std::filesystem::path midiPath;
  tone::Policy policy = tone::Policy::Highest;
  std::optional<std::uint8_t> channel; // --channel 0..15
  bool skipDrums = false;
  std::filesystem::path outDir = ".";
  tone::ScriptFormat format = tone::ScriptFormat::Shell;
  std::string beepProgram = "beep";
  bool play = false;
  logging::Level logLevel = logging::Level::Info;
  bool help = false;
};

inline std::string usage(const std::string &argv0) {
  return "Usage:\n  " + argv0 +
         " <file.mid> [options]\n"
         "Options:\n"
         "  --mode <highest|lowest|average>  Pitch kept when notes overlap "
         "(default highest)\n"
         "  --channel <0-15>                 Only convert this MIDI channel\n"
         "  --skip-drums                     Ignore the percussion channel "
         "(channel index 9)\n"
         "  --out-dir <dir>                  Where to write the script "
         "(default .)\n"
         "  --format <sh|grub>               beep shell script or "
         "GRUB_INIT_TUNE line (default sh)\n"
         "  --beep <program>                 beep program named in the "
         "script (default beep)\n"
         "  --play                           Run the script when done; "
         "Ctrl-C stops it\n"
         "  -v, --verbose                    Debug output\n"
         "  -q, --quiet                      Errors only\n"
         "  -h, --help                       This text\n";
}

// Small helper: true if s looks like a flag (starts with '-' and not just "-")
inline bool is_flag_like(const std::string &s) {
  return !s.empty() && s[0] == '-' && s != "-";
}

inline tone::ScriptFormat parse_format(const std::string &s) {
  if (s == "sh")
    return tone::ScriptFormat::Shell;
  if (s == "grub")
    return tone::ScriptFormat::Grub;
  throw UsageError("--format must be 'sh' or 'grub', got '" + s + "'");
}

inline std::uint8_t parse_channel(const std::string &s) {
  std::size_t used = 0;
  int ch = -1;
  try {
    ch = std::stoi(s, &used);
  } catch (const std::exception &) {
    used = 0;
  }
  if (used != s.size() || ch < 0 || ch > 15) {
    throw UsageError("--channel must be a number from 0 to 15, got '" + s +
                     "'");
  }
  return static_cast<std::uint8_t>(ch);
}

// Parse argv into our Cli struct.
// Contract:
//  - Exactly one positional argument: the MIDI file path (must exist).
//  - Options may come before or after it.
inline Cli parse_cli(int argc, char **argv) {
  Cli cli;
  std::optional<std::filesystem::path> midiPath;

  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    auto value = [&](const char *flag) -> std::string {
      if (i + 1 >= argc) {
        throw UsageError(std::string(flag) + " requires a value");
      }
      return argv[++i];
    };

    if (a == "--help" || a == "-h") {
      cli.help = true;
      return cli;
    } else if (a == "--mode") {
      cli.policy = tone::parse_policy(value("--mode"));
    } else if (a == "--channel") {
      cli.channel = parse_channel(value("--channel"));
    } else if (a == "--skip-drums") {
      cli.skipDrums = true;
    } else if (a == "--out-dir") {
      cli.outDir = value("--out-dir");
    } else if (a == "--format") {
      cli.format = parse_format(value("--format"));
    } else if (a == "--beep") {
      cli.beepProgram = value("--beep");
    } else if (a == "--play") {
      cli.play = true;
    } else if (a == "--verbose" || a == "-v") {
      cli.logLevel = logging::Level::Debug;
    } else if (a == "--quiet" || a == "-q") {
      cli.logLevel = logging::Level::Error;
    } else if (is_flag_like(a)) {
      throw UsageError("Unknown option: " + a);
    } else if (midiPath) {
      throw UsageError("Only one MIDI file may be given (got '" +
                       midiPath->string() + "' and '" + a + "')");
    } else {
      midiPath = a;
    }
  }

  if (!midiPath) {
    throw UsageError("Missing MIDI file path");
  }
  if (!std::filesystem::is_regular_file(*midiPath)) {
    throw UsageError("MIDI file not found: " + midiPath->string());
  }
  if (!std::filesystem::is_directory(cli.outDir)) {
    throw UsageError("Output directory not found: " + cli.outDir.string());
  }

  cli.midiPath = std::filesystem::canonical(*midiPath);
  return cli;
}

} // namespace app
