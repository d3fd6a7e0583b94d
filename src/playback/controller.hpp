// src/playback/controller.hpp
// Start/stop control over the external beeper run.
//
// - At most one run at a time: start() stops the previous run first.
// - stop() kills the whole process group at once (the current tone is cut
//   short, nothing queued after it runs) and is a no-op when idle.
// - The destructor stops a run in flight.
// - All public members may be called from any thread.

#pragma once
#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "playback/process.hpp"
#include "tone/script.hpp"
#include "tone/types.hpp"

namespace playback {

class PlaybackController {
public:
  explicit PlaybackController(std::string shell = "/bin/sh");
  ~PlaybackController();

  PlaybackController(const PlaybackController &) = delete;
  PlaybackController &operator=(const PlaybackController &) = delete;

  // Run a script file written earlier: "<shell> <script>".
  void start(const std::filesystem::path &script);

  // Render and run a result directly: "<shell> -s" reading the script text
  // from an unlinked temporary file on stdin, so its length is not bound by
  // the argument size limit. An empty result stops any previous run and
  // starts nothing.
  void start(const tone::ConversionResult &result,
             const tone::ScriptOptions &opts = {});

  void stop();

  [[nodiscard]] bool running();

  // Blocks until the current run ends (or is stopped from another thread).
  // Returns its exit code; nullopt if nothing was started.
  std::optional<int> wait(std::chrono::milliseconds poll = std::chrono::milliseconds(10));

private:
  void launch(const std::vector<std::string> &argv, int stdinFd = -1);

  std::mutex mu_;
  std::string shell_;
  Process proc_;
};

} // namespace playback
