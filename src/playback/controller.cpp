// src/playback/controller.cpp

#include "playback/controller.hpp"
#include "common/error.hpp"
#include "common/log.hpp"

#include <cerrno>
#include <cstring>
#include <thread>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <stdlib.h>
#include <unistd.h>

namespace playback {

namespace {

[[noreturn]] void fail(const std::string &what) {
  throw common::Error(common::ErrorKind::Playback,
                      what + ": " + std::strerror(errno));
}

// Closes the descriptor on scope exit.
struct FdCloser {
  int fd = -1;
  ~FdCloser() {
    if (fd >= 0)
      ::close(fd);
  }
};

// Script text in an anonymous temporary file, rewound for reading. The name
// is unlinked straight away, so nothing is left on disk after the run.
int open_script(const std::string &text) {
  std::string name =
      (std::filesystem::temp_directory_path() / "midibeep-XXXXXX").string();
  FdCloser file{::mkostemp(name.data(), O_CLOEXEC)};
  if (file.fd < 0)
    fail("Cannot create temporary script in " + name);
  ::unlink(name.c_str());

  const char *p = text.data();
  std::size_t left = text.size();
  while (left > 0) {
    const ssize_t n = ::write(file.fd, p, left);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      fail("Cannot write temporary script");
    }
    p += n;
    left -= static_cast<std::size_t>(n);
  }
  if (::lseek(file.fd, 0, SEEK_SET) < 0)
    fail("Cannot rewind temporary script");

  return std::exchange(file.fd, -1);
}

} // namespace

PlaybackController::PlaybackController(std::string shell)
    : shell_(std::move(shell)) {}

PlaybackController::~PlaybackController() { stop(); }

void PlaybackController::launch(const std::vector<std::string> &argv,
                                int stdinFd) {
  std::lock_guard<std::mutex> lock(mu_);
  proc_.terminate();
  proc_ = Process{};
  proc_ = Process::spawn(argv, stdinFd);
}

void PlaybackController::start(const std::filesystem::path &script) {
  LOGD("playing ", script.string());
  launch({shell_, script.string()});
}

void PlaybackController::start(const tone::ConversionResult &result,
                               const tone::ScriptOptions &opts) {
  if (result.empty()) {
    stop();
    LOGI("nothing to play");
    return;
  }
  tone::ScriptOptions shellOpts = opts;
  shellOpts.format = tone::ScriptFormat::Shell;
  FdCloser script{open_script(tone::emit_script(result.segments, shellOpts))};
  LOGD("playing ", result.segments.size(), " tone(s)");
  launch({shell_, "-s"}, script.fd);
}

void PlaybackController::stop() {
  std::lock_guard<std::mutex> lock(mu_);
  if (proc_.valid()) {
    proc_.terminate();
    LOGD("playback stopped");
  }
  proc_ = Process{};
}

bool PlaybackController::running() {
  std::lock_guard<std::mutex> lock(mu_);
  return proc_.running();
}

std::optional<int> PlaybackController::wait(std::chrono::milliseconds poll) {
  // Poll instead of blocking in waitpid so stop() can take the lock.
  for (;;) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (!proc_.valid())
        return std::nullopt;
      if (!proc_.running())
        return proc_.exit_code();
    }
    std::this_thread::sleep_for(poll);
  }
}

} // namespace playback
