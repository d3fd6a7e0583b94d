// src/playback/process.hpp
// Owned handle to one child process running in its own process group.
//
// The child calls setsid() before exec, so signalling the group reaches the
// shell and whatever it spawned (the beep currently sounding included).
// Destroying or overwriting a live handle terminates the group and reaps the
// child; a handle never leaves an orphan or a zombie behind.
//
// POSIX only. Not thread-safe on its own; PlaybackController serializes use.

#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace playback {

class Process {
public:
  Process() = default;
  ~Process();

  Process(const Process &) = delete;
  Process &operator=(const Process &) = delete;
  Process(Process &&other) noexcept;
  Process &operator=(Process &&other) noexcept;

  // fork + setsid + execvp(argv[0], argv). A stdinFd >= 0 becomes the
  // child's standard input; the caller keeps ownership of it. Throws
  // common::Error(Playback) if the fork fails or the program cannot be
  // executed.
  static Process spawn(const std::vector<std::string> &argv, int stdinFd = -1);

  [[nodiscard]] bool valid() const { return pid_ > 0; }
  [[nodiscard]] pid_t pid() const { return pid_; }

  // Non-blocking. True while the child has not exited; reaps it once it has.
  bool running();

  // Blocks until the child exits. Returns its exit code, or 128 + signal if
  // it was killed. nullopt for an empty handle.
  std::optional<int> wait();

  // SIGTERM to the whole group, SIGKILL if it is still alive after grace,
  // then reap. No-op on an empty or already reaped handle.
  void terminate(std::chrono::milliseconds grace = std::chrono::milliseconds(200));

  [[nodiscard]] std::optional<int> exit_code() const { return exitCode_; }

private:
  explicit Process(pid_t pid) : pid_(pid) {}
  void record(int status);
  bool exited() const; // exited but not yet reaped
  void release() noexcept;

  pid_t pid_ = -1;
  bool reaped_ = false;
  std::optional<int> exitCode_;
};

} // namespace playback
