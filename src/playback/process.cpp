// src/playback/process.cpp

#include "playback/process.hpp"
#include "common/error.hpp"
#include "common/log.hpp"

#include <cerrno>
#include <cstring>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace playback {

namespace {

[[noreturn]] void fail(const std::string &what, int err) {
  throw common::Error(common::ErrorKind::Playback,
                      what + ": " + std::strerror(err));
}

} // namespace

Process::~Process() { release(); }

Process::Process(Process &&other) noexcept
    : pid_(std::exchange(other.pid_, -1)),
      reaped_(std::exchange(other.reaped_, false)),
      exitCode_(std::exchange(other.exitCode_, std::nullopt)) {}

Process &Process::operator=(Process &&other) noexcept {
  if (this != &other) {
    release();
    pid_ = std::exchange(other.pid_, -1);
    reaped_ = std::exchange(other.reaped_, false);
    exitCode_ = std::exchange(other.exitCode_, std::nullopt);
  }
  return *this;
}

void Process::release() noexcept {
  if (valid() && !reaped_) {
    try {
      terminate();
    } catch (const std::exception &e) {
      LOGE("could not stop process ", pid_, ": ", e.what());
    }
  }
  pid_ = -1;
  reaped_ = false;
}

Process Process::spawn(const std::vector<std::string> &argv, int stdinFd) {
  if (argv.empty()) {
    throw common::Error(common::ErrorKind::Playback, "Empty command line");
  }

  std::vector<char *> args;
  args.reserve(argv.size() + 1);
  for (const auto &a : argv)
    args.push_back(const_cast<char *>(a.c_str()));
  args.push_back(nullptr);

  // The child writes errno here if exec fails; a successful exec closes the
  // pipe (CLOEXEC) and the parent reads EOF.
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    fail("pipe2", errno);
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    const int err = errno;
    ::close(fds[0]);
    ::close(fds[1]);
    fail("fork", err);
  }

  if (pid == 0) {
    // Child: only async-signal-safe calls from here on.
    ::close(fds[0]);
    ::setsid();
    if (stdinFd < 0 || ::dup2(stdinFd, STDIN_FILENO) >= 0) {
      ::execvp(args[0], args.data());
    }
    const int err = errno;
    ssize_t ignored = ::write(fds[1], &err, sizeof err);
    (void)ignored;
    ::_exit(127);
  }

  ::close(fds[1]);
  int childErr = 0;
  ssize_t n;
  do {
    n = ::read(fds[0], &childErr, sizeof childErr);
  } while (n < 0 && errno == EINTR);
  ::close(fds[0]);

  Process proc(pid);
  if (n == static_cast<ssize_t>(sizeof childErr)) {
    proc.wait(); // reap the failed child
    fail("Cannot run '" + argv[0] + "'", childErr);
  }
  LOGD("spawned ", argv[0], " as pid ", pid);
  return proc;
}

void Process::record(int status) {
  reaped_ = true;
  if (WIFEXITED(status))
    exitCode_ = WEXITSTATUS(status);
  else if (WIFSIGNALED(status))
    exitCode_ = 128 + WTERMSIG(status);
}

bool Process::running() {
  if (!valid() || reaped_)
    return false;
  int status = 0;
  pid_t r;
  do {
    r = ::waitpid(pid_, &status, WNOHANG);
  } while (r < 0 && errno == EINTR);
  if (r == 0)
    return true;
  if (r == pid_)
    record(status);
  else
    reaped_ = true; // ECHILD: someone else reaped it
  return false;
}

std::optional<int> Process::wait() {
  if (!valid())
    return std::nullopt;
  if (!reaped_) {
    int status = 0;
    pid_t r;
    do {
      r = ::waitpid(pid_, &status, 0);
    } while (r < 0 && errno == EINTR);
    if (r == pid_)
      record(status);
    else
      reaped_ = true;
  }
  return exitCode_;
}

void Process::terminate(std::chrono::milliseconds grace) {
  if (!valid() || reaped_)
    return;

  // Negative pid: the whole group, which setsid() made equal to our child.
  ::kill(-pid_, SIGTERM);

  const auto deadline = std::chrono::steady_clock::now() + grace;
  bool killed = false;
  while (!exited()) {
    if (!killed && std::chrono::steady_clock::now() >= deadline) {
      LOGD("pid ", pid_, " ignored SIGTERM, sending SIGKILL");
      ::kill(-pid_, SIGKILL);
      killed = true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  // The leader is a zombie until reaped, so the group id cannot have been
  // recycled yet. Take down anything the shell left behind, then reap.
  ::kill(-pid_, SIGKILL);
  wait();
}

bool Process::exited() const {
  siginfo_t info{};
  if (::waitid(P_PID, static_cast<id_t>(pid_), &info,
               WEXITED | WNOHANG | WNOWAIT) != 0) {
    return errno != EINTR; // ECHILD: nothing left to wait for
  }
  return info.si_pid == pid_;
}

} // namespace playback
