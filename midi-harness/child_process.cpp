#include "child_process.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <thread>
#include <utility>
#include <fcntl.h>
#include <unistd.h>
#include <sys/select.h>
#include <sys/wait.h>

#include "midi_harness_sys.hpp"

namespace mh {

std::vector<const char*> build_exec_argv(const std::vector<std::string>& args) {
  std::vector<const char*> out;
  if (!args.empty()) {
    out.reserve(args.size() + 1);
    for (const auto& s : args) {
      out.push_back(s.c_str());
    }
    out.push_back(nullptr);
  }
  return out;
}

const char* to_string(TerminationOutcome outcome) {
  switch (outcome) {
  case TerminationOutcome::Exited: return "exited";
  case TerminationOutcome::Graceful: return "graceful";
  case TerminationOutcome::Killed: return "killed";
  case TerminationOutcome::Failed: return "failed";
  }
  return "unknown";
}

std::string TerminationResult::describe() const {
  if (!have_status) {
    return outcome == TerminationOutcome::Failed ? "still running" : "exit status unknown";
  }
  if (WIFEXITED(wait_status)) {
    return "exited with code " + std::to_string(WEXITSTATUS(wait_status));
  }
  if (WIFSIGNALED(wait_status)) {
    int sig = WTERMSIG(wait_status);
    return "killed by signal " + std::to_string(sig) + " (" + ::strsignal(sig) + ")";
  }
  return "wait status " + std::to_string(wait_status);
}

static void set_cloexec(int fd) {
  int flags = fcntl(fd, F_GETFD, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
  }
}

ChildProcess::~ChildProcess() {
  if (launched() && !terminated_) {
    terminate(policy_);
  }
  close_output();
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(other.pid_),
      out_fd_(other.out_fd_),
      exited_(other.exited_),
      reaped_(other.reaped_),
      terminated_(other.terminated_),
      wait_errno_(other.wait_errno_),
      policy_(other.policy_),
      result_(std::move(other.result_)) {
  other.release();
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
  if (this != &other) {
    if (launched() && !terminated_) {
      terminate(policy_);
    }
    close_output();
    pid_ = other.pid_;
    out_fd_ = other.out_fd_;
    exited_ = other.exited_;
    reaped_ = other.reaped_;
    terminated_ = other.terminated_;
    wait_errno_ = other.wait_errno_;
    policy_ = other.policy_;
    result_ = std::move(other.result_);
    other.release();
  }
  return *this;
}

void ChildProcess::release() {
  pid_ = -1;
  out_fd_ = -1;
  exited_ = false;
  reaped_ = false;
  terminated_ = false;
  wait_errno_ = 0;
  result_ = TerminationResult();
}

bool ChildProcess::launch(const std::vector<std::string>& args, std::string& error_message) {
  if (launched()) {
    error_message = "child already launched (PID " + std::to_string(pid_) + ")";
    return false;
  }
  if (args.empty()) {
    error_message = "no command to launch";
    return false;
  }

  // Everything the child touches is prepared before fork.
  std::vector<const char*> argv = build_exec_argv(args);

  int out_pipe[2];
  if (pipe(out_pipe) != 0) {
    error_message = std::string("pipe failed: ") + std::strerror(errno);
    return false;
  }
  // Carries errno back from a failed exec; EOF means exec succeeded.
  int status_pipe[2];
  if (pipe(status_pipe) != 0) {
    error_message = std::string("pipe failed: ") + std::strerror(errno);
    close(out_pipe[0]);
    close(out_pipe[1]);
    return false;
  }
  set_cloexec(out_pipe[0]);
  set_cloexec(status_pipe[0]);
  set_cloexec(status_pipe[1]);

  pid_t pid = fork();
  if (pid < 0) {
    error_message = std::string("fork failed: ") + std::strerror(errno);
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(status_pipe[0]);
    close(status_pipe[1]);
    return false;
  }

  if (pid == 0) {
    // Child: own session and process group, default signal handling
    setsid();
    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);
    signal(SIGPIPE, SIG_DFL);
    sigset_t none;
    sigemptyset(&none);
    sigprocmask(SIG_SETMASK, &none, nullptr);

    dup2(out_pipe[1], STDOUT_FILENO);
    if (out_pipe[1] != STDOUT_FILENO) {
      close(out_pipe[1]);
    }

    execvp(argv[0], const_cast<char* const*>(argv.data()));
    int err = errno;
    ssize_t w = write(status_pipe[1], &err, sizeof(err));
    (void)w;
    _exit(127); // Exec failed
  }

  close(out_pipe[1]);
  close(status_pipe[1]);

  int child_errno = 0;
  ssize_t n;
  do {
    n = read(status_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  close(status_pipe[0]);

  if (n > 0) {
    int status = 0;
    while (sys::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    close(out_pipe[0]);
    error_message = "failed to start '" + args[0] + "': " + std::strerror(child_errno);
    return false;
  }

  pid_ = pid;
  out_fd_ = out_pipe[0];
  exited_ = false;
  reaped_ = false;
  terminated_ = false;
  wait_errno_ = 0;
  result_ = TerminationResult();
  return true;
}

// Returns 0 or the errno of the failed delivery.
int ChildProcess::signal_group(int sig) {
  if (sys::kill(-pid_, sig) == 0) return 0;
  if (errno != ESRCH) return errno;
  // No group by that id (setsid never ran?); fall back to the pid itself.
  if (sys::kill(pid_, sig) == 0) return 0;
  return errno;
}

// Non-blocking check. True once the child has exited. The child is left a
// zombie, so its pid and process group id cannot be reused until reap().
bool ChildProcess::poll_exit() {
  if (exited_) return true;
  while (true) {
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    int r = sys::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT);
    if (r == 0) {
      if (info.si_pid != pid_) return false;
      exited_ = true;
      return true;
    }
    if (errno == EINTR) continue;
    if (errno == ECHILD) {
      // Reaped by someone else; nothing left for us to collect.
      exited_ = true;
      reaped_ = true;
      return true;
    }
    wait_errno_ = errno;
    return false;
  }
}

void ChildProcess::reap() {
  if (reaped_) return;
  int status = 0;
  pid_t r;
  do {
    r = sys::waitpid(pid_, &status, 0);
  } while (r < 0 && errno == EINTR);
  reaped_ = true;
  if (r == pid_) {
    result_.have_status = true;
    result_.wait_status = status;
  }
}

bool ChildProcess::wait_for_exit(std::chrono::milliseconds bound) {
  using clock = std::chrono::steady_clock;
  const auto deadline = clock::now() + bound;
  while (true) {
    if (poll_exit()) return true;
    auto now = clock::now();
    if (now >= deadline) return false;
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    drain_output(std::min(policy_.poll_interval, left + std::chrono::milliseconds(1)));
  }
}

// Discards pending child output so a child blocked on a full pipe can exit.
void ChildProcess::drain_output(std::chrono::milliseconds wait) {
  if (out_fd_ < 0) {
    std::this_thread::sleep_for(wait);
    return;
  }
  fd_set fds;
  FD_ZERO(&fds);
  FD_SET(out_fd_, &fds);
  struct timeval tv{};
  tv.tv_sec = static_cast<time_t>(wait.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((wait.count() % 1000) * 1000);
  int ret = sys::select(out_fd_ + 1, &fds, nullptr, nullptr, &tv);
  if (ret < 0) {
    if (errno != EINTR) std::this_thread::sleep_for(wait);
    return;
  }
  if (ret > 0 && FD_ISSET(out_fd_, &fds)) {
    char buf[4096];
    ssize_t n = read(out_fd_, buf, sizeof(buf));
    if (n == 0) {
      close_output();
    } else if (n < 0 && errno != EINTR && errno != EAGAIN) {
      close_output();
    }
  }
}

void ChildProcess::close_output() {
  if (out_fd_ >= 0) {
    close(out_fd_);
    out_fd_ = -1;
  }
}

const TerminationResult& ChildProcess::terminate(const TerminationPolicy& policy) {
  if (terminated_) return result_;
  terminated_ = true;
  policy_ = policy;

  if (!launched()) {
    result_.outcome = TerminationOutcome::Exited;
    return result_;
  }

  if (poll_exit()) {
    result_.outcome = TerminationOutcome::Exited;
  }

  if (!exited_) {
    int err = signal_group(SIGINT);
    if (err == ESRCH) {
      // Already gone; only the reaping is left.
      if (wait_for_exit(policy.kill_timeout)) {
        result_.outcome = TerminationOutcome::Exited;
      }
    } else if (err != 0) {
      std::cerr << "MH: warning: could not deliver SIGINT to PID " << pid_ << ": "
                << std::strerror(err) << "; escalating to SIGKILL\n";
    } else if (wait_for_exit(policy.grace)) {
      result_.outcome = TerminationOutcome::Graceful;
    }
  }

  if (!exited_) {
    int err = signal_group(SIGKILL);
    if (err != 0 && err != ESRCH) {
      result_.outcome = TerminationOutcome::Failed;
      result_.error_message = "could not deliver SIGKILL to PID " + std::to_string(pid_) + ": " +
                              std::strerror(err);
    } else if (wait_for_exit(policy.kill_timeout)) {
      result_.outcome = err == ESRCH ? TerminationOutcome::Exited : TerminationOutcome::Killed;
    } else {
      result_.outcome = TerminationOutcome::Failed;
      result_.error_message = "PID " + std::to_string(pid_) + " still running " +
                              std::to_string(policy.kill_timeout.count()) + " ms after SIGKILL";
      if (wait_errno_ != 0) {
        result_.error_message += std::string(" (waitid: ") + std::strerror(wait_errno_) + ")";
      }
    }
  }

  if (exited_) {
    // Sweep anything the service left behind in its group before reaping the
    // leader; while it is a zombie the group id cannot name another group.
    // ESRCH is the usual answer.
    if (!reaped_) {
      (void)sys::kill(-pid_, SIGKILL);
    }
    reap();
  } else {
    std::cerr << "MH: error: termination failed: " << result_.error_message
              << "; the service may still hold its port\n";
  }

  close_output();
  return result_;
}

} // namespace mh
