/**
 * @file process_supervisor.cpp
 * @brief fork/exec supervisor implementation
 */

#include "projectm_pod/process_supervisor.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <climits>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#include "projectm_pod/logging.hpp"

namespace projectm_pod {

namespace {

using Clock = std::chrono::steady_clock;

/// Time allowed for grandchildren to release the pipes after the child exits
constexpr auto EXIT_GRACE = std::chrono::seconds(2);

/// Upper bound on the post-kill drain of buffered output
constexpr auto DRAIN_LIMIT = std::chrono::seconds(1);

constexpr size_t READ_CHUNK = 64 * 1024;

/// Timeouts past this are treated as unbounded (steady_clock overflows ~292y)
constexpr double MAX_TIMEOUT_SEC = 1e8;

/**
 * @class Pipe
 * @brief RAII pipe2(O_CLOEXEC) pair.
 */
class Pipe {
public:
  Pipe() {
    if (pipe2(fds_, O_CLOEXEC) != 0) {
      error_ = errno;
      fds_[0] = fds_[1] = -1;
    }
  }
  ~Pipe() {
    close_read();
    close_write();
  }

  Pipe(const Pipe &) = delete;
  Pipe &operator=(const Pipe &) = delete;

  bool valid() const { return fds_[0] >= 0; }
  int error() const { return error_; }
  int read_fd() const { return fds_[0]; }
  int write_fd() const { return fds_[1]; }

  void close_read() {
    if (fds_[0] >= 0)
      ::close(fds_[0]);
    fds_[0] = -1;
  }
  void close_write() {
    if (fds_[1] >= 0)
      ::close(fds_[1]);
    fds_[1] = -1;
  }

private:
  int fds_[2] = {-1, -1};
  int error_ = 0;
};

/**
 * @struct Capture
 * @brief One output stream being collected.
 */
struct Capture {
  int fd = -1;
  std::string *text = nullptr;
  bool open = true;
};

/// Read what is available; mark the stream closed on EOF or error
void read_available(Capture &cap, char *buf) {
  for (;;) {
    ssize_t n = ::read(cap.fd, buf, READ_CHUNK);
    if (n > 0) {
      cap.text->append(buf, static_cast<size_t>(n));
      if (static_cast<size_t>(n) < READ_CHUNK)
        return;
      continue;
    }
    if (n < 0 && errno == EINTR)
      continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
      return;
    cap.open = false;
    return;
  }
}

/**
 * @brief poll() both streams until they close or the wait expires.
 * @param wait_ms Max wait for this round (-1 = block)
 */
void pump(Capture *caps, size_t count, int wait_ms, char *buf) {
  struct pollfd pfds[2];
  Capture *owners[2];
  nfds_t n = 0;
  for (size_t i = 0; i < count; ++i) {
    if (!caps[i].open)
      continue;
    pfds[n].fd = caps[i].fd;
    pfds[n].events = POLLIN;
    pfds[n].revents = 0;
    owners[n] = &caps[i];
    ++n;
  }
  if (n == 0)
    return;

  int ready = ::poll(pfds, n, wait_ms);
  if (ready <= 0)
    return; //< Timeout or EINTR; caller re-checks its deadline

  for (nfds_t i = 0; i < n; ++i) {
    if (pfds[i].revents & (POLLIN | POLLHUP | POLLERR | POLLNVAL))
      read_available(*owners[i], buf);
  }
}

int wait_ms_until(Clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                  deadline - Clock::now())
                  .count();
  if (left <= 0)
    return 0;
  return static_cast<int>(std::min<long long>(left, INT_MAX));
}

int decode_wait_status(int status) {
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return -WTERMSIG(status);
  return -1;
}

bool reap(pid_t pid, int &status) {
  for (;;) {
    if (::waitpid(pid, &status, 0) == pid)
      return true;
    if (errno != EINTR)
      return false;
  }
}

/// Close [first, last] in the child; falls back to a close() loop
void close_fd_range(int first, int last) {
  if (first > last)
    return;
#ifdef SYS_close_range
  if (::syscall(SYS_close_range, static_cast<unsigned>(first),
                static_cast<unsigned>(last), 0u) == 0)
    return;
#endif
  for (int fd = first; fd <= last; ++fd)
    ::close(fd);
}

/// Child side: drop every inherited descriptor above stderr except keep_fd
void close_inherited_fds(int keep_fd, int max_fd) {
  if (keep_fd > STDERR_FILENO) {
    close_fd_range(STDERR_FILENO + 1, keep_fd - 1);
    close_fd_range(keep_fd + 1, max_fd);
  } else {
    close_fd_range(STDERR_FILENO + 1, max_fd);
  }
}

void kill_group(pid_t pid) {
  ::kill(-pid, SIGKILL);
  ::kill(pid, SIGKILL); //< In case the child had not reached setpgid yet
}

} // anonymous namespace

ProcessOutcome run_process(const std::vector<std::string> &argv,
                           double timeout_sec) {
  ProcessOutcome outcome;
  auto start = Clock::now();

  if (argv.empty()) {
    outcome.error = "empty command";
    return outcome;
  }

  Pipe out_pipe, err_pipe, exec_pipe;
  for (const Pipe *p : {&out_pipe, &err_pipe, &exec_pipe}) {
    if (!p->valid()) {
      outcome.error = fmt::format("pipe2 failed: {}", std::strerror(p->error()));
      return outcome;
    }
  }

  /// Everything the child touches is prepared before fork()
  std::vector<char *> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto &arg : argv)
    cargv.push_back(const_cast<char *>(arg.c_str()));
  cargv.push_back(nullptr);

  long open_max = ::sysconf(_SC_OPEN_MAX);
  const int max_fd = open_max > 0 && open_max < INT_MAX
                         ? static_cast<int>(open_max) - 1
                         : 1023;

  pid_t pid = ::fork();
  if (pid < 0) {
    outcome.error = fmt::format("fork failed: {}", std::strerror(errno));
    return outcome;
  }

  if (pid == 0) {
    /// Child: async-signal-safe calls only
    ::setpgid(0, 0);
    ::signal(SIGPIPE, SIG_DFL);
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::close(devnull);
    }
    if (::dup2(out_pipe.write_fd(), STDOUT_FILENO) < 0 ||
        ::dup2(err_pipe.write_fd(), STDERR_FILENO) < 0) {
      int e = errno;
      ssize_t ignored = ::write(exec_pipe.write_fd(), &e, sizeof(e));
      (void)ignored;
      _exit(127);
    }
    /// Listening sockets and client connections stay with the server
    close_inherited_fds(exec_pipe.write_fd(), max_fd);
    ::execvp(cargv[0], cargv.data());
    int e = errno;
    ssize_t ignored = ::write(exec_pipe.write_fd(), &e, sizeof(e));
    (void)ignored;
    _exit(127);
  }

  /// Parent
  ::setpgid(pid, pid);
  outcome.pid = pid;
  out_pipe.close_write();
  err_pipe.close_write();
  exec_pipe.close_write();

  /// EOF on the exec pipe means exec succeeded (O_CLOEXEC closed it)
  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(exec_pipe.read_fd(), &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    int status = 0;
    reap(pid, status);
    outcome.status = ProcessStatus::LaunchFailed;
    outcome.exit_code = decode_wait_status(status);
    outcome.error = fmt::format("cannot execute {}: {}", argv[0],
                                std::strerror(child_errno));
    outcome.elapsed_sec =
        std::chrono::duration<double>(Clock::now() - start).count();
    return outcome;
  }

  ::fcntl(out_pipe.read_fd(), F_SETFL, O_NONBLOCK);
  ::fcntl(err_pipe.read_fd(), F_SETFL, O_NONBLOCK);

  Capture caps[2];
  caps[0] = {out_pipe.read_fd(), &outcome.stdout_text, true};
  caps[1] = {err_pipe.read_fd(), &outcome.stderr_text, true};
  std::vector<char> buf(READ_CHUNK);

  const bool bounded = timeout_sec > 0 && timeout_sec <= MAX_TIMEOUT_SEC;
  if (timeout_sec > MAX_TIMEOUT_SEC)
    LOG_DEBUG("Timeout {}s is past {:.0f}s; waiting without a deadline",
              timeout_sec, MAX_TIMEOUT_SEC);
  const auto deadline =
      bounded ? start + std::chrono::duration_cast<Clock::duration>(
                            std::chrono::duration<double>(timeout_sec))
              : Clock::time_point::max();

  bool timed_out = false;
  bool exited = false;
  int status = 0;
  Clock::time_point exited_at;

  for (;;) {
    if (!exited) {
      pid_t r = ::waitpid(pid, &status, WNOHANG);
      if (r == pid) {
        exited = true;
        exited_at = Clock::now();
      }
    }

    if (!caps[0].open && !caps[1].open && exited)
      break;

    if (exited && Clock::now() - exited_at > EXIT_GRACE) {
      /// Leftover group members still hold the pipes
      LOG_DEBUG("pid {} exited but its output pipes stayed open; "
                "killing process group",
                pid);
      ::kill(-pid, SIGKILL);
      break;
    }

    if (!exited && bounded && Clock::now() >= deadline) {
      timed_out = true;
      break;
    }

    /// Short rounds so a child that closed its pipes is reaped promptly
    int wait_ms = 200;
    if (bounded && !exited)
      wait_ms = std::min(wait_ms, wait_ms_until(deadline));
    if (!caps[0].open && !caps[1].open) {
      ::usleep(static_cast<useconds_t>(wait_ms) * 1000);
      continue;
    }
    pump(caps, 2, wait_ms, buf.data());
  }

  if (timed_out) {
    LOG_WARN("pid {} exceeded {:.0f}s; sending SIGKILL to its process group",
             pid, timeout_sec);
    kill_group(pid);
    if (!reap(pid, status)) {
      LOG_ERROR("waitpid({}) failed: {}", pid, std::strerror(errno));
    }

    /// Whatever was already written is still in the pipes
    auto drain_deadline = Clock::now() + DRAIN_LIMIT;
    while ((caps[0].open || caps[1].open) && Clock::now() < drain_deadline)
      pump(caps, 2, wait_ms_until(drain_deadline), buf.data());
  } else {
    /// Pick up anything written between the last poll and exit
    for (auto &cap : caps) {
      if (cap.open)
        read_available(cap, buf.data());
    }
  }

  outcome.status = timed_out ? ProcessStatus::TimedOut : ProcessStatus::Exited;
  outcome.exit_code = decode_wait_status(status);
  outcome.elapsed_sec =
      std::chrono::duration<double>(Clock::now() - start).count();
  return outcome;
}

RenderStatus classify_render(const ProcessOutcome &outcome,
                             const std::filesystem::path &output) {
  if (outcome.status == ProcessStatus::TimedOut)
    return RenderStatus::TimedOut;
  if (outcome.status == ProcessStatus::LaunchFailed)
    return RenderStatus::LaunchFailed;
  if (outcome.exit_code != 0)
    return RenderStatus::NonZeroExit;

  std::error_code ec;
  if (!std::filesystem::exists(output, ec))
    return RenderStatus::OutputMissing;
  return RenderStatus::Success;
}

} // namespace projectm_pod
