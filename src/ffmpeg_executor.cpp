/**
 * @file ffmpeg_executor.cpp
 * @brief External encoder execution implementation
 *
 * @details fork/execvp with two pipes:
 *
 *          - stderr pipe: diagnostic output and progress lines
 *
 *          - exec pipe (close-on-exec): receives errno when execvp fails,
 *            stays silent when the program started
 */

#include "vedit/ffmpeg_executor.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

namespace vedit {

namespace {

/// Diagnostic bytes kept per invocation (the tail is what matters)
constexpr std::size_t STDERR_KEEP_BYTES = 64 * 1024;

/// Poll interval for cancellation and timeout checks
constexpr int POLL_INTERVAL_MS = 100;

void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

/**
 * @class LineSplitter
 * @brief Splits the diagnostic stream on '\r' and '\n' for progress sniffing.
 * @note The encoder rewrites its status line with '\r', so both terminate.
 */
class LineSplitter {
public:
  explicit LineSplitter(const ProgressSniffer &on_time) : on_time_(on_time) {}

  void feed(const char *data, std::size_t n) {
    if (!on_time_)
      return;
    for (std::size_t i = 0; i < n; ++i) {
      char c = data[i];
      if (c == '\r' || c == '\n') {
        flush();
      } else {
        pending_ += c;
      }
    }
  }

  void flush() {
    if (pending_.empty())
      return;
    if (auto secs = parse_progress_time(pending_))
      on_time_(*secs);
    pending_.clear();
  }

private:
  const ProgressSniffer &on_time_;
  std::string pending_;
};

int wait_child(pid_t pid) {
  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR)
      return -1;
  }
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return -1;
}

} // anonymous namespace

// **---- ProcessResult ----**

std::string ProcessResult::stderr_tail(std::size_t max_chars) const {
  if (stderr_text.size() <= max_chars)
    return stderr_text;
  return stderr_text.substr(stderr_text.size() - max_chars);
}

// **---- Progress Parsing ----**

std::optional<double> parse_progress_time(const std::string &line) {
  auto pos = line.rfind("time=");
  if (pos == std::string::npos)
    return std::nullopt;

  int h = 0;
  int m = 0;
  double s = 0.0;
  if (std::sscanf(line.c_str() + pos + 5, "%d:%d:%lf", &h, &m, &s) != 3)
    return std::nullopt;
  return h * 3600.0 + m * 60.0 + s;
}

// **---- Process Execution ----**

ProcessResult run_process(const std::string &program,
                          const std::vector<std::string> &args,
                          const ProgressSniffer &on_time,
                          const std::atomic<bool> *cancel,
                          double timeout_sec) {
  ProcessResult result;

  /// argv must be fully built before fork (no allocation in the child)
  std::vector<char *> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(const_cast<char *>(program.c_str()));
  for (const auto &a : args)
    argv.push_back(const_cast<char *>(a.c_str()));
  argv.push_back(nullptr);

  int err_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};
  if (pipe2(err_pipe, O_CLOEXEC) == -1 || pipe2(exec_pipe, O_CLOEXEC) == -1) {
    result.exit_code = -1;
    result.stderr_text = fmt::format("pipe2 failed: {}", std::strerror(errno));
    close_fd(err_pipe[0]);
    close_fd(err_pipe[1]);
    return result;
  }

  pid_t pid = fork();
  if (pid == -1) {
    result.exit_code = -1;
    result.stderr_text = fmt::format("fork failed: {}", std::strerror(errno));
    close_fd(err_pipe[0]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[0]);
    close_fd(exec_pipe[1]);
    return result;
  }

  if (pid == 0) {
    /// Child: only async-signal-safe calls from here on
    int devnull = ::open("/dev/null", O_RDWR);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      dup2(devnull, STDOUT_FILENO);
    }
    dup2(err_pipe[1], STDERR_FILENO);
    execvp(argv[0], argv.data());

    int e = errno;
    ssize_t written = ::write(exec_pipe[1], &e, sizeof(e));
    (void)written;
    _exit(127);
  }

  close_fd(err_pipe[1]);
  close_fd(exec_pipe[1]);

  /// EOF on the exec pipe means execvp succeeded
  int exec_errno = 0;
  ssize_t n;
  do {
    n = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (n == -1 && errno == EINTR);
  close_fd(exec_pipe[0]);

  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    wait_child(pid);
    close_fd(err_pipe[0]);
    result.exit_code = 127;
    result.tool_missing = true;
    result.stderr_text = fmt::format("cannot execute '{}': {}", program,
                                     std::strerror(exec_errno));
    return result;
  }

  /// Drain stderr while watching for cancellation and timeout
  LineSplitter splitter(on_time);
  auto started = std::chrono::steady_clock::now();
  bool killed = false;
  char buf[4096];

  struct pollfd pfd;
  pfd.fd = err_pipe[0];
  pfd.events = POLLIN;

  while (true) {
    pfd.revents = 0;
    int ready = poll(&pfd, 1, POLL_INTERVAL_MS);
    if (ready == -1 && errno != EINTR)
      break;

    if (ready > 0) {
      ssize_t got = ::read(err_pipe[0], buf, sizeof(buf));
      if (got == 0)
        break;
      if (got > 0) {
        result.stderr_text.append(buf, static_cast<std::size_t>(got));
        splitter.feed(buf, static_cast<std::size_t>(got));
        if (result.stderr_text.size() > 2 * STDERR_KEEP_BYTES) {
          result.stderr_text.erase(0, result.stderr_text.size() -
                                          STDERR_KEEP_BYTES);
        }
      } else if (errno != EINTR && errno != EAGAIN) {
        break;
      }
    }

    if (killed)
      continue;

    if (cancel && cancel->load()) {
      kill(pid, SIGKILL);
      killed = true;
      result.cancelled = true;
    } else if (timeout_sec > 0.0) {
      double elapsed = std::chrono::duration<double>(
                           std::chrono::steady_clock::now() - started)
                           .count();
      if (elapsed > timeout_sec) {
        kill(pid, SIGKILL);
        killed = true;
        result.timed_out = true;
      }
    }
  }
  splitter.flush();
  close_fd(err_pipe[0]);

  result.exit_code = wait_child(pid);
  return result;
}

// **---- FFmpegRunner ----**

FFmpegRunner::FFmpegRunner(std::string binary, double timeout_sec)
    : binary_(std::move(binary)), timeout_sec_(timeout_sec) {}

ProcessResult FFmpegRunner::run(const std::vector<std::string> &args,
                                const ProgressSniffer &on_time,
                                const std::atomic<bool> *cancel) {
  return run_process(binary_, args, on_time, cancel, timeout_sec_);
}

} // namespace vedit
