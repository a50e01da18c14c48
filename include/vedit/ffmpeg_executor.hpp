/**
 * @file ffmpeg_executor.hpp
 * @brief External encoder invocation
 *
 * @details Runs the encoder as a child process with an argument vector (no
 *          shell), captures its diagnostic stream and sniffs "time=HH:MM:SS.ss"
 *          progress lines from it.
 *
 *          Failures are reported, never thrown:
 *
 *          - tool_missing: the binary could not be executed at all
 *            (configuration error)
 *
 *          - exit_code != 0: the encoder ran and failed (content error)
 *
 *          - cancelled / timed_out: the process was killed by us
 */

#ifndef VEDIT_FFMPEG_EXECUTOR_HPP
#define VEDIT_FFMPEG_EXECUTOR_HPP

#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace vedit {

/**
 * @struct ProcessResult
 * @brief Outcome of one external-process invocation.
 */
struct ProcessResult {
  int exit_code = 0;         //< Exit status, 128 + signal when killed
  bool tool_missing = false; //< exec failed (ENOENT, EACCES, ...)
  bool cancelled = false;    //< Killed because cancellation was requested
  bool timed_out = false;    //< Killed because the time limit passed
  std::string stderr_text;   //< Diagnostic output (tail when very long)

  bool ok() const {
    return exit_code == 0 && !tool_missing && !cancelled && !timed_out;
  }

  /// Last max_chars characters of the diagnostic output
  std::string stderr_tail(std::size_t max_chars = 500) const;
};

/// Receives encoder time progress in seconds
using ProgressSniffer = std::function<void(double seconds)>;

/**
 * @class EncoderRunner
 * @brief Seam between the render orchestrator and the external encoder.
 * @note Implementations must be safe to call from several threads at once.
 */
class EncoderRunner {
public:
  virtual ~EncoderRunner() = default;

  /**
   * @brief Run the encoder with the given arguments and wait for it.
   *
   * @param args Arguments, without the program name
   * @param on_time Optional progress sniffer
   * @param cancel Optional flag; when it becomes true the process is killed
   */
  virtual ProcessResult run(const std::vector<std::string> &args,
                            const ProgressSniffer &on_time = {},
                            const std::atomic<bool> *cancel = nullptr) = 0;

  /// Binary name or path, for diagnostics
  virtual std::string program() const = 0;
};

/**
 * @class FFmpegRunner
 * @brief EncoderRunner spawning a real encoder binary.
 */
class FFmpegRunner : public EncoderRunner {
public:
  /**
   * @param binary Encoder path; bare names are resolved through PATH
   * @param timeout_sec Per-invocation limit (0 = none)
   */
  explicit FFmpegRunner(std::string binary, double timeout_sec = 0.0);

  ProcessResult run(const std::vector<std::string> &args,
                    const ProgressSniffer &on_time = {},
                    const std::atomic<bool> *cancel = nullptr) override;

  std::string program() const override { return binary_; }

private:
  std::string binary_;
  double timeout_sec_;
};

/**
 * @brief Spawn a program and wait for it, capturing stderr.
 *
 * @param program Path or bare name (PATH lookup)
 * @param args Arguments, without the program name
 * @param on_time Called for each "time=" progress field seen on stderr
 * @param cancel Kill the process when this flag becomes true
 * @param timeout_sec Kill the process after this many seconds (0 = none)
 */
ProcessResult run_process(const std::string &program,
                          const std::vector<std::string> &args,
                          const ProgressSniffer &on_time = {},
                          const std::atomic<bool> *cancel = nullptr,
                          double timeout_sec = 0.0);

/**
 * @brief Parse the last "time=HH:MM:SS.ss" field of an encoder status line.
 * @return Seconds, or nullopt when the line carries no time field
 */
std::optional<double> parse_progress_time(const std::string &line);

} // namespace vedit

#endif // VEDIT_FFMPEG_EXECUTOR_HPP
