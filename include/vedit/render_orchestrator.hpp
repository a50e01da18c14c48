/**
 * @file render_orchestrator.hpp
 * @brief Four-phase export rendering of one project snapshot
 *
 * @details The RenderOrchestrator class drives the external encoder through
 *          the whole export of one job:
 *
 *          0. Resolve missing asset metadata by probing
 *
 *          1. Render every planned video segment to an intermediate (0-40%)
 *
 *          2. Concatenate the intermediates, or render a black canvas when
 *             the timeline has no video (40-60%)
 *
 *          3. Composite overlay clips (60-80%, skipped without overlays)
 *
 *          4. Mix audio-track clips into the bed (80-100%, skipped without
 *             audio clips)
 *
 * @note All artifacts live in <storage>/temp/<job-id>/ and are deleted when
 *       the run ends, successful or not. The final file is moved to
 *       <storage>/exports/<job-id>.mp4 only after phase 4 succeeded.
 */

#ifndef VEDIT_RENDER_ORCHESTRATOR_HPP
#define VEDIT_RENDER_ORCHESTRATOR_HPP

#include <atomic>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "ffmpeg_executor.hpp"
#include "logging.hpp"
#include "render_commands.hpp"
#include "segment_planner.hpp"
#include "types.hpp"

namespace vedit {

/**
 * @struct RenderSettings
 * @brief Everything a render run reads besides the project.
 */
struct RenderSettings {
  std::string storage_path = "./storage";
  RenderFormat format;
  PlannerOptions planner;
  int segment_workers = 1; //< Concurrent phase-1 renders (0 = CPU limit)
  bool probe_assets = true; //< Fill missing metadata with libavformat

  /// Settings from the process environment (see Config)
  static RenderSettings from_config();
};

/**
 * @class RenderObserver
 * @brief Telemetry sink of one render run.
 * @note Callbacks may come from phase-1 worker threads, but never
 *       concurrently: the orchestrator serializes them.
 */
class RenderObserver {
public:
  virtual ~RenderObserver() = default;

  /// Non-decreasing percentage in [0, 100]
  virtual void on_progress(double percent) = 0;

  virtual void on_phase(const std::string &phase) { (void)phase; }
};

/**
 * @class RenderOrchestrator
 * @brief Renders one project snapshot into one export file.
 *
 * @attention WORKFLOW:
 *
 * 1. Probe assets lacking duration, fps or audio information
 *
 * 2. Plan both video tracks and render each segment (optionally in
 *    parallel, artifacts kept in plan order)
 *
 * 3. Concatenate, composite overlays, mix audio
 *
 * 4. Move the result into exports/
 *
 * Any failed invocation aborts the run with a RenderError.
 */
class RenderOrchestrator {
public:
  /**
   * @param project Snapshot to render (copied; probing fills the copy)
   * @param job_id Names the scratch directory and the output file
   * @param encoder Encoder seam (real binary or a test double)
   * @param settings Render settings
   * @param observer Optional progress/phase sink
   * @param cancel Optional cancellation flag polled between and during
   *               invocations
   */
  RenderOrchestrator(Project project, std::string job_id,
                     EncoderRunner &encoder, RenderSettings settings,
                     RenderObserver *observer = nullptr,
                     const std::atomic<bool> *cancel = nullptr);

  RenderOrchestrator(const RenderOrchestrator &) = delete;
  RenderOrchestrator &operator=(const RenderOrchestrator &) = delete;

  /**
   * @brief Run all phases.
   * @return Path of the finished export
   * @throws RenderError on any failure; the scratch area is removed and no
   *         export file is left behind
   */
  std::string run();

  /// Phase durations of the last run()
  const TimingCollector &timings() const { return timings_; }

  /// Highest progress reported so far
  double progress() const;

private:
  Project project_;
  std::string job_id_;
  EncoderRunner &encoder_;
  RenderSettings settings_;
  RenderObserver *observer_;
  const std::atomic<bool> *cancel_;

  std::filesystem::path scratch_;
  std::vector<RenderSegment> segments_;
  TimingCollector timings_;

  mutable std::mutex progress_mutex_;
  double progress_ = 0.0;

  // **---- Phases ----**

  void resolve_assets();
  std::vector<std::string> render_segments();
  std::string render_segment(std::size_t index);
  std::string concatenate(const std::vector<std::string> &paths,
                          double total_duration);
  std::string composite_overlays(const std::string &base,
                                 double total_duration);
  std::string mix_audio(const std::string &base, double total_duration);
  std::string finalize(const std::string &working);

  // **---- Helpers ----**

  /// Run one invocation, converting failure into RenderError
  void invoke(const Args &args, const std::string &what,
              const ProgressSniffer &on_time = {});

  /// Sniffer mapping encoder time onto [from, to] of the progress range
  ProgressSniffer phase_sniffer(double from, double to, double duration);

  void check_cancelled() const;
  void report(double percent);
  void enter_phase(const std::string &phase);

  /**
   * @brief Log a message with the job prefix.
   */
  void log_info(const std::string &msg);
  void log_phase(const std::string &msg);
};

} // namespace vedit

#endif // VEDIT_RENDER_ORCHESTRATOR_HPP
