/**
 * @file render_orchestrator.cpp
 * @brief Export rendering implementation
 *
 * @details Orchestrates the export of one job:
 *
 *          0. Probe asset metadata
 *
 *          1. Plan and render video segments
 *
 *          2. Concatenate
 *
 *          3. Composite overlays
 *
 *          4. Mix audio
 *
 * @note All log messages are prefixed with [Job <short-id>].
 */

#include "vedit/render_orchestrator.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>
#include <thread>

#include <fmt/core.h>

#include "vedit/config.hpp"
#include "vedit/errors.hpp"
#include "vedit/media_probe.hpp"
#include "vedit/project.hpp"
#include "vedit/system.hpp"
#include "vedit/task_queue.hpp"

namespace fs = std::filesystem;

namespace vedit {

namespace {

/**
 * @class ScratchDir
 * @brief Owns <storage>/temp/<job-id>/ for the lifetime of a run.
 */
class ScratchDir {
  fs::path path_;

public:
  explicit ScratchDir(fs::path path) : path_(std::move(path)) {
    std::error_code ec;
    fs::remove_all(path_, ec);
    fs::create_directories(path_, ec);
    if (ec)
      throw RenderError(ErrorKind::Io,
                        fmt::format("cannot create scratch directory '{}': {}",
                                    path_.string(), ec.message()));
  }

  ~ScratchDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec)
      LOG_WARN("Failed to remove scratch directory '{}': {}", path_.string(),
               ec.message());
  }

  ScratchDir(const ScratchDir &) = delete;
  ScratchDir &operator=(const ScratchDir &) = delete;

  const fs::path &path() const { return path_; }
};

void write_text_file(const fs::path &path, const std::string &content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
  out.close();
  if (!out)
    throw RenderError(ErrorKind::Io,
                      fmt::format("cannot write '{}'", path.string()));
}

} // anonymous namespace

// **---- Settings ----**

RenderSettings RenderSettings::from_config() {
  RenderSettings s;
  s.storage_path = Config::storage_path();
  s.format.fps = Config::default_fps();
  s.format.sample_rate = Config::audio_sample_rate();
  s.format.canvas_width = Config::canvas_width();
  s.format.canvas_height = Config::canvas_height();
  s.format.font_path = Config::overlay_font();
  s.planner.chunk_sec = Config::segment_chunk_sec();
  s.planner.hold_epsilon = Config::hold_speed_epsilon();
  s.planner.exhaustion = parse_exhaustion_policy(Config::exhaustion_policy());
  s.segment_workers = Config::segment_workers();
  return s;
}

// **---- Constructor ----**

RenderOrchestrator::RenderOrchestrator(Project project, std::string job_id,
                                       EncoderRunner &encoder,
                                       RenderSettings settings,
                                       RenderObserver *observer,
                                       const std::atomic<bool> *cancel)
    : project_(std::move(project)), job_id_(std::move(job_id)),
      encoder_(encoder), settings_(std::move(settings)), observer_(observer),
      cancel_(cancel) {}

// **---- Logging Helpers ----**

void RenderOrchestrator::log_info(const std::string &msg) {
  LOG_INFO("[Job {}] {}", short_id(job_id_), msg);
}

void RenderOrchestrator::log_phase(const std::string &msg) {
  LOG_PHASE("[Job {}] {}", short_id(job_id_), msg);
}

// **---- Progress and Cancellation ----**

double RenderOrchestrator::progress() const {
  std::lock_guard<std::mutex> lock(progress_mutex_);
  return progress_;
}

void RenderOrchestrator::report(double percent) {
  percent = std::clamp(percent, 0.0, 100.0);
  std::lock_guard<std::mutex> lock(progress_mutex_);
  if (percent <= progress_)
    return;
  progress_ = percent;
  if (observer_)
    observer_->on_progress(percent);
}

void RenderOrchestrator::enter_phase(const std::string &phase) {
  std::lock_guard<std::mutex> lock(progress_mutex_);
  if (observer_)
    observer_->on_phase(phase);
}

void RenderOrchestrator::check_cancelled() const {
  if (cancel_ && cancel_->load())
    throw RenderError(ErrorKind::Cancelled, "cancelled");
}

ProgressSniffer RenderOrchestrator::phase_sniffer(double from, double to,
                                                  double duration) {
  if (duration <= 0.0)
    return {};
  return [this, from, to, duration](double seconds) {
    double frac = std::clamp(seconds / duration, 0.0, 1.0);
    report(from + (to - from) * frac);
  };
}

void RenderOrchestrator::invoke(const Args &args, const std::string &what,
                                const ProgressSniffer &on_time) {
  check_cancelled();
  ProcessResult result = encoder_.run(args, on_time, cancel_);
  if (result.ok())
    return;

  if (result.cancelled)
    throw RenderError(ErrorKind::Cancelled, "cancelled");
  if (result.tool_missing)
    throw RenderError(
        ErrorKind::ExternalToolMissing,
        fmt::format("encoder not found at '{}' (configuration error): {}",
                    encoder_.program(), result.stderr_tail()));
  if (result.timed_out)
    throw RenderError(ErrorKind::ExternalToolError,
                      fmt::format("encoder timed out during {} (encoding "
                                  "error): {}",
                                  what, result.stderr_tail()));
  throw RenderError(ErrorKind::ExternalToolError,
                    fmt::format("encoder exited with code {} (encoding error): "
                                "{}",
                                result.exit_code, result.stderr_tail()));
}

// **---- Main Processing ----**

std::string RenderOrchestrator::run() {
  TIMER_START(total_run);
  timings_.clear();

  try {
    validate_project(project_);
  } catch (const ValidationError &e) {
    throw RenderError(ErrorKind::Validation, e.what());
  }
  check_cancelled();

  // **----- PHASE 0: RESOLVE ASSETS -----**

  if (settings_.probe_assets) {
    TIMER_START(probe);
    resolve_assets();
    TIMER_END(timings_, probe);
  }

  double total_duration = project_.total_duration();
  if (total_duration <= 0.0)
    throw RenderError(ErrorKind::Validation, "No content on timeline");

  log_info(fmt::format("Timeline duration: {} ({:.3f}s)",
                       format_time(total_duration), total_duration));

  ScratchDir scratch(fs::path(settings_.storage_path) / "temp" / job_id_);
  scratch_ = scratch.path();

  // **----- PHASE 1: SEGMENTS -----**

  enter_phase("segments");
  TIMER_START(segments);
  std::vector<std::string> paths = render_segments();
  TIMER_END(timings_, segments);
  report(40.0);

  // **----- PHASE 2: CONCATENATION -----**

  enter_phase("concat");
  TIMER_START(concat);
  std::string working = concatenate(paths, total_duration);
  TIMER_END(timings_, concat);
  report(60.0);

  // **----- PHASE 3: OVERLAYS -----**

  enter_phase("overlays");
  TIMER_START(overlays);
  working = composite_overlays(working, total_duration);
  TIMER_END(timings_, overlays);
  report(80.0);

  // **----- PHASE 4: AUDIO -----**

  enter_phase("audio");
  TIMER_START(audio);
  working = mix_audio(working, total_duration);
  TIMER_END(timings_, audio);

  check_cancelled();
  std::string output = finalize(working);
  report(100.0);

  TIMER_END(timings_, total_run);
  timings_.print_summary(fmt::format("[Job {}]", short_id(job_id_)));
  LOG_SUCCESS("[Job {}] Export written to {}", short_id(job_id_), output);
  return output;
}

// **---- Phase 0 ----**

void RenderOrchestrator::resolve_assets() {
  for (auto &entry : project_.assets) {
    AssetInfo &asset = entry.second;
    if (!complete_asset_metadata(asset)) {
      LOG_WARN("[Job {}] Probe failed for asset '{}' ({}), using defaults",
               short_id(job_id_), asset.id, asset.path);
    }
    if (!asset.has_audio)
      asset.has_audio = false;
  }
}

// **---- Phase 1 ----**

std::vector<std::string> RenderOrchestrator::render_segments() {
  segments_ = plan_video_tracks(project_, settings_.planner);
  const std::size_t total = segments_.size();
  if (total == 0) {
    log_info("No video segments to render");
    return {};
  }

  int num_threads = settings_.segment_workers == 1
                        ? 1
                        : resolve_worker_count(settings_.segment_workers);
  num_threads = std::min<int>(num_threads, static_cast<int>(total));

  if (num_threads == 1) {
    log_phase(fmt::format("Rendering {} segments...", total));
    std::vector<std::string> paths;
    paths.reserve(total);
    for (std::size_t i = 0; i < total; ++i) {
      paths.push_back(render_segment(i));
      report(40.0 * static_cast<double>(i + 1) / total);
    }
    return paths;
  }

  log_phase(fmt::format("Rendering {} segments ({} workers)...", total,
                        num_threads));

  TaskQueue task_queue;
  ResultCollector results;
  results.reserve(total);
  for (std::size_t i = 0; i < total; ++i)
    task_queue.push({i});
  task_queue.finish();

  std::vector<std::thread> workers;
  for (int w = 0; w < num_threads; ++w) {
    workers.emplace_back([this, &task_queue, &results, total]() {
      RenderTask task;
      while (task_queue.pop(task)) {
        try {
          std::string path = render_segment(task.index);
          std::size_t done = results.add(task.index, std::move(path));
          report(40.0 * static_cast<double>(done) / total);
        } catch (...) {
          /// First failure wins; the rest of the queue is dropped
          results.fail(std::current_exception());
          task_queue.abort();
        }
      }
    });
  }
  for (auto &w : workers)
    w.join();

  results.rethrow_if_failed();
  return results.extract();
}

std::string RenderOrchestrator::render_segment(std::size_t index) {
  const RenderSegment &rs = segments_[index];
  const PlannedSegment &seg = rs.segment;
  const AssetInfo &asset = *rs.asset;
  const double fps = asset.fps > 0.0 ? asset.fps : settings_.format.fps;

  std::string stem = fmt::format("clip_{}_seg_{}", rs.clip_index,
                                 rs.segment_index);
  std::string out = (scratch_ / (stem + ".mov")).string();
  std::string what = fmt::format("segment {} of clip '{}'", rs.segment_index,
                                 rs.clip->id);

  switch (seg.kind) {
  case SegmentKind::Ranged: {
    bool source_audio =
        asset.has_audio.value_or(false) && !rs.clip->properties.muted;
    invoke(ranged_segment_args(asset.path, seg, fps, source_audio,
                               settings_.format, out),
           what);
    break;
  }
  case SegmentKind::Hold:
  case SegmentKind::Filler: {
    /// The exhaustion filler shows the last frame before the source end
    double seek = seg.source_start;
    if (seg.kind == SegmentKind::Filler)
      seek = std::max(0.0, seg.source_start - 1.0 / fps);
    bool blackout = seg.kind == SegmentKind::Filler &&
                    settings_.planner.exhaustion == ExhaustionPolicy::Black;

    std::string frame = (scratch_ / (stem + ".jpg")).string();
    invoke(still_frame_args(asset.path, seek, frame), what);
    invoke(hold_loop_args(frame, seg.timeline_duration, fps, settings_.format,
                          out, blackout),
           what);
    std::error_code ec;
    fs::remove(frame, ec);
    break;
  }
  }
  return out;
}

// **---- Phase 2 ----**

std::string RenderOrchestrator::concatenate(
    const std::vector<std::string> &paths, double total_duration) {
  std::string out = (scratch_ / "base.mp4").string();

  if (paths.empty()) {
    log_phase("No video on timeline, rendering black canvas...");
    invoke(blank_canvas_args(total_duration, settings_.format, out),
           "black canvas", phase_sniffer(40.0, 60.0, total_duration));
    return out;
  }

  log_phase(fmt::format("Concatenating {} segments...", paths.size()));
  fs::path list = scratch_ / "concat.txt";
  write_text_file(list, concat_list(paths));
  invoke(concat_args(list.string(), out), "concatenation",
         phase_sniffer(40.0, 60.0, total_duration));
  return out;
}

// **---- Phase 3 ----**

std::string RenderOrchestrator::composite_overlays(const std::string &base,
                                                   double total_duration) {
  std::vector<OverlaySource> overlays;
  for (const auto &track : project_.tracks) {
    if (!is_overlay_kind(track.kind))
      continue;
    for (const auto &clip : track.clips) {
      OverlaySource src{&clip, track.kind, project_.find_asset(clip.asset_id)};
      if (track.kind == TrackKind::OverlayImage && !src.asset) {
        LOG_WARN("[Job {}] Image overlay '{}' has no asset, skipped",
                 short_id(job_id_), clip.id);
        continue;
      }
      overlays.push_back(src);
    }
  }

  FilterGraph graph =
      overlay_graph(overlays, total_duration, settings_.format);
  if (graph.empty()) {
    log_info("No overlays, skipping compositing");
    return base;
  }

  log_phase(fmt::format("Compositing {} overlays...", overlays.size()));
  fs::path script = scratch_ / "overlay_filter.txt";
  write_text_file(script, graph.script());

  std::string out = (scratch_ / "with_ov.mp4").string();
  invoke(overlay_args(base, graph, script.string(), out), "overlays",
         phase_sniffer(60.0, 80.0, total_duration));
  return out;
}

// **---- Phase 4 ----**

std::string RenderOrchestrator::mix_audio(const std::string &base,
                                          double total_duration) {
  std::vector<AudioSource> sources;
  const Track *audio = project_.track(TrackKind::Audio);
  if (audio) {
    for (const auto &clip : audio->clips) {
      const AssetInfo *asset = project_.find_asset(clip.asset_id);
      if (!asset) {
        LOG_WARN("[Job {}] Audio clip '{}' has no asset, skipped",
                 short_id(job_id_), clip.id);
        continue;
      }
      sources.push_back({&clip, asset});
    }
  }

  FilterGraph graph = audio_mix_graph(sources);
  if (graph.empty()) {
    log_info("No audio clips, skipping mix");
    return base;
  }

  log_phase(fmt::format("Mixing {} audio clips...", sources.size()));
  std::string out = (scratch_ / "with_aud.mp4").string();
  invoke(audio_mix_args(base, graph, out), "audio mix",
         phase_sniffer(80.0, 99.0, total_duration));
  return out;
}

// **---- Finalize ----**

std::string RenderOrchestrator::finalize(const std::string &working) {
  fs::path exports = fs::path(settings_.storage_path) / "exports";
  fs::path final_path = exports / (job_id_ + ".mp4");

  std::error_code ec;
  fs::create_directories(exports, ec);
  if (ec)
    throw RenderError(ErrorKind::Io,
                      fmt::format("cannot create '{}': {}", exports.string(),
                                  ec.message()));

  fs::rename(working, final_path, ec);
  if (ec) {
    /// Different filesystems: copy, then let the scratch cleanup remove it
    ec.clear();
    fs::copy_file(working, final_path, fs::copy_options::overwrite_existing,
                  ec);
    if (ec) {
      std::error_code ignored;
      fs::remove(final_path, ignored);
      throw RenderError(ErrorKind::Io,
                        fmt::format("cannot move output to '{}': {}",
                                    final_path.string(), ec.message()));
    }
  }
  return final_path.string();
}

} // namespace vedit
