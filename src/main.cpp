/**
 * @file main.cpp
 * @brief Entry point for the vedit_export command-line host
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - Export mode: submit the project, poll the job to a terminal
 *            state
 *
 *          - Inspection modes: evaluate the timeline at one instant, print
 *            the segment plan, list the jobs of a project
 *
 * @note Configuration comes from the environment (FFMPEG_PATH, STORAGE_PATH,
 *       EXPORT_WORKERS, ...). See config.hpp.
 */

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>

#include <fmt/core.h>

#include "vedit/config.hpp"
#include "vedit/errors.hpp"
#include "vedit/export_service.hpp"
#include "vedit/ffmpeg_executor.hpp"
#include "vedit/job_store.hpp"
#include "vedit/logging.hpp"
#include "vedit/project.hpp"
#include "vedit/project_io.hpp"
#include "vedit/segment_planner.hpp"
#include "vedit/system.hpp"
#include "vedit/timeline_evaluator.hpp"

using namespace vedit;

namespace {

void print_usage() {
  LOG_WARN("Usage: ./vedit_export <project.json> [--request-id <id>]\n"
           "       ./vedit_export <project.json> --evaluate <seconds>\n"
           "       ./vedit_export <project.json> --plan\n"
           "       ./vedit_export <project.json> --list");
}

std::string ledger_path() {
  return (std::filesystem::path(Config::storage_path()) / "jobs.json")
      .string();
}

// **---- MODES ----**

int evaluate(const Project &project, double time) {
  ActiveLayers layers = evaluate_at(project, time);
  nlohmann::json doc = active_layers_to_json(layers);
  doc["time"] = time;
  fmt::print("{}\n", doc.dump(2));
  return 0;
}

int print_plan(const Project &project) {
  RenderSettings settings = RenderSettings::from_config();
  auto segments = plan_video_tracks(project, settings.planner);

  fmt::print("{:<8} {:<12} {:>10} {:>10} {:>10} {:>10} {:>8} {:<6}\n",
             "track", "clip", "tl_start", "tl_dur", "src_start", "src_end",
             "speed", "kind");
  for (const auto &rs : segments) {
    const PlannedSegment &s = rs.segment;
    const char *kind = s.kind == SegmentKind::Hold     ? "hold"
                       : s.kind == SegmentKind::Filler ? "filler"
                                                       : "ranged";
    fmt::print("{:<8} {:<12} {:>10.3f} {:>10.3f} {:>10.3f} {:>10.3f} "
               "{:>8.3f} {:<6}\n",
               to_string(rs.track), rs.clip->id, s.timeline_start,
               s.timeline_duration, s.source_start, s.source_end, s.speed,
               kind);
  }
  LOG_INFO("{} segments (exhaustion policy: {})", segments.size(),
           to_string(settings.planner.exhaustion));
  return 0;
}

int list_jobs(const Project &project) {
  JobStore store(ledger_path());
  for (const auto &job : store.list_for_project(project.id))
    fmt::print("{}\n", job_to_json(job).dump());
  return 0;
}

int run_export(const Project &project, const std::string &request_id) {
  FFmpegRunner encoder(Config::ffmpeg_path(), Config::encoder_timeout_sec());
  ExportService service(
      [&project](const std::string &id) -> std::optional<Project> {
        if (id != project.id)
          return std::nullopt;
        return project;
      },
      encoder, RenderSettings::from_config(), Config::export_workers(),
      ledger_path());

  ExportJob job = service.submit(project.id, request_id);
  LOG_INFO("Job {} ({}), status {}", job.id, job.request_id,
           to_string(job.status));

  /// Poll until terminal, echoing progress changes
  double last_progress = -1.0;
  while (!is_terminal(job.status)) {
    auto latest = service.wait_for(job.id, std::chrono::milliseconds(500));
    if (!latest)
      break;
    job = *latest;
    if (job.progress != last_progress) {
      LOG_INFO("Progress: {:.1f}%", job.progress);
      last_progress = job.progress;
    }
  }

  fmt::print("{}\n", job_to_json(job).dump(2));
  return job.status == JobStatus::Complete ? 0 : 1;
}

} // namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  if (argc < 2) {
    print_usage();
    return 1;
  }

  std::string project_path = argv[1];
  std::string request_id;
  std::optional<double> eval_time;
  bool plan = false;
  bool list = false;

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--request-id" && i + 1 < argc) {
      request_id = argv[++i];
    } else if (arg == "--evaluate" && i + 1 < argc) {
      try {
        eval_time = std::stod(argv[++i]);
      } catch (const std::exception &) {
        LOG_ERROR("--evaluate expects a number of seconds, got '{}'", argv[i]);
        return 1;
      }
    } else if (arg == "--plan") {
      plan = true;
    } else if (arg == "--list") {
      list = true;
    } else {
      print_usage();
      return 1;
    }
  }

  try {
    Project project = load_project(project_path);
    LOG_INFO("Project '{}' ({}): {} tracks, {} assets, {}", project.name,
             project.id, project.tracks.size(), project.assets.size(),
             format_time(project.total_duration()));

    if (eval_time)
      return evaluate(project, *eval_time);
    if (plan)
      return print_plan(project);
    if (list)
      return list_jobs(project);
    return run_export(project, request_id);
  } catch (const ValidationError &e) {
    LOG_ERROR("Invalid project: {}", e.what());
    return 2;
  } catch (const std::exception &e) {
    LOG_ERROR("{}", e.what());
    return 1;
  }
}
