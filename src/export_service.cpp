/**
 * @file export_service.cpp
 * @brief Export job submission and background execution implementation
 *
 * @details Implements the ExportService class:
 *
 *          - Idempotent submission keyed on request id
 *
 *          - Producer-consumer queue feeding EXPORT_WORKERS threads
 *
 *          - Job-prefixed logging
 *
 *          - Cancellation through per-job flags polled by the encoder runner
 */

#include "vedit/export_service.hpp"

#include <filesystem>
#include <stdexcept>

#include <fmt/core.h>

#include "vedit/errors.hpp"
#include "vedit/logging.hpp"
#include "vedit/project.hpp"
#include "vedit/system.hpp"

namespace fs = std::filesystem;

namespace vedit {

namespace {

/**
 * @class JobProgress
 * @brief Writes orchestrator progress into the ledger.
 */
class JobProgress : public RenderObserver {
  JobStore &store_;
  std::string job_id_;

public:
  JobProgress(JobStore &store, std::string job_id)
      : store_(store), job_id_(std::move(job_id)) {}

  void on_progress(double percent) override {
    store_.update_progress(job_id_, percent);
  }

  void on_phase(const std::string &phase) override {
    LOG_INFO("[Job {}] Phase: {}", short_id(job_id_), phase);
  }
};

} // anonymous namespace

ExportService::ExportService(ProjectProvider provider, EncoderRunner &encoder,
                             RenderSettings settings, int num_workers,
                             std::string ledger_path)
    : provider_(std::move(provider)), encoder_(encoder),
      settings_(std::move(settings)), store_(std::move(ledger_path)) {
  int count = resolve_worker_count(num_workers);
  LOG_INFO("Export workers: {}", count);
  for (int i = 0; i < count; ++i)
    workers_.emplace_back(&ExportService::worker_loop, this, i);
}

ExportService::~ExportService() { shutdown(); }

void ExportService::shutdown() {
  if (stopped_.exchange(true))
    return;

  /// Workers drain what is already queued, then exit
  queue_.finish();
  for (auto &w : workers_) {
    if (w.joinable())
      w.join();
  }
}

// **---- Submission ----**

ExportJob ExportService::submit(const std::string &project_id,
                                const std::string &request_id) {
  if (stopped_.load())
    throw std::runtime_error("export service is shut down");

  const std::string key = request_id.empty() ? make_job_id() : request_id;

  /// Idempotency: a known request returns its job whatever its status
  if (auto existing = store_.find_by_request(key))
    return *existing;

  std::optional<Project> project = provider_(project_id);
  if (!project)
    throw ValidationError(fmt::format("project '{}' not found", project_id));
  validate_project(*project);

  auto created = store_.create_or_get(project_id, key);
  ExportJob &job = created.first;
  if (!created.second)
    return job;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancel_flags_[job.id] = std::make_shared<std::atomic<bool>>(false);
  }
  LOG_INFO("[Job {}] Queued export of project '{}' (request {})",
           short_id(job.id), project_id, key);
  queue_.push({job.id, std::move(*project)});
  return job;
}

// **---- Queries ----**

std::optional<ExportJob>
ExportService::get_status(const std::string &job_id) const {
  return store_.find(job_id);
}

std::vector<ExportJob>
ExportService::list_exports(const std::string &project_id) const {
  return store_.list_for_project(project_id);
}

std::optional<ExportJob>
ExportService::wait_for(const std::string &job_id,
                        std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  terminal_cv_.wait_for(lock, timeout, [this, &job_id] {
    auto job = store_.find(job_id);
    return !job || is_terminal(job->status);
  });
  return store_.find(job_id);
}

// **---- Cancellation ----**

std::shared_ptr<std::atomic<bool>>
ExportService::cancel_flag(const std::string &job_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &flag = cancel_flags_[job_id];
  if (!flag)
    flag = std::make_shared<std::atomic<bool>>(false);
  return flag;
}

bool ExportService::cancel(const std::string &job_id) {
  {
    /// Serialized with the completion check in run_job()
    std::lock_guard<std::mutex> lock(mutex_);
    auto job = store_.find(job_id);
    if (!job || is_terminal(job->status))
      return false;
    auto &flag = cancel_flags_[job_id];
    if (!flag)
      flag = std::make_shared<std::atomic<bool>>(false);
    flag->store(true);
  }
  LOG_WARN("[Job {}] Cancellation requested", short_id(job_id));

  /// A queued job never reaches a worker's mark_running()
  if (store_.fail_if_queued(job_id, "cancelled"))
    notify_terminal(job_id);
  return true;
}

void ExportService::notify_terminal(const std::string &job_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancel_flags_.erase(job_id);
  }
  terminal_cv_.notify_all();
}

// **---- Workers ----**

void ExportService::worker_loop(int worker_id) {
  LOG_INFO("[Export Worker {}] Started", worker_id);
  QueuedExport job;
  int jobs_processed = 0;
  while (queue_.pop(job)) {
    run_job(worker_id, job);
    ++jobs_processed;
  }
  LOG_INFO("[Export Worker {}] Finished ({} jobs)", worker_id, jobs_processed);
}

void ExportService::run_job(int worker_id, QueuedExport &job) {
  const std::string id = job.job_id;
  auto flag = cancel_flag(id);

  if (!store_.mark_running(id)) {
    LOG_INFO("[Export Worker {}] Skipping job {} (no longer queued)",
             worker_id, short_id(id));
    notify_terminal(id);
    return;
  }

  LOG_PHASE("[Job {}] ----------------------------------------", short_id(id));
  LOG_INFO("[Job {}] Running on export worker {}", short_id(id), worker_id);

  auto start_time = std::chrono::high_resolution_clock::now();
  JobProgress observer(store_, id);

  try {
    RenderOrchestrator orchestrator(std::move(job.project), id, encoder_,
                                    settings_, &observer, flag.get());
    std::string output = orchestrator.run();

    bool cancelled = false;
    bool completed = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      cancelled = flag->load();
      if (!cancelled)
        completed = store_.mark_complete(id, output);
    }
    if (cancelled) {
      std::error_code ec;
      fs::remove(output, ec);
      throw RenderError(ErrorKind::Cancelled, "cancelled");
    }
    if (!completed)
      LOG_WARN("[Job {}] Finished but could not be marked COMPLETE",
               short_id(id));

    double elapsed = std::chrono::duration<double>(
                         std::chrono::high_resolution_clock::now() -
                         start_time)
                         .count();
    LOG_SUCCESS("[Job {}] Completed ({:.1f}s)", short_id(id), elapsed);
  } catch (const RenderError &e) {
    LOG_ERROR("[Job {}] Failed ({}): {}", short_id(id), to_string(e.kind()),
              e.what());
    store_.mark_failed(id, e.what());
  } catch (const std::exception &e) {
    LOG_ERROR("[Job {}] Failed: {}", short_id(id), e.what());
    store_.mark_failed(id, e.what());
  }

  notify_terminal(id);
}

} // namespace vedit
