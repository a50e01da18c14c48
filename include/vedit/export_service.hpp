/**
 * @file export_service.hpp
 * @brief Idempotent export submission and background job execution
 *
 * @details The ExportService class is the surface a hosting layer maps onto
 *          its endpoints:
 *
 *          - submit(): idempotent on request id, returns immediately
 *
 *          - get_status() / list_exports(): read the persisted records
 *
 *          - cancel(): ends a QUEUED or RUNNING job as FAILED "cancelled"
 *
 *          EXPORT_WORKERS threads pop queued jobs and run a
 *          RenderOrchestrator for each; progress is written to the JobStore
 *          as it is reported.
 *
 * @attention Job state machine: QUEUED -> RUNNING -> COMPLETE | FAILED.
 *            No phase and no job is retried automatically.
 */

#ifndef VEDIT_EXPORT_SERVICE_HPP
#define VEDIT_EXPORT_SERVICE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "ffmpeg_executor.hpp"
#include "job_queue.hpp"
#include "job_store.hpp"
#include "render_orchestrator.hpp"
#include "types.hpp"

namespace vedit {

/// Resolves a project id to a snapshot; nullopt when the project is unknown
using ProjectProvider =
    std::function<std::optional<Project>(const std::string &project_id)>;

/**
 * @class ExportService
 * @brief Owns the job ledger, the job queue and the export workers.
 *
 * @attention RESOURCE ALLOCATION:
 *
 *   - Each running job owns <storage>/temp/<job-id>/ exclusively
 *
 *   - Jobs share nothing else besides the ledger, so workers need no
 *     cross-job locking
 *
 *   - The encoder runner is shared and must be thread-safe
 */
class ExportService {
public:
  /**
   * @param provider Project lookup used at submission
   * @param encoder Encoder seam shared by all workers
   * @param settings Render settings for every job
   * @param num_workers Concurrent jobs (0 = CPU limit)
   * @param ledger_path Job ledger file (empty = in memory)
   */
  ExportService(ProjectProvider provider, EncoderRunner &encoder,
                RenderSettings settings, int num_workers = 2,
                std::string ledger_path = {});

  /// Stops accepting work, drains the queue and joins the workers
  ~ExportService();

  ExportService(const ExportService &) = delete;
  ExportService &operator=(const ExportService &) = delete;

  /**
   * @brief Queue an export of a project.
   *
   * @param project_id Project to export
   * @param request_id Idempotency key; empty generates a fresh one
   * @return The existing job of request_id unchanged, or a new QUEUED job
   * @throws ValidationError if the project is unknown or cannot be rendered
   *         (no job is created)
   */
  ExportJob submit(const std::string &project_id,
                   const std::string &request_id = {});

  std::optional<ExportJob> get_status(const std::string &job_id) const;

  /// Jobs of one project, newest first
  std::vector<ExportJob> list_exports(const std::string &project_id) const;

  /**
   * @brief Request cancellation of a QUEUED or RUNNING job.
   * @return false if the job is unknown or already terminal
   * @note A RUNNING job ends FAILED with "cancelled" once its in-flight
   *       encoder process is killed.
   */
  bool cancel(const std::string &job_id);

  /**
   * @brief Block until a job is terminal or the timeout passes.
   * @return The latest record, nullopt for unknown jobs
   */
  std::optional<ExportJob> wait_for(const std::string &job_id,
                                    std::chrono::milliseconds timeout);

  /// Idempotent; called by the destructor
  void shutdown();

  const JobStore &store() const { return store_; }

private:
  ProjectProvider provider_;
  EncoderRunner &encoder_;
  RenderSettings settings_;
  JobStore store_;
  JobQueue queue_;
  std::vector<std::thread> workers_;
  std::atomic<bool> stopped_{false};

  mutable std::mutex mutex_;
  std::condition_variable terminal_cv_;
  std::map<std::string, std::shared_ptr<std::atomic<bool>>> cancel_flags_;

  void worker_loop(int worker_id);
  void run_job(int worker_id, QueuedExport &job);
  std::shared_ptr<std::atomic<bool>> cancel_flag(const std::string &job_id);
  void notify_terminal(const std::string &job_id);
};

} // namespace vedit

#endif // VEDIT_EXPORT_SERVICE_HPP
