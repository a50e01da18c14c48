/**
 * @file job_store.hpp
 * @brief Export job ledger with optional JSON persistence
 *
 * @details JobStore is the single piece of shared mutable state between the
 *          export workers and status pollers. Every mutation happens under
 *          one mutex and readers receive copies, so a poller never observes
 *          a half-applied update.
 *
 * @note With a ledger path, every status transition rewrites the ledger
 *       through a temporary file and rename(). Progress-only updates are
 *       written once they have advanced by kProgressPersistStep; readers of
 *       the store always see the current value. On construction an existing ledger is
 *       loaded and jobs that were QUEUED or RUNNING are marked FAILED
 *       ("interrupted by restart"); terminal jobs are never re-run.
 */

#ifndef VEDIT_JOB_STORE_HPP
#define VEDIT_JOB_STORE_HPP

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "types.hpp"

namespace vedit {

class JobStore {
public:
  /// Minimum progress advance (percent) that triggers a ledger write
  static constexpr double kProgressPersistStep = 1.0;

  /**
   * @param ledger_path JSON ledger file; empty keeps jobs in memory only
   */
  explicit JobStore(std::string ledger_path = {});

  /**
   * @brief Return the job of `request_id`, creating a QUEUED one if none.
   * @return The job and whether it was created by this call
   * @note Atomic: concurrent calls with one request id create one job.
   */
  std::pair<ExportJob, bool> create_or_get(const std::string &project_id,
                                           const std::string &request_id);

  std::optional<ExportJob> find(const std::string &job_id) const;

  std::optional<ExportJob>
  find_by_request(const std::string &request_id) const;

  /// Jobs of one project, newest first
  std::vector<ExportJob> list_for_project(const std::string &project_id) const;

  // **---- Transitions ----**
  // Each returns false (and changes nothing) when the job is unknown or the
  // transition is not allowed from its current status.

  /// QUEUED -> RUNNING
  bool mark_running(const std::string &job_id);

  /// RUNNING only; progress never decreases
  bool update_progress(const std::string &job_id, double progress);

  /// RUNNING -> COMPLETE, progress 100
  bool mark_complete(const std::string &job_id, const std::string &output_path);

  /// QUEUED or RUNNING -> FAILED; progress is left as-is
  bool mark_failed(const std::string &job_id, const std::string &error);

  /// QUEUED -> FAILED
  bool fail_if_queued(const std::string &job_id, const std::string &error);

  std::size_t size() const;

private:
  mutable std::mutex mutex_;
  std::map<std::string, ExportJob> jobs_;        //< By job id
  std::map<std::string, std::string> requests_;  //< request id -> job id
  std::uint64_t next_sequence_ = 1;
  std::string ledger_path_;
  std::map<std::string, double> persisted_progress_; //< As last written

  void load_locked();
  void persist_locked();
  ExportJob *find_locked(const std::string &job_id);
};

} // namespace vedit

#endif // VEDIT_JOB_STORE_HPP
