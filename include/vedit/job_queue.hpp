/**
 * @file job_queue.hpp
 * @brief Thread-safe export job queue for producer-consumer pattern
 *
 * @details Decouples submission from rendering:
 *
 *          - submit() (producer) records the job and pushes its id
 *
 *          - Export workers (consumers) pop ids and run the orchestrator
 *
 *          - The caller never waits on a render
 */

#ifndef VEDIT_JOB_QUEUE_HPP
#define VEDIT_JOB_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>

#include "types.hpp"

namespace vedit {

/**
 * @struct QueuedExport
 * @brief A job waiting for an export worker.
 */
struct QueuedExport {
  std::string job_id;
  Project project; //< Snapshot taken at submission
};

/**
 * @class JobQueue
 * @brief Thread-safe queue for export jobs (producer-consumer pattern).
 *
 * @attention USAGE:
 *
 *   - ExportService::submit() calls push() for newly created jobs only
 *
 *   - Export workers call pop() in a loop
 *
 *   - Call finish() on shutdown; workers drain what is left, then exit
 */
class JobQueue {
public:
  /**
   * @brief Push a job to the queue.
   * @param job The export to run
   */
  void push(QueuedExport job);

  /**
   * @brief Pop a job from the queue (blocking).
   * @param job Output: the export to run
   * @return true if job was retrieved, false if queue is finished
   */
  bool pop(QueuedExport &job);

  /**
   * @brief Signal that no more jobs will be pushed.
   */
  void finish();

  /**
   * @brief Check if queue is finished and empty.
   */
  bool is_done() const { return done_.load() && empty(); }

  /**
   * @brief Check if queue is empty.
   */
  bool empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.empty();
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<QueuedExport> jobs_;
  std::atomic<bool> done_{false};
};

} // namespace vedit

#endif // VEDIT_JOB_QUEUE_HPP
