/**
 * @file task_queue.hpp
 * @brief Thread-safe segment task queue and result collection
 *
 * @details Provides:
 *          - TaskQueue: shared queue phase-1 workers pop segment renders from
 *
 *          - ResultCollector: thread-safe slot table for rendered artifacts
 *            and the first failure
 */

#ifndef VEDIT_TASK_QUEUE_HPP
#define VEDIT_TASK_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <mutex>
#include <queue>
#include <string>
#include <vector>

namespace vedit {

/**
 * @struct RenderTask
 * @brief Index of one planned segment in render order.
 */
struct RenderTask {
  std::size_t index = 0;
};

/**
 * @class TaskQueue
 * @brief Thread-safe work queue for phase-1 segment renders.
 *
 * @attention DESIGN:
 *
 * - Workers pop tasks from a shared queue
 *
 * - A long segment (slow source, big frame) does not stall the others
 *
 * - abort() drops pending work so workers stop after their current render
 */
class TaskQueue {
  std::queue<RenderTask> tasks;
  std::mutex mutex;
  std::condition_variable cv;
  std::atomic<bool> done{false};

public:
  /**
   * @brief Add a task to the queue.
   * @note Thread-safe; notifies one waiting worker.
   */
  void push(RenderTask task);

  /**
   * @brief Pop a task from the queue.
   * @note Blocks until a task is available or queue is finished.
   * @param task Output parameter for the task
   * @return true if a task was retrieved, false if queue is empty and done
   */
  bool pop(RenderTask &task);

  /**
   * @brief Signal that no more tasks will be added.
   * @note Wakes all waiting workers so they can exit.
   */
  void finish();

  /// finish() and discard every pending task
  void abort();
};

/**
 * @class ResultCollector
 * @brief Collects rendered artifact paths by segment index.
 * @note Output order follows the task index, not completion order, so
 *       concatenation order is unaffected by worker scheduling.
 */
class ResultCollector {
  std::vector<std::string> paths;
  std::size_t completed = 0;
  std::exception_ptr first_error;
  mutable std::mutex mutex;

public:
  /// Allocate one slot per task
  void reserve(std::size_t n);

  /**
   * @brief Store the artifact of task `index`.
   * @return Number of tasks completed so far
   */
  std::size_t add(std::size_t index, std::string &&path);

  /// Keep the first failure; later ones are dropped
  void fail(std::exception_ptr error);

  bool failed() const;

  /// Rethrow the first recorded failure, if any
  void rethrow_if_failed() const;

  /**
   * @brief Extract all artifact paths in index order.
   * @attention Moves the internal vector out, leaving collector empty.
   */
  std::vector<std::string> extract();
};

} // namespace vedit

#endif // VEDIT_TASK_QUEUE_HPP
