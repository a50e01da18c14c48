/**
 * @file task_queue.cpp
 * @brief Thread-safe task queue and result collection implementation
 *
 * @details Provides implementations for:
 *
 *          - TaskQueue: shared queue for phase-1 segment renders
 *
 *          - ResultCollector: thread-safe slot table for rendered artifacts
 */

#include "vedit/task_queue.hpp"

namespace vedit {

// **----- TaskQueue Implementation -----**

void TaskQueue::push(RenderTask task) {
  std::lock_guard<std::mutex> lock(mutex);
  tasks.push(task);
  cv.notify_one();
}

bool TaskQueue::pop(RenderTask &task) {
  std::unique_lock<std::mutex> lock(mutex);
  cv.wait(lock, [this] { return !tasks.empty() || done.load(); });
  if (tasks.empty())
    return false;
  task = tasks.front();
  tasks.pop();
  return true;
}

void TaskQueue::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    done.store(true);
  }
  cv.notify_all();
}

void TaskQueue::abort() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    std::queue<RenderTask>().swap(tasks);
  }
  finish();
}

// **----- ResultCollector Implementation -----**

void ResultCollector::reserve(std::size_t n) {
  std::lock_guard<std::mutex> lock(mutex);
  paths.resize(n);
}

std::size_t ResultCollector::add(std::size_t index, std::string &&path) {
  std::lock_guard<std::mutex> lock(mutex);
  if (index >= paths.size())
    paths.resize(index + 1);
  paths[index] = std::move(path);
  return ++completed;
}

void ResultCollector::fail(std::exception_ptr error) {
  std::lock_guard<std::mutex> lock(mutex);
  if (!first_error)
    first_error = error;
}

bool ResultCollector::failed() const {
  std::lock_guard<std::mutex> lock(mutex);
  return static_cast<bool>(first_error);
}

void ResultCollector::rethrow_if_failed() const {
  std::lock_guard<std::mutex> lock(mutex);
  if (first_error)
    std::rethrow_exception(first_error);
}

std::vector<std::string> ResultCollector::extract() {
  std::lock_guard<std::mutex> lock(mutex);
  return std::move(paths);
}

} // namespace vedit
