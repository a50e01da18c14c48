/**
 * @file job_store.cpp
 * @brief Export job ledger implementation
 */

#include "vedit/job_store.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "vedit/errors.hpp"
#include "vedit/logging.hpp"
#include "vedit/project_io.hpp"
#include "vedit/system.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace vedit {

JobStore::JobStore(std::string ledger_path)
    : ledger_path_(std::move(ledger_path)) {
  std::lock_guard<std::mutex> lock(mutex_);
  load_locked();
}

// **---- Persistence ----**

void JobStore::load_locked() {
  if (ledger_path_.empty() || !fs::exists(ledger_path_))
    return;

  std::ifstream in(ledger_path_);
  json doc = json::parse(in, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    LOG_ERROR("Job ledger '{}' is unreadable, starting empty", ledger_path_);
    return;
  }

  int interrupted = 0;
  const std::string now = iso_utc_now();
  for (const auto &record : doc.value("jobs", json::array())) {
    ExportJob job;
    try {
      job = job_from_json(record);
    } catch (const ValidationError &e) {
      LOG_WARN("Skipping ledger record: {}", e.what());
      continue;
    }
    if (!is_terminal(job.status)) {
      job.status = JobStatus::Failed;
      job.error = "interrupted by restart";
      job.updated_at = now;
      ++interrupted;
    }
    next_sequence_ = std::max(next_sequence_, job.sequence + 1);
    requests_[job.request_id] = job.id;
    jobs_[job.id] = std::move(job);
  }

  LOG_INFO("Loaded {} jobs from {}", jobs_.size(), ledger_path_);
  if (interrupted > 0) {
    LOG_WARN("{} interrupted jobs marked FAILED", interrupted);
    persist_locked();
  }
}

void JobStore::persist_locked() {
  if (ledger_path_.empty())
    return;

  json jobs = json::array();
  for (const auto &kv : jobs_) {
    jobs.push_back(job_to_json(kv.second));
    persisted_progress_[kv.first] = kv.second.progress;
  }
  json doc = {{"jobs", jobs}};

  fs::path target(ledger_path_);
  fs::path tmp = target;
  tmp += ".tmp";

  std::error_code ec;
  if (target.has_parent_path())
    fs::create_directories(target.parent_path(), ec);

  {
    std::ofstream out(tmp, std::ios::trunc);
    out << doc.dump(2);
    out.close();
    if (!out) {
      LOG_ERROR("Failed to write job ledger '{}'", tmp.string());
      return;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec)
    LOG_ERROR("Failed to replace job ledger '{}': {}", ledger_path_,
              ec.message());
}

ExportJob *JobStore::find_locked(const std::string &job_id) {
  auto it = jobs_.find(job_id);
  return it == jobs_.end() ? nullptr : &it->second;
}

// **---- Queries ----**

std::pair<ExportJob, bool>
JobStore::create_or_get(const std::string &project_id,
                        const std::string &request_id) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto req = requests_.find(request_id);
  if (req != requests_.end())
    return {jobs_.at(req->second), false};

  ExportJob job;
  job.id = make_job_id();
  job.project_id = project_id;
  job.request_id = request_id;
  job.status = JobStatus::Queued;
  job.created_at = iso_utc_now();
  job.updated_at = job.created_at;
  job.sequence = next_sequence_++;

  requests_[request_id] = job.id;
  jobs_[job.id] = job;
  persist_locked();
  return {job, true};
}

std::optional<ExportJob> JobStore::find(const std::string &job_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(job_id);
  if (it == jobs_.end())
    return std::nullopt;
  return it->second;
}

std::optional<ExportJob>
JobStore::find_by_request(const std::string &request_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto req = requests_.find(request_id);
  if (req == requests_.end())
    return std::nullopt;
  return jobs_.at(req->second);
}

std::vector<ExportJob>
JobStore::list_for_project(const std::string &project_id) const {
  std::vector<ExportJob> out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &kv : jobs_) {
      if (kv.second.project_id == project_id)
        out.push_back(kv.second);
    }
  }
  std::sort(out.begin(), out.end(),
            [](const ExportJob &a, const ExportJob &b) {
              return a.sequence > b.sequence;
            });
  return out;
}

std::size_t JobStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return jobs_.size();
}

// **---- Transitions ----**

bool JobStore::mark_running(const std::string &job_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  ExportJob *job = find_locked(job_id);
  if (!job || job->status != JobStatus::Queued)
    return false;
  job->status = JobStatus::Running;
  job->updated_at = iso_utc_now();
  persist_locked();
  return true;
}

bool JobStore::update_progress(const std::string &job_id, double progress) {
  std::lock_guard<std::mutex> lock(mutex_);
  ExportJob *job = find_locked(job_id);
  if (!job || job->status != JobStatus::Running)
    return false;
  progress = std::clamp(progress, 0.0, 100.0);
  if (progress <= job->progress)
    return false;
  job->progress = progress;
  job->updated_at = iso_utc_now();

  /// Progress is advisory: skip the ledger write for sub-step ticks
  if (!ledger_path_.empty() &&
      progress - persisted_progress_[job_id] >= kProgressPersistStep)
    persist_locked();
  return true;
}

bool JobStore::mark_complete(const std::string &job_id,
                             const std::string &output_path) {
  std::lock_guard<std::mutex> lock(mutex_);
  ExportJob *job = find_locked(job_id);
  if (!job || job->status != JobStatus::Running)
    return false;
  job->status = JobStatus::Complete;
  job->progress = 100.0;
  job->output_path = output_path;
  job->updated_at = iso_utc_now();
  persist_locked();
  return true;
}

bool JobStore::mark_failed(const std::string &job_id,
                           const std::string &error) {
  std::lock_guard<std::mutex> lock(mutex_);
  ExportJob *job = find_locked(job_id);
  if (!job || is_terminal(job->status))
    return false;
  job->status = JobStatus::Failed;
  job->error = error.empty() ? std::string("unknown error") : error;
  job->updated_at = iso_utc_now();
  persist_locked();
  return true;
}

bool JobStore::fail_if_queued(const std::string &job_id,
                              const std::string &error) {
  std::lock_guard<std::mutex> lock(mutex_);
  ExportJob *job = find_locked(job_id);
  if (!job || job->status != JobStatus::Queued)
    return false;
  job->status = JobStatus::Failed;
  job->error = error;
  job->updated_at = iso_utc_now();
  persist_locked();
  return true;
}

} // namespace vedit
