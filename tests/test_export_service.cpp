#include "vedit/errors.hpp"
#include "vedit/export_service.hpp"
#include "vedit/project.hpp"
#include "vedit/system.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using namespace vedit;

namespace {

/**
 * @brief Encoder stand-in that can hold every invocation until released.
 *        Writes the output file (last argument) on success.
 */
class GatedEncoder : public EncoderRunner {
public:
  explicit GatedEncoder(bool open = true) : open_(open) {}

  ProcessResult run(const std::vector<std::string> &args,
                    const ProgressSniffer &on_time,
                    const std::atomic<bool> *cancel) override {
    (void)on_time;
    ProcessResult r;
    std::unique_lock<std::mutex> lock(mutex_);
    ++calls_;
    cv_.notify_all();
    while (!open_) {
      if (cancel && cancel->load()) {
        r.cancelled = true;
        r.exit_code = 128 + 9;
        return r;
      }
      cv_.wait_for(lock, 10ms);
    }
    if (fail_) {
      r.exit_code = 1;
      r.stderr_text = "Invalid data found when processing input";
      return r;
    }
    lock.unlock();
    std::ofstream(args.back()) << "media";
    return r;
  }

  std::string program() const override { return "fake-ffmpeg"; }

  void release() {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = true;
    cv_.notify_all();
  }

  void set_failing() {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_ = true;
  }

  bool wait_started(int n) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, 5s, [&] { return calls_ >= n; });
  }

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  bool open_;
  bool fail_ = false;
  int calls_ = 0;
};

/**
 * @brief GatedEncoder that runs a hook once the concat invocation has
 *        written its output.
 */
class ConcatHookEncoder : public GatedEncoder {
public:
  using GatedEncoder::GatedEncoder;

  std::function<bool()> after_concat;
  std::atomic<bool> hook_result{false};

  ProcessResult run(const std::vector<std::string> &args,
                    const ProgressSniffer &on_time,
                    const std::atomic<bool> *cancel) override {
    ProcessResult r = GatedEncoder::run(args, on_time, cancel);
    bool is_concat =
        std::find(args.begin(), args.end(), "concat") != args.end();
    if (r.ok() && is_concat && after_concat)
      hook_result = after_concat();
    return r;
  }
};

/// Thread-safe stand-in for the project store
class ProjectCatalog {
public:
  void put(const Project &p) {
    std::lock_guard<std::mutex> lock(mutex_);
    projects_[p.id] = p;
  }

  ProjectProvider provider() {
    return [this](const std::string &id) -> std::optional<Project> {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = projects_.find(id);
      if (it == projects_.end())
        return std::nullopt;
      return it->second;
    };
  }

private:
  std::mutex mutex_;
  std::map<std::string, Project> projects_;
};

Project one_clip_project(const std::string &id) {
  Project p = make_project(id);
  AssetInfo a;
  a.id = "v";
  a.path = "/media/v.mp4";
  a.duration = 60.0;
  a.fps = 30.0;
  a.has_audio = true;
  p.assets["v"] = a;

  Clip c;
  c.id = "c";
  c.duration = 2.0;
  c.out_point = 2.0;
  c.asset_id = "v";
  p.track(TrackKind::VideoA)->clips.push_back(c);
  return p;
}

class ExportServiceTest : public ::testing::Test {
protected:
  fs::path storage;
  RenderSettings settings;
  ProjectCatalog catalog;

  void SetUp() override {
    storage = fs::temp_directory_path() / ("vedit_service_" + make_job_id());
    fs::create_directories(storage);
    settings.storage_path = storage.string();
    settings.probe_assets = false;
    catalog.put(one_clip_project("p1"));
    catalog.put(make_project("empty"));
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(storage, ec);
  }

  std::string ledger() const { return (storage / "jobs.json").string(); }
};

} // namespace

// ============================================================================
// Submission
// ============================================================================

TEST_F(ExportServiceTest, JobRunsToComplete) {
  GatedEncoder encoder;
  ExportService service(catalog.provider(), encoder, settings, 2);

  ExportJob job = service.submit("p1", "req-1");
  EXPECT_EQ(job.project_id, "p1");
  EXPECT_EQ(job.request_id, "req-1");

  auto done = service.wait_for(job.id, 10s);
  ASSERT_TRUE(done.has_value());
  EXPECT_EQ(done->status, JobStatus::Complete);
  EXPECT_DOUBLE_EQ(done->progress, 100.0);
  EXPECT_TRUE(done->error.empty());
  EXPECT_EQ(done->output_path,
            (storage / "exports" / (job.id + ".mp4")).string());
  EXPECT_TRUE(fs::exists(done->output_path));
}

TEST_F(ExportServiceTest, SameRequestIdReturnsSameJob) {
  GatedEncoder encoder;
  ExportService service(catalog.provider(), encoder, settings, 1);

  ExportJob first = service.submit("p1", "req-1");
  ExportJob second = service.submit("p1", "req-1");
  EXPECT_EQ(first.id, second.id);

  service.wait_for(first.id, 10s);
  ExportJob third = service.submit("p1", "req-1");
  EXPECT_EQ(third.id, first.id);
  EXPECT_EQ(third.status, JobStatus::Complete);
  EXPECT_EQ(service.list_exports("p1").size(), 1u);
}

TEST_F(ExportServiceTest, ConcurrentSubmissionsCreateOneJob) {
  GatedEncoder encoder;
  ExportService service(catalog.provider(), encoder, settings, 2);

  std::vector<std::string> ids(8);
  std::vector<std::thread> threads;
  for (std::size_t i = 0; i < ids.size(); ++i) {
    threads.emplace_back(
        [&, i] { ids[i] = service.submit("p1", "same-request").id; });
  }
  for (auto &t : threads)
    t.join();

  for (const auto &id : ids)
    EXPECT_EQ(id, ids.front());
  EXPECT_EQ(service.list_exports("p1").size(), 1u);
  EXPECT_EQ(service.wait_for(ids.front(), 10s)->status, JobStatus::Complete);
}

TEST_F(ExportServiceTest, EmptyRequestIdAlwaysCreatesNewJob) {
  GatedEncoder encoder;
  ExportService service(catalog.provider(), encoder, settings, 2);

  ExportJob a = service.submit("p1");
  ExportJob b = service.submit("p1");
  EXPECT_NE(a.id, b.id);
  EXPECT_FALSE(a.request_id.empty());
  EXPECT_NE(a.request_id, b.request_id);

  service.wait_for(a.id, 10s);
  service.wait_for(b.id, 10s);
  auto listed = service.list_exports("p1");
  ASSERT_EQ(listed.size(), 2u);
  EXPECT_EQ(listed[0].id, b.id);
  EXPECT_EQ(listed[1].id, a.id);
}

TEST_F(ExportServiceTest, UnknownProjectIsRejectedWithoutJob) {
  GatedEncoder encoder;
  ExportService service(catalog.provider(), encoder, settings, 1);

  EXPECT_THROW(service.submit("missing", "r"), ValidationError);
  EXPECT_TRUE(service.list_exports("missing").empty());
  EXPECT_EQ(service.store().size(), 0u);
}

TEST_F(ExportServiceTest, InvalidProjectIsRejectedWithoutJob) {
  Project bad = make_project("bad");
  Clip c;
  c.id = "negative";
  c.start_time = -1.0;
  c.duration = 1.0;
  bad.track(TrackKind::VideoA)->clips.push_back(c);
  catalog.put(bad);

  GatedEncoder encoder;
  ExportService service(catalog.provider(), encoder, settings, 1);
  EXPECT_THROW(service.submit("bad", "r"), ValidationError);
  EXPECT_EQ(service.store().size(), 0u);
}

TEST_F(ExportServiceTest, ProjectIsSnapshottedAtSubmit) {
  GatedEncoder encoder(false);
  ExportService service(catalog.provider(), encoder, settings, 1);

  ExportJob first = service.submit("p1", "first");
  ASSERT_TRUE(encoder.wait_started(1));
  ExportJob second = service.submit("p1", "second");

  // The queued job keeps the clips it was submitted with
  catalog.put(make_project("p1"));
  encoder.release();

  EXPECT_EQ(service.wait_for(first.id, 10s)->status, JobStatus::Complete);
  EXPECT_EQ(service.wait_for(second.id, 10s)->status, JobStatus::Complete);
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(ExportServiceTest, EncoderFailureMarksFailed) {
  GatedEncoder encoder;
  encoder.set_failing();
  ExportService service(catalog.provider(), encoder, settings, 1);

  ExportJob job = service.submit("p1", "r");
  auto done = service.wait_for(job.id, 10s);
  ASSERT_TRUE(done.has_value());
  EXPECT_EQ(done->status, JobStatus::Failed);
  EXPECT_NE(done->error.find("exited with code 1"), std::string::npos);
  EXPECT_NE(done->error.find("Invalid data"), std::string::npos);
  EXPECT_TRUE(done->output_path.empty());
  EXPECT_FALSE(fs::exists(storage / "exports" / (job.id + ".mp4")));
}

TEST_F(ExportServiceTest, EmptyTimelineFails) {
  GatedEncoder encoder;
  ExportService service(catalog.provider(), encoder, settings, 1);

  ExportJob job = service.submit("empty", "r");
  auto done = service.wait_for(job.id, 10s);
  EXPECT_EQ(done->status, JobStatus::Failed);
  EXPECT_EQ(done->error, "No content on timeline");
}

// ============================================================================
// Cancellation
// ============================================================================

TEST_F(ExportServiceTest, CancelQueuedJob) {
  GatedEncoder encoder(false);
  ExportService service(catalog.provider(), encoder, settings, 1);

  ExportJob running = service.submit("p1", "first");
  ASSERT_TRUE(encoder.wait_started(1));
  ExportJob queued = service.submit("p1", "second");

  EXPECT_TRUE(service.cancel(queued.id));
  auto status = service.get_status(queued.id);
  EXPECT_EQ(status->status, JobStatus::Failed);
  EXPECT_EQ(status->error, "cancelled");

  encoder.release();
  EXPECT_EQ(service.wait_for(running.id, 10s)->status, JobStatus::Complete);
  EXPECT_EQ(service.get_status(queued.id)->status, JobStatus::Failed);
}

TEST_F(ExportServiceTest, CancelRunningJob) {
  GatedEncoder encoder(false);
  ExportService service(catalog.provider(), encoder, settings, 1);

  ExportJob job = service.submit("p1", "r");
  ASSERT_TRUE(encoder.wait_started(1));
  EXPECT_EQ(service.get_status(job.id)->status, JobStatus::Running);

  EXPECT_TRUE(service.cancel(job.id));
  auto done = service.wait_for(job.id, 10s);
  EXPECT_EQ(done->status, JobStatus::Failed);
  EXPECT_EQ(done->error, "cancelled");
  EXPECT_FALSE(fs::exists(storage / "exports" / (job.id + ".mp4")));
  encoder.release();
}

TEST_F(ExportServiceTest, CancelAfterLastEncoderCallStillFails) {
  ConcatHookEncoder encoder(false);
  ExportService service(catalog.provider(), encoder, settings, 1);

  ExportJob job = service.submit("p1", "r");
  ASSERT_TRUE(encoder.wait_started(1));
  encoder.after_concat = [&service, &job] { return service.cancel(job.id); };
  encoder.release();

  auto done = service.wait_for(job.id, 10s);
  ASSERT_TRUE(done.has_value());
  EXPECT_TRUE(encoder.hook_result.load());
  EXPECT_EQ(done->status, JobStatus::Failed);
  EXPECT_EQ(done->error, "cancelled");
  EXPECT_FALSE(fs::exists(storage / "exports" / (job.id + ".mp4")));
}

TEST_F(ExportServiceTest, CancelTerminalOrUnknownIsNoop) {
  GatedEncoder encoder;
  ExportService service(catalog.provider(), encoder, settings, 1);

  ExportJob job = service.submit("p1", "r");
  ASSERT_EQ(service.wait_for(job.id, 10s)->status, JobStatus::Complete);
  EXPECT_FALSE(service.cancel(job.id));
  EXPECT_EQ(service.get_status(job.id)->status, JobStatus::Complete);
  EXPECT_FALSE(service.cancel("no-such-job"));
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(ExportServiceTest, LedgerSurvivesRestart) {
  std::string job_id;
  {
    GatedEncoder encoder;
    ExportService service(catalog.provider(), encoder, settings, 1, ledger());
    job_id = service.submit("p1", "r").id;
    ASSERT_EQ(service.wait_for(job_id, 10s)->status, JobStatus::Complete);
  }

  GatedEncoder encoder;
  ExportService restarted(catalog.provider(), encoder, settings, 1, ledger());
  auto job = restarted.get_status(job_id);
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->status, JobStatus::Complete);
  EXPECT_EQ(restarted.submit("p1", "r").id, job_id);
}

TEST_F(ExportServiceTest, ShutdownDrainsQueueAndRejectsNewWork) {
  GatedEncoder encoder;
  std::set<std::string> ids;
  auto service = std::make_unique<ExportService>(catalog.provider(), encoder,
                                                 settings, 1);
  for (int i = 0; i < 3; ++i)
    ids.insert(service->submit("p1").id);

  service->shutdown();
  for (const auto &id : ids)
    EXPECT_EQ(service->get_status(id)->status, JobStatus::Complete);
  EXPECT_THROW(service->submit("p1"), std::runtime_error);
}
