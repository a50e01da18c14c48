#include "vedit/job_store.hpp"
#include "vedit/system.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using namespace vedit;

namespace {

class JobStoreTest : public ::testing::Test {
protected:
  fs::path dir;
  fs::path ledger;

  void SetUp() override {
    dir = fs::temp_directory_path() / ("vedit_ledger_" + make_job_id());
    fs::create_directories(dir);
    ledger = dir / "jobs.json";
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir, ec);
  }
};

} // namespace

// ============================================================================
// Creation and lookup
// ============================================================================

TEST(JobStore, CreateIsIdempotentOnRequestId) {
  JobStore store;
  auto first = store.create_or_get("p1", "req-1");
  auto second = store.create_or_get("p1", "req-1");

  EXPECT_TRUE(first.second);
  EXPECT_FALSE(second.second);
  EXPECT_EQ(first.first.id, second.first.id);
  EXPECT_EQ(first.first.status, JobStatus::Queued);
  EXPECT_DOUBLE_EQ(first.first.progress, 0.0);
  EXPECT_EQ(store.size(), 1u);
  EXPECT_FALSE(first.first.created_at.empty());
}

TEST(JobStore, DistinctRequestsCreateDistinctJobs) {
  JobStore store;
  auto a = store.create_or_get("p1", "req-a").first;
  auto b = store.create_or_get("p1", "req-b").first;
  EXPECT_NE(a.id, b.id);
  EXPECT_LT(a.sequence, b.sequence);
  EXPECT_EQ(store.find_by_request("req-b")->id, b.id);
  EXPECT_FALSE(store.find("no-such-job").has_value());
  EXPECT_FALSE(store.find_by_request("no-such-request").has_value());
}

TEST(JobStore, ListsNewestFirstPerProject) {
  JobStore store;
  auto j1 = store.create_or_get("p1", "r1").first;
  store.create_or_get("p2", "r2");
  auto j3 = store.create_or_get("p1", "r3").first;
  auto j4 = store.create_or_get("p1", "r4").first;

  auto listed = store.list_for_project("p1");
  ASSERT_EQ(listed.size(), 3u);
  EXPECT_EQ(listed[0].id, j4.id);
  EXPECT_EQ(listed[1].id, j3.id);
  EXPECT_EQ(listed[2].id, j1.id);
  EXPECT_TRUE(store.list_for_project("p3").empty());
}

// ============================================================================
// Transitions
// ============================================================================

TEST(JobStore, HappyPathTransitions) {
  JobStore store;
  std::string id = store.create_or_get("p", "r").first.id;

  EXPECT_FALSE(store.update_progress(id, 10.0));
  EXPECT_FALSE(store.mark_complete(id, "/out.mp4"));

  EXPECT_TRUE(store.mark_running(id));
  EXPECT_FALSE(store.mark_running(id));
  EXPECT_EQ(store.find(id)->status, JobStatus::Running);

  EXPECT_TRUE(store.update_progress(id, 25.0));
  EXPECT_FALSE(store.update_progress(id, 20.0));
  EXPECT_DOUBLE_EQ(store.find(id)->progress, 25.0);
  EXPECT_TRUE(store.update_progress(id, 250.0));
  EXPECT_DOUBLE_EQ(store.find(id)->progress, 100.0);

  EXPECT_TRUE(store.mark_complete(id, "/out.mp4"));
  auto done = *store.find(id);
  EXPECT_EQ(done.status, JobStatus::Complete);
  EXPECT_EQ(done.output_path, "/out.mp4");
  EXPECT_DOUBLE_EQ(done.progress, 100.0);
  EXPECT_TRUE(done.error.empty());
}

TEST(JobStore, TerminalJobsNeverChange) {
  JobStore store;
  std::string id = store.create_or_get("p", "r").first.id;
  ASSERT_TRUE(store.mark_running(id));
  ASSERT_TRUE(store.mark_failed(id, "encoder exited with code 1"));

  EXPECT_FALSE(store.mark_failed(id, "again"));
  EXPECT_FALSE(store.mark_complete(id, "/out.mp4"));
  EXPECT_FALSE(store.update_progress(id, 90.0));
  EXPECT_FALSE(store.mark_running(id));

  auto job = *store.find(id);
  EXPECT_EQ(job.status, JobStatus::Failed);
  EXPECT_EQ(job.error, "encoder exited with code 1");
  EXPECT_TRUE(job.output_path.empty());
}

TEST(JobStore, FailedJobsAlwaysCarryAnError) {
  JobStore store;
  std::string id = store.create_or_get("p", "r").first.id;
  ASSERT_TRUE(store.mark_failed(id, ""));
  EXPECT_EQ(store.find(id)->error, "unknown error");
}

TEST(JobStore, FailIfQueuedOnlyAffectsQueuedJobs) {
  JobStore store;
  std::string queued = store.create_or_get("p", "r1").first.id;
  std::string running = store.create_or_get("p", "r2").first.id;
  ASSERT_TRUE(store.mark_running(running));

  EXPECT_TRUE(store.fail_if_queued(queued, "cancelled"));
  EXPECT_FALSE(store.fail_if_queued(running, "cancelled"));
  EXPECT_EQ(store.find(queued)->error, "cancelled");
  EXPECT_EQ(store.find(running)->status, JobStatus::Running);
}

// ============================================================================
// Persistence
// ============================================================================

TEST_F(JobStoreTest, LedgerRoundTrip) {
  std::string done_id;
  {
    JobStore store(ledger.string());
    done_id = store.create_or_get("p", "r1").first.id;
    ASSERT_TRUE(store.mark_running(done_id));
    ASSERT_TRUE(store.mark_complete(done_id, "/exports/a.mp4"));
  }
  ASSERT_TRUE(fs::exists(ledger));
  EXPECT_FALSE(fs::exists(dir / "jobs.json.tmp"));

  JobStore reloaded(ledger.string());
  ASSERT_EQ(reloaded.size(), 1u);
  auto job = reloaded.find(done_id);
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->status, JobStatus::Complete);
  EXPECT_EQ(job->output_path, "/exports/a.mp4");
  EXPECT_EQ(job->request_id, "r1");

  // Request ids survive restarts
  auto again = reloaded.create_or_get("p", "r1");
  EXPECT_FALSE(again.second);
  EXPECT_EQ(again.first.id, done_id);

  // New jobs sort after reloaded ones
  auto fresh = reloaded.create_or_get("p", "r2").first;
  EXPECT_GT(fresh.sequence, job->sequence);
  EXPECT_EQ(reloaded.list_for_project("p").front().id, fresh.id);
}

TEST_F(JobStoreTest, InterruptedJobsFailOnReload) {
  std::string queued_id;
  std::string running_id;
  {
    JobStore store(ledger.string());
    queued_id = store.create_or_get("p", "r1").first.id;
    running_id = store.create_or_get("p", "r2").first.id;
    ASSERT_TRUE(store.mark_running(running_id));
    ASSERT_TRUE(store.update_progress(running_id, 42.0));
  }

  JobStore reloaded(ledger.string());
  for (const auto &id : {queued_id, running_id}) {
    auto job = reloaded.find(id);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->status, JobStatus::Failed);
    EXPECT_EQ(job->error, "interrupted by restart");
  }
  EXPECT_DOUBLE_EQ(reloaded.find(running_id)->progress, 42.0);

  // The failure is written back
  std::ifstream in(ledger);
  auto doc = nlohmann::json::parse(in);
  for (const auto &record : doc.at("jobs"))
    EXPECT_EQ(record.at("status").get<std::string>(), "FAILED");
}

TEST_F(JobStoreTest, SmallProgressTicksAreNotWritten) {
  auto ledger_progress = [this](const std::string &id) {
    std::ifstream in(ledger);
    auto doc = nlohmann::json::parse(in);
    for (const auto &record : doc.at("jobs")) {
      if (record.at("id").get<std::string>() == id)
        return record.at("progress").get<double>();
    }
    return -1.0;
  };

  JobStore store(ledger.string());
  std::string id = store.create_or_get("p", "r").first.id;
  ASSERT_TRUE(store.mark_running(id));

  ASSERT_TRUE(store.update_progress(id, 10.25));
  EXPECT_DOUBLE_EQ(ledger_progress(id), 10.25);

  // In memory the value moves, on disk it waits for a whole step
  ASSERT_TRUE(store.update_progress(id, 10.5));
  ASSERT_TRUE(store.update_progress(id, 11.0));
  EXPECT_DOUBLE_EQ(store.find(id)->progress, 11.0);
  EXPECT_DOUBLE_EQ(ledger_progress(id), 10.25);

  ASSERT_TRUE(store.update_progress(id, 11.5));
  EXPECT_DOUBLE_EQ(ledger_progress(id), 11.5);

  // Transitions always write through
  ASSERT_TRUE(store.update_progress(id, 12.0));
  EXPECT_DOUBLE_EQ(ledger_progress(id), 11.5);
  ASSERT_TRUE(store.mark_failed(id, "boom"));
  EXPECT_DOUBLE_EQ(ledger_progress(id), 12.0);
}

TEST_F(JobStoreTest, UnreadableLedgerStartsEmpty) {
  {
    std::ofstream out(ledger);
    out << "{ not json";
  }
  JobStore store(ledger.string());
  EXPECT_EQ(store.size(), 0u);
  store.create_or_get("p", "r");
  EXPECT_EQ(store.size(), 1u);
}
