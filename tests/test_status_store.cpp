#include <gtest/gtest.h>

#include "core/status_store.h"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace tw::core;
using namespace std::chrono_literals;

namespace {

using ExecResult = Result<std::string, SchedulerError>;

TaskExecution make_record(const std::string &id, int max_retries = 0) {
  TaskExecution e;
  e.id = id;
  e.task_id = "task";
  e.executor_id = "exec";
  e.max_retries = max_retries;
  e.timeout = 1000ms;
  return e;
}

} // namespace

TEST(StatusStore, InsertAndGet) {
  StatusStore store;
  ASSERT_TRUE(store.insert_pending(make_record("a")).is_ok());

  auto snapshot = store.get("a");
  ASSERT_TRUE(snapshot.has_value());
  EXPECT_EQ(snapshot->status, ExecutionStatus::Pending);
  EXPECT_EQ(store.status_of("a"), ExecutionStatus::Pending);
  EXPECT_FALSE(store.get("missing").has_value());
  EXPECT_FALSE(store.status_of("missing").has_value());
}

TEST(StatusStore, DuplicateIdRejected) {
  StatusStore store;
  ASSERT_TRUE(store.insert_pending(make_record("a")).is_ok());
  auto dup = store.insert_pending(make_record("a"));
  ASSERT_TRUE(dup.is_err());
  EXPECT_EQ(dup.error().category, ErrorCategory::Internal);
}

TEST(StatusStore, SuccessfulAttemptStoresResult) {
  StatusStore store;
  ASSERT_TRUE(store.insert_pending(make_record("a")).is_ok());

  auto running = store.begin_attempt("a");
  ASSERT_TRUE(running.has_value());
  EXPECT_EQ(running->status, ExecutionStatus::Running);
  EXPECT_EQ(running->attempts, 1);
  EXPECT_EQ(store.status_of("a"), ExecutionStatus::Running);
  EXPECT_FALSE(store.get_pending("a").has_value());

  auto done = store.finish_attempt("a", ExecResult::Ok("42"), true, 0ms);
  ASSERT_TRUE(done.has_value());
  EXPECT_EQ(done->status, ExecutionStatus::Completed);
  EXPECT_EQ(done->result, std::optional<std::string>("42"));
  EXPECT_EQ(store.result_of("a"), std::optional<std::string>("42"));

  const auto counts = store.counts();
  EXPECT_EQ(counts.pending, 0u);
  EXPECT_EQ(counts.running, 0u);
  EXPECT_EQ(counts.completed, 1u);
  EXPECT_EQ(counts.succeeded, 1u);
}

TEST(StatusStore, FailureWithBudgetReturnsToPending) {
  StatusStore store;
  ASSERT_TRUE(store.insert_pending(make_record("a", 1)).is_ok());
  ASSERT_TRUE(store.begin_attempt("a").has_value());

  auto retry = store.finish_attempt(
      "a", ExecResult::Err(SchedulerError::Executor("boom")), true, 50ms);
  ASSERT_TRUE(retry.has_value());
  EXPECT_EQ(retry->status, ExecutionStatus::Pending);
  EXPECT_EQ(retry->retry_count, 1);
  EXPECT_FALSE(retry->error.has_value());
  ASSERT_TRUE(retry->next_attempt_at.has_value());
  EXPECT_GT(*retry->next_attempt_at, std::chrono::steady_clock::now());
  EXPECT_TRUE(store.get_pending("a").has_value());

  ASSERT_TRUE(store.begin_attempt("a").has_value());
  auto failed = store.finish_attempt(
      "a", ExecResult::Err(SchedulerError::Executor("boom again")), true, 50ms);
  ASSERT_TRUE(failed.has_value());
  EXPECT_EQ(failed->status, ExecutionStatus::Failed);
  EXPECT_EQ(failed->retry_count, 1);
  EXPECT_EQ(failed->attempts, 2);
  EXPECT_EQ(failed->error, std::optional<std::string>("boom again"));
  EXPECT_FALSE(store.result_of("a").has_value());
}

TEST(StatusStore, NonRetryableFlagStillUsesBudget) {
  StatusStore store;
  ASSERT_TRUE(store.insert_pending(make_record("a", 1)).is_ok());
  ASSERT_TRUE(store.begin_attempt("a").has_value());

  auto retried = store.finish_attempt(
      "a", ExecResult::Err(SchedulerError::Executor("bad input", false)), true,
      0ms);
  ASSERT_TRUE(retried.has_value());
  EXPECT_EQ(retried->status, ExecutionStatus::Pending);
  EXPECT_EQ(retried->retry_count, 1);
  EXPECT_FALSE(retried->error_category.has_value());

  ASSERT_TRUE(store.begin_attempt("a").has_value());
  auto failed = store.finish_attempt(
      "a", ExecResult::Err(SchedulerError::Executor("bad input", false)), true,
      0ms);
  ASSERT_TRUE(failed.has_value());
  EXPECT_EQ(failed->status, ExecutionStatus::Failed);
  EXPECT_EQ(failed->retry_count, 1);
  EXPECT_EQ(failed->error, std::optional<std::string>("bad input"));
  EXPECT_EQ(failed->error_category, ErrorCategory::RetriesExhausted);
}

TEST(StatusStore, RetriesDisabledFailsImmediately) {
  StatusStore store;
  ASSERT_TRUE(store.insert_pending(make_record("a", 3)).is_ok());
  ASSERT_TRUE(store.begin_attempt("a").has_value());

  auto failed = store.finish_attempt(
      "a", ExecResult::Err(SchedulerError::Timeout()), false, 0ms);
  ASSERT_TRUE(failed.has_value());
  EXPECT_EQ(failed->status, ExecutionStatus::Failed);
}

TEST(StatusStore, CancelFlagIsIdempotent) {
  StatusStore store;
  ASSERT_TRUE(store.insert_pending(make_record("a")).is_ok());

  EXPECT_TRUE(store.request_cancel("a"));
  EXPECT_FALSE(store.request_cancel("a"));
  EXPECT_FALSE(store.request_cancel("missing"));

  auto cancelled = store.finalize_cancelled("a");
  ASSERT_TRUE(cancelled.has_value());
  EXPECT_EQ(cancelled->status, ExecutionStatus::Cancelled);
  EXPECT_FALSE(cancelled->started_at.has_value());
  EXPECT_FALSE(store.request_cancel("a"));
}

TEST(StatusStore, BeginAttemptOnFlaggedRecordCancels) {
  StatusStore store;
  ASSERT_TRUE(store.insert_pending(make_record("a")).is_ok());
  ASSERT_TRUE(store.request_cancel("a"));

  auto snapshot = store.begin_attempt("a");
  ASSERT_TRUE(snapshot.has_value());
  EXPECT_EQ(snapshot->status, ExecutionStatus::Cancelled);
  EXPECT_EQ(snapshot->attempts, 0);
}

TEST(StatusStore, CancelDuringAttemptDiscardsResult) {
  StatusStore store;
  ASSERT_TRUE(store.insert_pending(make_record("a")).is_ok());
  ASSERT_TRUE(store.begin_attempt("a").has_value());
  ASSERT_TRUE(store.request_cancel("a"));

  auto snapshot = store.finish_attempt("a", ExecResult::Ok("late"), true, 0ms);
  ASSERT_TRUE(snapshot.has_value());
  EXPECT_EQ(snapshot->status, ExecutionStatus::Cancelled);
  EXPECT_FALSE(snapshot->result.has_value());
  EXPECT_FALSE(store.result_of("a").has_value());
}

TEST(StatusStore, CancelAllFinalizesEveryNonTerminalRecord) {
  StatusStore store;
  ASSERT_TRUE(store.insert_pending(make_record("pending")).is_ok());
  ASSERT_TRUE(store.insert_pending(make_record("running")).is_ok());
  ASSERT_TRUE(store.insert_pending(make_record("done")).is_ok());
  ASSERT_TRUE(store.begin_attempt("running").has_value());
  ASSERT_TRUE(store.begin_attempt("done").has_value());
  ASSERT_TRUE(store.finish_attempt("done", ExecResult::Ok("ok"), true, 0ms));

  auto cancelled = store.cancel_all("scheduler shut down");
  EXPECT_EQ(cancelled.size(), 2u);
  EXPECT_FALSE(store.has_non_terminal());
  EXPECT_EQ(store.get("pending")->error,
            std::optional<std::string>("scheduler shut down"));
  EXPECT_EQ(store.get("running")->status, ExecutionStatus::Cancelled);
  EXPECT_EQ(store.get("done")->status, ExecutionStatus::Completed);
}

TEST(StatusStore, RetentionEvictsOldestFinished) {
  StatusStore store(2);
  for (const char *id : {"a", "b", "c"}) {
    ASSERT_TRUE(store.insert_pending(make_record(id)).is_ok());
    ASSERT_TRUE(store.begin_attempt(id).has_value());
    ASSERT_TRUE(store.finish_attempt(id, ExecResult::Ok(id), true, 0ms));
  }

  EXPECT_FALSE(store.get("a").has_value());
  EXPECT_FALSE(store.result_of("a").has_value());
  EXPECT_TRUE(store.get("b").has_value());
  EXPECT_TRUE(store.get("c").has_value());

  auto evicted = store.drain_evicted();
  ASSERT_EQ(evicted.size(), 1u);
  EXPECT_EQ(evicted[0], "a");
  EXPECT_TRUE(store.drain_evicted().empty());
}

TEST(StatusStore, RetentionKeepsRecordsWithLiveDependents) {
  StatusStore store(1);
  ASSERT_TRUE(store.insert_pending(make_record("a")).is_ok());
  ASSERT_TRUE(store.begin_attempt("a").has_value());
  ASSERT_TRUE(store.finish_attempt("a", ExecResult::Ok("a"), true, 0ms));

  auto dependent = make_record("b");
  dependent.dependencies.push_back(Dependency::completion("a"));
  ASSERT_TRUE(store.insert_pending(dependent).is_ok());

  ASSERT_TRUE(store.insert_pending(make_record("c")).is_ok());
  ASSERT_TRUE(store.begin_attempt("c").has_value());
  ASSERT_TRUE(store.finish_attempt("c", ExecResult::Ok("c"), true, 0ms));

  ASSERT_TRUE(store.get("a").has_value());
  EXPECT_EQ(store.result_of("a"), std::optional<std::string>("a"));
  EXPECT_FALSE(store.get("c").has_value());
  EXPECT_EQ(store.drain_evicted(), std::vector<std::string>{"c"});

  ASSERT_TRUE(store.begin_attempt("b").has_value());
  ASSERT_TRUE(store.finish_attempt("b", ExecResult::Ok("b"), true, 0ms));

  EXPECT_FALSE(store.get("a").has_value());
  EXPECT_TRUE(store.get("b").has_value());
  EXPECT_EQ(store.drain_evicted(), std::vector<std::string>{"a"});
}

TEST(StatusStore, ResultsForReturnsOnlyStoredResults) {
  StatusStore store;
  ASSERT_TRUE(store.insert_pending(make_record("a")).is_ok());
  ASSERT_TRUE(store.begin_attempt("a").has_value());
  ASSERT_TRUE(store.finish_attempt("a", ExecResult::Ok("va"), true, 0ms));

  auto results = store.results_for(
      {Dependency::completion("a"), Dependency::completion("missing"),
       Dependency::on_resource("gpu")});
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results.at("a"), "va");
}

TEST(StatusStore, WaitForChangeWakesOnTransition) {
  StatusStore store;
  ASSERT_TRUE(store.insert_pending(make_record("a")).is_ok());
  const auto seen = store.generation();

  std::thread mutator([&]() {
    std::this_thread::sleep_for(20ms);
    store.request_cancel("a");
  });
  const auto start = std::chrono::steady_clock::now();
  EXPECT_TRUE(store.wait_for_change(seen, 2000ms));
  EXPECT_LT(std::chrono::steady_clock::now() - start, 1000ms);
  mutator.join();

  EXPECT_FALSE(store.wait_for_change(store.generation(), 10ms));
}

TEST(StatusStore, WaitIdle) {
  StatusStore store;
  EXPECT_TRUE(store.wait_idle(0ms));

  ASSERT_TRUE(store.insert_pending(make_record("a")).is_ok());
  EXPECT_FALSE(store.wait_idle(10ms));

  std::thread finisher([&]() {
    std::this_thread::sleep_for(20ms);
    store.request_cancel("a");
    store.finalize_cancelled("a");
  });
  EXPECT_TRUE(store.wait_idle(2000ms));
  finisher.join();
}
