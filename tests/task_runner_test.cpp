#include "upkeep/task/task_runner.hpp"

#include "upkeep/scheduler/local_scheduler.hpp"

#include "test_utils.hpp"

#include <stdexcept>

#include "gtest/gtest.h"

using namespace upkeep;
using namespace upkeep::test;
using namespace std::chrono_literals;

namespace {

// Cleans `total` items, one per simulated second, checkpointing its offset
// whenever the slice budget runs out.
class BatchCleanupTask : public MaintenanceTask {
public:
  BatchCleanupTask(std::string id, int total, ManualClock& clock)
      : id_(std::move(id)), total_(total), clock_(&clock) {
  }

  [[nodiscard]] auto id() const -> std::string_view override {
    return id_;
  }
  [[nodiscard]] auto name() const -> std::string_view override {
    return "Batch cleanup";
  }

  auto execute(ExecutionContext& ctx) -> TaskResult override {
    ++slices;
    auto checkpoint = ctx.progress().load();
    int offset = checkpoint.value("offset", 0);

    while (offset < total_) {
      if (ctx.is_time_limit_approaching()) {
        ctx.progress().save_interrupted({{"offset", offset}});
        return ctx.make_interrupted(total_, offset);
      }
      clock_->advance(1s);
      ++offset;
    }
    return ctx.make_success(total_, total_);
  }

  int slices{0};

private:
  std::string id_;
  int total_;
  ManualClock* clock_;
};

class ThrowingTask : public MaintenanceTask {
public:
  [[nodiscard]] auto id() const -> std::string_view override {
    return "media_scan";
  }
  [[nodiscard]] auto name() const -> std::string_view override {
    return "Throwing";
  }
  auto execute(ExecutionContext&) -> TaskResult override {
    throw std::runtime_error("disk vanished");
  }
};

class FixedResultTask : public MaintenanceTask {
public:
  explicit FixedResultTask(TaskResult result) : result_(std::move(result)) {
  }
  [[nodiscard]] auto id() const -> std::string_view override {
    return "performance_check";
  }
  [[nodiscard]] auto name() const -> std::string_view override {
    return "Fixed";
  }
  auto execute(ExecutionContext&) -> TaskResult override {
    return result_;
  }

private:
  TaskResult result_;
};

}  // namespace

class TaskRunnerTest : public StoreTest {
protected:
  void SetUp() override {
    StoreTest::SetUp();
    host_ = std::make_unique<LocalScheduler>(*store_);
    scheduling_ = std::make_unique<SchedulingService>(SchedulingSettings{},
                                                      *host_, *store_, clock_);
    RunnerOptions options;
    options.budget = {.time_limit = 20s, .time_buffer = 0s, .minimum = 5s};
    options.resume_delay = 60s;
    runner_ = std::make_unique<TaskRunner>(*store_, *host_, *scheduling_,
                                           clock_, options);
  }

  void TearDown() override {
    runner_.reset();
    scheduling_.reset();
    host_.reset();
    StoreTest::TearDown();
  }

  std::unique_ptr<LocalScheduler> host_;
  std::unique_ptr<SchedulingService> scheduling_;
  std::unique_ptr<TaskRunner> runner_;
};

TEST_F(TaskRunnerTest, RegisterRejectsDuplicatesAndNull) {
  ASSERT_TRUE(runner_->register_task(
      std::make_unique<BatchCleanupTask>("media_scan", 1, clock_)));

  auto dup = runner_->register_task(
      std::make_unique<BatchCleanupTask>("media_scan", 1, clock_));
  ASSERT_FALSE(dup.has_value());
  EXPECT_EQ(dup.error(), make_error_code(Error::InvalidArgument));

  auto null = runner_->register_task(nullptr);
  ASSERT_FALSE(null.has_value());
  EXPECT_EQ(null.error(), make_error_code(Error::InvalidArgument));

  auto unnamed = runner_->register_task(
      std::make_unique<BatchCleanupTask>("", 1, clock_));
  EXPECT_FALSE(unnamed.has_value());

  EXPECT_TRUE(runner_->has_task("media_scan"));
  EXPECT_EQ(runner_->task_ids(), std::vector<std::string>{"media_scan"});
}

TEST_F(TaskRunnerTest, UnknownTaskIsNotFound) {
  auto r = runner_->run("nope");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::NotFound));
}

TEST_F(TaskRunnerTest, ResumesAcrossSlicesUntilComplete) {
  auto task = std::make_unique<BatchCleanupTask>("media_scan", 50, clock_);
  auto* batch = task.get();
  ASSERT_TRUE(runner_->register_task(std::move(task)));
  auto progress = ProgressStore::for_task(*store_, "media_scan", clock_);

  auto first = runner_->run("media_scan");
  ASSERT_TRUE(first.has_value());
  EXPECT_TRUE(first->is_interrupted());
  EXPECT_EQ(first->items_cleaned(), 20);
  EXPECT_EQ(first->items_found(), 50);
  EXPECT_EQ(progress.load()["offset"], 20);
  EXPECT_EQ(host_->next_scheduled("media_scan"), clock_.now() + 60s);

  clock_.advance(60s);
  ASSERT_EQ(host_->pop_due(clock_.now()),
            std::vector<std::string>{"media_scan"});
  auto second = runner_->run("media_scan");
  ASSERT_TRUE(second.has_value());
  EXPECT_TRUE(second->is_interrupted());
  EXPECT_EQ(second->items_cleaned(), 40);

  clock_.advance(60s);
  auto third = runner_->run("media_scan");
  ASSERT_TRUE(third.has_value());
  EXPECT_TRUE(third->is_success());
  EXPECT_FALSE(third->is_interrupted());
  EXPECT_EQ(third->items_cleaned(), 50);
  EXPECT_EQ(third->task_id(), "media_scan");
  EXPECT_EQ(third->executed_at(), clock_.now());

  EXPECT_EQ(batch->slices, 3);
  EXPECT_FALSE(progress.has_progress());
  // Weekly default: next preferred hour plus six days.
  EXPECT_EQ(host_->next_scheduled("media_scan"),
            scheduling_->calculate_next_run_time() + std::chrono::days{6});
}

TEST_F(TaskRunnerTest, InterruptedResultNextRunIsHonoured) {
  auto at = at_unix(kEpochStart + 900);
  ASSERT_TRUE(runner_->register_task(std::make_unique<FixedResultTask>(
      TaskResult::interrupted("performance_check", 1, 0, 0, {}, at))));

  ASSERT_TRUE(runner_->run("performance_check").has_value());

  EXPECT_EQ(host_->next_scheduled("performance_check"), at);
}

TEST_F(TaskRunnerTest, ExceptionBecomesFailure) {
  ASSERT_TRUE(runner_->register_task(std::make_unique<ThrowingTask>()));

  auto r = runner_->run("media_scan");

  ASSERT_TRUE(r.has_value());
  EXPECT_FALSE(r->is_success());
  EXPECT_EQ(r->errors().at("exception"), "disk vanished");
  EXPECT_TRUE(host_->is_scheduled("media_scan"));
}

TEST_F(TaskRunnerTest, FailureKeepsCheckpoint) {
  ASSERT_TRUE(ProgressStore::for_task(*store_, "performance_check", clock_)
                  .save({{"offset", 7}}));
  ASSERT_TRUE(runner_->register_task(std::make_unique<FixedResultTask>(
      TaskResult::failure("performance_check", {{"db", "locked"}}))));

  auto r = runner_->run("performance_check");

  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(r->has_errors());
  EXPECT_TRUE(ProgressStore::for_task(*store_, "performance_check", clock_)
                  .has_progress());
}

TEST_F(TaskRunnerTest, MissingTaskIdIsStamped) {
  ASSERT_TRUE(runner_->register_task(
      std::make_unique<FixedResultTask>(TaskResult::success("", 3, 3))));

  auto r = runner_->run("performance_check");

  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->task_id(), "performance_check");
  EXPECT_EQ(r->executed_at(), clock_.now());
}

TEST_F(TaskRunnerTest, StampedResultSurvivesSerialization) {
  clock_.set(at_unix(kEpochStart) + 500ms);
  ASSERT_TRUE(runner_->register_task(std::make_unique<FixedResultTask>(
      TaskResult::interrupted("performance_check", 4, 1))));

  auto r = runner_->run("performance_check");

  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->executed_at(), at_unix(kEpochStart));
  EXPECT_EQ(TaskResult::from_json(r->to_json()), *r);
  EXPECT_EQ(host_->next_scheduled("performance_check"),
            at_unix(kEpochStart + 60));
}

TEST_F(TaskRunnerTest, ResetProgressDropsCheckpoint) {
  ASSERT_TRUE(ProgressStore::for_task(*store_, "media_scan", clock_)
                  .save({{"offset", 7}}));

  EXPECT_TRUE(runner_->reset_progress("media_scan"));
  EXPECT_FALSE(runner_->reset_progress("media_scan"));
}

TEST(ExecutionContextTest, BudgetAccounting) {
  TempDbPath db;
  SqliteStore store(db.path());
  ASSERT_TRUE(store.open().has_value());
  ManualClock clock;

  ExecutionContext ctx{"media_scan",
                       ProgressStore::for_task(store, "media_scan", clock),
                       clock,
                       {.time_limit = 2s, .time_buffer = 1s, .minimum = 10s}};

  EXPECT_EQ(ctx.time_limit(), 10s);
  EXPECT_EQ(ctx.remaining(), Elapsed{9});
  EXPECT_FALSE(ctx.is_time_limit_approaching());

  clock.advance(9s);
  EXPECT_TRUE(ctx.is_time_limit_approaching());
  EXPECT_EQ(ctx.remaining(), Elapsed{0});
  EXPECT_EQ(ctx.make_success(4, 4).elapsed_time(), Elapsed{9});
}
