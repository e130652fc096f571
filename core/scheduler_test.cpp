#include "core/scheduler.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "absl/memory/memory.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAre;

using namespace core;

// Runs a job by echoing its source, once the test releases it. Jobs whose
// source is "throw" fail with an exception.
class FakeExecutor : public executor::Executor {
 public:
  std::string Id() const override { return "FAKE"; }

  proto::ExecutionResult Execute(const proto::ExecutionRequest& request,
                                 const runtime::RuntimeProfile& /*profile*/,
                                 const std::atomic<bool>& cancelled) override {
    {
      absl::MutexLock lck(&mutex_);
      started_.push_back(request.source_code());
    }
    proto::ExecutionResult result;
    while (true) {
      if (cancelled) {
        result.set_status(proto::TIMEOUT);
        result.set_termination_reason(proto::CANCELLED);
        return result;
      }
      absl::MutexLock lck(&mutex_);
      auto cond = [this]() {
        mutex_.AssertHeld();
        return released_;
      };
      if (mutex_.AwaitWithTimeout(absl::Condition(&cond),
                                  absl::Milliseconds(5))) {
        break;
      }
    }
    if (request.source_code() == "throw") throw std::runtime_error("boom");
    result.set_status(proto::SUCCESS);
    result.set_stdout(request.source_code());
    result.set_exit_code(0);
    return result;
  }

  void Release() {
    absl::MutexLock lck(&mutex_);
    released_ = true;
  }

  void WaitStarted(size_t count) {
    absl::MutexLock lck(&mutex_);
    auto cond = [this, count]() {
      mutex_.AssertHeld();
      return started_.size() >= count;
    };
    mutex_.Await(absl::Condition(&cond));
  }

  std::vector<std::string> Started() {
    absl::MutexLock lck(&mutex_);
    return started_;
  }

 private:
  absl::Mutex mutex_;
  bool released_ GUARDED_BY(mutex_) = false;
  std::vector<std::string> started_ GUARDED_BY(mutex_);
};

runtime::RuntimeProfile BashProfile() {
  runtime::RuntimeProfile profile;
  profile.language = proto::BASH;
  profile.name = "bash";
  profile.source_name = "main.sh";
  profile.recipe =
      runtime::InterpretedRecipe{{"bash", runtime::kSourcePlaceholder}};
  return profile;
}

proto::ExecutionRequest Request(const std::string& source,
                                const std::string& caller = "caller") {
  proto::ExecutionRequest request;
  request.set_language(proto::BASH);
  request.set_source_code(source);
  request.set_caller_id(caller);
  return request;
}

class SchedulerTest : public ::testing::Test {
 protected:
  SchedulerTest()
      : registry_(std::vector<runtime::RuntimeProfile>{BashProfile()}) {}

  void Start(int32_t workers, int32_t queue, int32_t quota) {
    Scheduler::Options options;
    options.max_concurrent_jobs = workers;
    options.max_queue_length = queue;
    options.per_caller_quota = quota;
    options.max_source_bytes = 16;
    options.max_stdin_bytes = 16;
    scheduler_ = absl::make_unique<Scheduler>(&registry_, &executor_, options);
  }

  proto::AdmissionErrorCode SubmitError(proto::ExecutionRequest request) {
    try {
      scheduler_->Submit(std::move(request));
    } catch (const admission_error& exc) {
      return exc.code();
    }
    return proto::NO_ADMISSION_ERROR;
  }

  runtime::RuntimeRegistry registry_;
  FakeExecutor executor_;
  std::unique_ptr<Scheduler> scheduler_;
};

TEST_F(SchedulerTest, QueueIsFifo) {
  Start(1, 8, 0);
  auto a = scheduler_->Submit(Request("a"));
  executor_.WaitStarted(1);
  auto b = scheduler_->Submit(Request("b"));
  auto c = scheduler_->Submit(Request("c"));
  auto d = scheduler_->Submit(Request("d"));
  EXPECT_EQ(a->State(), JobState::RUNNING);
  EXPECT_EQ(b->State(), JobState::QUEUED);
  Scheduler::Stats stats = scheduler_->GetStats();
  EXPECT_EQ(stats.running, 1);
  EXPECT_EQ(stats.queued, 3);

  executor_.Release();
  EXPECT_EQ(d->Wait().stdout(), "d");
  EXPECT_EQ(a->Wait().status(), proto::SUCCESS);
  EXPECT_EQ(a->State(), JobState::COMPLETED);
  EXPECT_EQ(a->Wait().language(), proto::BASH);
  EXPECT_THAT(executor_.Started(), ElementsAre("a", "b", "c", "d"));
  stats = scheduler_->GetStats();
  EXPECT_EQ(stats.running, 0);
  EXPECT_EQ(stats.queued, 0);
}

TEST_F(SchedulerTest, FullQueueIsOverloaded) {
  Start(2, 2, 0);
  std::vector<std::shared_ptr<Job>> jobs;
  for (int i = 0; i < 4; i++)
    jobs.push_back(scheduler_->Submit(Request(std::to_string(i))));
  EXPECT_EQ(SubmitError(Request("4")), proto::OVERLOADED);
  Scheduler::Stats stats = scheduler_->GetStats();
  EXPECT_EQ(stats.running, 2);
  EXPECT_EQ(stats.queued, 2);

  executor_.Release();
  for (const auto& job : jobs) EXPECT_EQ(job->Wait().status(), proto::SUCCESS);
  EXPECT_EQ(executor_.Started().size(), 4u);
}

TEST_F(SchedulerTest, QuotaIsPerCaller) {
  Start(2, 2, 2);
  auto a1 = scheduler_->Submit(Request("a1", "alice"));
  auto a2 = scheduler_->Submit(Request("a2", "alice"));
  EXPECT_EQ(SubmitError(Request("a3", "alice")), proto::QUOTA_EXCEEDED);
  auto b1 = scheduler_->Submit(Request("b1", "bob"));
  EXPECT_EQ(b1->State(), JobState::QUEUED);

  executor_.Release();
  EXPECT_EQ(a1->Wait().status(), proto::SUCCESS);
  EXPECT_EQ(a2->Wait().status(), proto::SUCCESS);
  EXPECT_EQ(b1->Wait().status(), proto::SUCCESS);
  // The quota is released with the jobs.
  EXPECT_EQ(scheduler_->Run(Request("a4", "alice")).result().status(),
            proto::SUCCESS);
}

TEST_F(SchedulerTest, CancelQueuedJob) {
  Start(1, 4, 2);
  auto running = scheduler_->Submit(Request("run", "alice"));
  auto queued = scheduler_->Submit(Request("queued", "alice"));
  queued->Cancel();
  proto::ExecutionResult result = queued->Wait();
  EXPECT_EQ(queued->State(), JobState::CANCELLED);
  EXPECT_EQ(result.status(), proto::TIMEOUT);
  EXPECT_EQ(result.termination_reason(), proto::CANCELLED);
  EXPECT_FALSE(result.has_exit_code());
  EXPECT_EQ(result.wall_time_ms(), 0);
  EXPECT_EQ(result.cpu_time_ms(), 0);
  EXPECT_EQ(result.peak_memory_bytes(), 0);
  EXPECT_EQ(result.language(), proto::BASH);

  // Both the quota and the queue position are freed.
  auto next = scheduler_->Submit(Request("next", "alice"));
  EXPECT_EQ(scheduler_->GetStats().queued, 1);
  executor_.Release();
  EXPECT_EQ(next->Wait().stdout(), "next");
  EXPECT_THAT(executor_.Started(), ElementsAre("run", "next"));
}

TEST_F(SchedulerTest, CancelRunningJob) {
  Start(1, 4, 0);
  auto job = scheduler_->Submit(Request("a"));
  executor_.WaitStarted(1);
  job->Cancel();
  proto::ExecutionResult result = job->Wait();
  EXPECT_EQ(result.status(), proto::TIMEOUT);
  EXPECT_EQ(result.termination_reason(), proto::CANCELLED);
  EXPECT_EQ(job->State(), JobState::COMPLETED);
  // Cancelling a finished job has no effect.
  job->Cancel();
  EXPECT_EQ(scheduler_->GetStats().running, 0);
}

TEST_F(SchedulerTest, StopShedsQueue) {
  Start(1, 4, 0);
  auto running = scheduler_->Submit(Request("a"));
  auto queued = scheduler_->Submit(Request("b"));
  executor_.WaitStarted(1);
  scheduler_->Stop();
  EXPECT_TRUE(running->Done());
  EXPECT_EQ(running->Wait().termination_reason(), proto::CANCELLED);
  EXPECT_EQ(queued->State(), JobState::CANCELLED);
  EXPECT_EQ(queued->Wait().termination_reason(), proto::CANCELLED);
  EXPECT_EQ(SubmitError(Request("c")), proto::OVERLOADED);
  scheduler_->Stop();
  EXPECT_THAT(executor_.Started(), ElementsAre("a"));
}

TEST_F(SchedulerTest, UnsupportedLanguage) {
  Start(1, 4, 0);
  proto::ExecutionRequest request = Request("a");
  request.set_language(proto::JAVA);
  proto::SubmitResponse response = scheduler_->Run(request);
  ASSERT_TRUE(response.has_admission_error());
  EXPECT_EQ(response.admission_error().code(), proto::UNSUPPORTED_LANGUAGE);
  EXPECT_TRUE(executor_.Started().empty());
}

TEST_F(SchedulerTest, RequestTooLarge) {
  Start(1, 4, 0);
  EXPECT_EQ(SubmitError(Request(std::string(17, 'x'))),
            proto::REQUEST_TOO_LARGE);
  proto::ExecutionRequest request = Request("a");
  request.set_stdin(std::string(17, 'x'));
  EXPECT_EQ(SubmitError(request), proto::REQUEST_TOO_LARGE);
  EXPECT_TRUE(executor_.Started().empty());
}

TEST_F(SchedulerTest, ExecutorFailureReleasesSlot) {
  Start(1, 4, 1);
  executor_.Release();
  proto::SubmitResponse failed = scheduler_->Run(Request("throw"));
  ASSERT_TRUE(failed.has_result());
  EXPECT_EQ(failed.result().status(), proto::INTERNAL_ERROR);
  EXPECT_EQ(failed.result().message(), "internal error");
  proto::SubmitResponse ok = scheduler_->Run(Request("ok"));
  ASSERT_TRUE(ok.has_result());
  EXPECT_EQ(ok.result().status(), proto::SUCCESS);
  EXPECT_EQ(ok.result().stdout(), "ok");
}

TEST_F(SchedulerTest, DefaultWorkers) {
  Start(0, 4, 0);
  EXPECT_GE(scheduler_->NumWorkers(), 1);
}

}  // namespace
