#include "core/job.hpp"

#include <utility>

#include "absl/time/clock.h"
#include "core/scheduler.hpp"
#include "glog/logging.h"

namespace core {

const char* JobStateName(JobState state) {
  switch (state) {
    case JobState::QUEUED:
      return "QUEUED";
    case JobState::RUNNING:
      return "RUNNING";
    case JobState::COMPLETED:
      return "COMPLETED";
    case JobState::CANCELLED:
      return "CANCELLED";
  }
  return "UNKNOWN";
}

Job::Job(int64_t id, proto::ExecutionRequest request,
         const runtime::RuntimeProfile* profile, Scheduler* scheduler)
    : id_(id),
      request_(std::move(request)),
      profile_(profile),
      scheduler_(scheduler),
      admitted_at_(absl::Now()) {}

JobState Job::State() const {
  absl::MutexLock lck(&mutex_);
  return state_;
}

bool Job::Done() const {
  absl::MutexLock lck(&mutex_);
  return result_.has_value();
}

proto::ExecutionResult Job::Wait() const {
  absl::MutexLock lck(&mutex_);
  auto cond = [this]() {
    mutex_.AssertHeld();
    return result_.has_value();
  };
  mutex_.Await(absl::Condition(&cond));
  return *result_;
}

void Job::Cancel() { scheduler_->Cancel(id_); }

void Job::SetRunning() {
  absl::MutexLock lck(&mutex_);
  CHECK(state_ == JobState::QUEUED)
      << "Job " << id_ << " started while " << JobStateName(state_);
  state_ = JobState::RUNNING;
}

void Job::Finish(JobState state, proto::ExecutionResult result) {
  absl::MutexLock lck(&mutex_);
  CHECK(!result_.has_value()) << "Job " << id_ << " finished twice";
  state_ = state;
  result_ = std::move(result);
}

}  // namespace core
