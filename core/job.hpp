#ifndef CORE_JOB_HPP
#define CORE_JOB_HPP

#include <atomic>
#include <stdexcept>
#include <string>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "absl/types/optional.h"
#include "proto/request.pb.h"
#include "proto/response.pb.h"
#include "runtime/runtime_profile.hpp"

namespace core {

class Scheduler;

// A request that was refused before running any code.
class admission_error : public std::runtime_error {
 public:
  admission_error(proto::AdmissionErrorCode code, const std::string& msg)
      : std::runtime_error(msg), code_(code) {}
  proto::AdmissionErrorCode code() const { return code_; }

 private:
  proto::AdmissionErrorCode code_;
};

enum class JobState { QUEUED, RUNNING, COMPLETED, CANCELLED };

const char* JobStateName(JobState state);

// Handle to an admitted request. The state is changed only by the scheduler;
// callers can wait for the result or ask for cancellation.
class Job {
 public:
  Job(int64_t id, proto::ExecutionRequest request,
      const runtime::RuntimeProfile* profile, Scheduler* scheduler);

  int64_t Id() const { return id_; }
  const proto::ExecutionRequest& Request() const { return request_; }
  const runtime::RuntimeProfile& Profile() const { return *profile_; }
  absl::Time AdmittedAt() const { return admitted_at_; }

  JobState State() const;
  bool Done() const;

  // Blocks until the job is completed or cancelled.
  proto::ExecutionResult Wait() const;

  // Asks the scheduler to cancel the job. A queued job is removed from the
  // queue, a running one is killed. Has no effect on a finished job. Must not
  // be called after the scheduler is destroyed.
  void Cancel();

  Job(const Job&) = delete;
  Job& operator=(const Job&) = delete;

 private:
  friend class Scheduler;

  void SetRunning();
  void Finish(JobState state, proto::ExecutionResult result);
  const std::atomic<bool>& CancelToken() const { return cancelled_; }
  void Kill() { cancelled_ = true; }

  const int64_t id_;
  const proto::ExecutionRequest request_;
  const runtime::RuntimeProfile* profile_;
  Scheduler* scheduler_;
  const absl::Time admitted_at_;

  mutable absl::Mutex mutex_;
  JobState state_ GUARDED_BY(mutex_) = JobState::QUEUED;
  absl::optional<proto::ExecutionResult> result_ GUARDED_BY(mutex_);

  std::atomic<bool> cancelled_{false};
};

}  // namespace core

#endif
