#ifndef CORE_SCHEDULER_HPP
#define CORE_SCHEDULER_HPP

#include <atomic>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "absl/synchronization/mutex.h"
#include "absl/types/variant.h"
#include "core/channel.hpp"
#include "core/job.hpp"
#include "executor/executor.hpp"
#include "runtime/registry.hpp"

namespace core {

// Admits requests and runs them on a fixed pool of workers. At most
// max_concurrent_jobs run at the same time and at most max_queue_length wait
// for a slot, in FIFO order; every other request is rejected. All the
// admission state is owned by a single arbiter thread that is driven by
// events posted on a channel.
class Scheduler {
 public:
  struct Options {
    // 0 means one slot per hardware thread.
    int32_t max_concurrent_jobs = 0;
    int32_t max_queue_length = 64;
    // Queued plus running jobs of a single caller. 0 means unlimited.
    int32_t per_caller_quota = 4;
    int64_t max_source_bytes = 64 * 1024;
    int64_t max_stdin_bytes = 1024 * 1024;
  };

  struct Stats {
    int32_t running = 0;
    int32_t queued = 0;
  };

  static Options OptionsFromFlags();

  Scheduler(const runtime::RuntimeRegistry* registry,
            executor::Executor* executor, Options options);
  ~Scheduler();

  // Validates and admits the request. Blocks until the admission decision is
  // taken; throws admission_error if the request is refused.
  std::shared_ptr<Job> Submit(proto::ExecutionRequest request);

  // Submits the request and waits for its result. Admission errors are
  // returned in the response.
  proto::SubmitResponse Run(proto::ExecutionRequest request);

  // Cancels the job with the given id, if it is still queued or running.
  void Cancel(int64_t job_id);

  Stats GetStats();

  // Rejects new requests, cancels the queued and the running jobs and waits
  // for the workers. Can be called more than once.
  void Stop();

  int32_t NumWorkers() const { return num_workers_; }

  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;
  Scheduler(Scheduler&&) = delete;
  Scheduler& operator=(Scheduler&&) = delete;

 private:
  struct SubmitEvent {
    std::shared_ptr<Job> job;
    std::promise<void> admitted;
  };
  struct CancelEvent {
    int64_t job_id;
  };
  struct CompleteEvent {
    std::shared_ptr<Job> job;
    proto::ExecutionResult result;
  };
  struct StatsEvent {
    std::promise<Stats> stats;
  };
  struct StopEvent {
    std::promise<void> done;
  };
  using Event = absl::variant<SubmitEvent, CancelEvent, CompleteEvent,
                              StatsEvent, StopEvent>;

  void ArbiterBody();
  void WorkerBody();

  // Arbiter handlers.
  void OnSubmit(SubmitEvent* event);
  void OnCancel(const CancelEvent& event);
  void OnComplete(CompleteEvent* event);
  void OnStop(StopEvent* event);
  void Start(const std::shared_ptr<Job>& job);
  void Release(const Job& job);
  void GrantQueued();
  void CheckStopped();

  const runtime::RuntimeRegistry* registry_;
  executor::Executor* executor_;
  const Options options_;
  int32_t num_workers_;
  std::atomic<int64_t> next_id_{1};

  Channel<Event> events_;
  Channel<std::shared_ptr<Job>> grants_;
  std::thread arbiter_;
  std::vector<std::thread> workers_;

  absl::Mutex stop_mutex_;
  bool stopped_ GUARDED_BY(stop_mutex_) = false;

  // Owned by the arbiter thread.
  std::deque<std::shared_ptr<Job>> queue_;
  std::map<int64_t, std::shared_ptr<Job>> running_;
  std::map<std::string, int32_t> per_caller_;
  bool stopping_ = false;
  std::vector<std::promise<void>> stop_waiters_;
};

}  // namespace core

#endif
