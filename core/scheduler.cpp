#include "core/scheduler.hpp"

#include <algorithm>
#include <exception>
#include <functional>
#include <utility>

#include "absl/strings/str_cat.h"
#include "executor/result_assembler.hpp"
#include "glog/logging.h"
#include "util/flags.hpp"

namespace core {

namespace {

void Reject(std::promise<void>* admitted, proto::AdmissionErrorCode code,
            const std::string& message) {
  VLOG(1) << "Rejected: " << proto::AdmissionErrorCode_Name(code) << " "
          << message;
  admitted->set_exception(
      std::make_exception_ptr(admission_error(code, message)));
}

}  // namespace

// static
Scheduler::Options Scheduler::OptionsFromFlags() {
  Options options;
  options.max_concurrent_jobs = FLAGS_max_concurrent_jobs;
  options.max_queue_length = FLAGS_max_queue_length;
  options.per_caller_quota = FLAGS_per_caller_quota;
  options.max_source_bytes = FLAGS_max_source_bytes;
  options.max_stdin_bytes = FLAGS_max_stdin_bytes;
  return options;
}

Scheduler::Scheduler(const runtime::RuntimeRegistry* registry,
                     executor::Executor* executor, Options options)
    : registry_(registry), executor_(executor), options_(options) {
  CHECK_GE(options_.max_queue_length, 0);
  num_workers_ = options_.max_concurrent_jobs;
  if (num_workers_ <= 0) {
    num_workers_ = std::max(1u, std::thread::hardware_concurrency());
  }
  LOG(INFO) << "Starting " << num_workers_ << " workers on executor "
            << executor_->Id();
  arbiter_ = std::thread(std::bind(&Scheduler::ArbiterBody, this));
  for (int32_t i = 0; i < num_workers_; i++)
    workers_.emplace_back(std::bind(&Scheduler::WorkerBody, this));
}

Scheduler::~Scheduler() { Stop(); }

std::shared_ptr<Job> Scheduler::Submit(proto::ExecutionRequest request) {
  if (!registry_->Supports(request.language())) {
    throw admission_error(
        proto::UNSUPPORTED_LANGUAGE,
        absl::StrCat("Unsupported language: ",
                     proto::Language_Name(request.language())));
  }
  if (options_.max_source_bytes > 0 &&
      static_cast<int64_t>(request.source_code().size()) >
          options_.max_source_bytes) {
    throw admission_error(proto::REQUEST_TOO_LARGE,
                          absl::StrCat("Source code larger than ",
                                       options_.max_source_bytes, " bytes"));
  }
  if (options_.max_stdin_bytes > 0 && request.has_stdin() &&
      static_cast<int64_t>(request.stdin().size()) > options_.max_stdin_bytes) {
    throw admission_error(proto::REQUEST_TOO_LARGE,
                          absl::StrCat("Standard input larger than ",
                                       options_.max_stdin_bytes, " bytes"));
  }

  const runtime::RuntimeProfile* profile =
      &registry_->Resolve(request.language());
  auto job =
      std::make_shared<Job>(next_id_++, std::move(request), profile, this);
  std::promise<void> admitted;
  std::future<void> decision = admitted.get_future();
  if (!events_.Enqueue(Event(SubmitEvent{job, std::move(admitted)}))) {
    throw admission_error(proto::OVERLOADED, "The service is shutting down");
  }
  decision.get();
  return job;
}

proto::SubmitResponse Scheduler::Run(proto::ExecutionRequest request) {
  proto::SubmitResponse response;
  std::shared_ptr<Job> job;
  try {
    job = Submit(std::move(request));
  } catch (const admission_error& exc) {
    response.mutable_admission_error()->set_code(exc.code());
    response.mutable_admission_error()->set_message(exc.what());
    return response;
  }
  *response.mutable_result() = job->Wait();
  return response;
}

void Scheduler::Cancel(int64_t job_id) {
  if (!events_.Enqueue(Event(CancelEvent{job_id}))) {
    VLOG(1) << "Cancel of job " << job_id << " after shutdown";
  }
}

Scheduler::Stats Scheduler::GetStats() {
  std::promise<Stats> promise;
  std::future<Stats> stats = promise.get_future();
  if (!events_.Enqueue(Event(StatsEvent{std::move(promise)}))) return Stats{};
  return stats.get();
}

void Scheduler::Stop() {
  {
    absl::MutexLock lck(&stop_mutex_);
    if (stopped_) return;
    stopped_ = true;
  }
  std::promise<void> promise;
  std::future<void> done = promise.get_future();
  if (events_.Enqueue(Event(StopEvent{std::move(promise)}))) done.wait();
  events_.Stop();
  grants_.Stop();
  arbiter_.join();
  for (std::thread& worker : workers_) worker.join();
  LOG(INFO) << "Scheduler stopped";
}

void Scheduler::ArbiterBody() {
  while (true) {
    absl::optional<Event> event = events_.Dequeue();
    if (!event.has_value()) break;
    if (auto* submit = absl::get_if<SubmitEvent>(&*event)) {
      OnSubmit(submit);
    } else if (auto* cancel = absl::get_if<CancelEvent>(&*event)) {
      OnCancel(*cancel);
    } else if (auto* complete = absl::get_if<CompleteEvent>(&*event)) {
      OnComplete(complete);
    } else if (auto* stats = absl::get_if<StatsEvent>(&*event)) {
      Stats current;
      current.running = running_.size();
      current.queued = queue_.size();
      stats->stats.set_value(current);
    } else if (auto* stop = absl::get_if<StopEvent>(&*event)) {
      OnStop(stop);
    }
  }
}

void Scheduler::WorkerBody() {
  while (true) {
    absl::optional<std::shared_ptr<Job>> granted = grants_.Dequeue();
    if (!granted.has_value()) break;
    std::shared_ptr<Job> job = std::move(*granted);
    VLOG(1) << "Running job " << job->Id() << " ("
            << job->Profile().name << ")";
    proto::ExecutionResult result;
    try {
      result = executor_->Execute(job->Request(), job->Profile(),
                                  job->CancelToken());
    } catch (const std::exception& exc) {
      LOG(ERROR) << "Job " << job->Id() << " failed: " << exc.what();
      result = executor::InternalErrorResult();
    }
    result.set_language(job->Request().language());
    CHECK(events_.Enqueue(Event(CompleteEvent{job, std::move(result)})))
        << "Job " << job->Id() << " completed after shutdown";
  }
}

void Scheduler::OnSubmit(SubmitEvent* event) {
  const std::shared_ptr<Job>& job = event->job;
  const std::string& caller = job->Request().caller_id();
  if (stopping_) {
    Reject(&event->admitted, proto::OVERLOADED,
           "The service is shutting down");
    return;
  }
  if (options_.per_caller_quota > 0) {
    auto it = per_caller_.find(caller);
    if (it != per_caller_.end() && it->second >= options_.per_caller_quota) {
      Reject(&event->admitted, proto::QUOTA_EXCEEDED,
             absl::StrCat("Too many jobs of this caller, at most ",
                          options_.per_caller_quota, " allowed"));
      return;
    }
  }
  if (static_cast<int32_t>(running_.size()) < num_workers_) {
    per_caller_[caller]++;
    Start(job);
  } else if (static_cast<int32_t>(queue_.size()) <
             options_.max_queue_length) {
    per_caller_[caller]++;
    queue_.push_back(job);
    VLOG(1) << "Queued job " << job->Id() << " at position " << queue_.size();
  } else {
    Reject(&event->admitted, proto::OVERLOADED,
           "Too many pending jobs, try again later");
    return;
  }
  event->admitted.set_value();
}

void Scheduler::OnCancel(const CancelEvent& event) {
  auto queued = std::find_if(queue_.begin(), queue_.end(),
                             [&event](const std::shared_ptr<Job>& job) {
                               return job->Id() == event.job_id;
                             });
  if (queued != queue_.end()) {
    std::shared_ptr<Job> job = *queued;
    queue_.erase(queued);
    Release(*job);
    proto::ExecutionResult result = executor::CancelledResult();
    result.set_language(job->Request().language());
    job->Finish(JobState::CANCELLED, std::move(result));
    VLOG(1) << "Cancelled queued job " << job->Id();
    return;
  }
  auto running = running_.find(event.job_id);
  if (running != running_.end()) {
    running->second->Kill();
    VLOG(1) << "Killing job " << event.job_id;
  }
}

void Scheduler::OnComplete(CompleteEvent* event) {
  std::shared_ptr<Job> job = std::move(event->job);
  CHECK_EQ(running_.erase(job->Id()), 1u)
      << "Job " << job->Id() << " completed but not running";
  Release(*job);
  VLOG(1) << "Job " << job->Id() << " completed: "
          << proto::Status_Name(event->result.status());
  job->Finish(JobState::COMPLETED, std::move(event->result));
  GrantQueued();
  CheckStopped();
}

void Scheduler::OnStop(StopEvent* event) {
  stopping_ = true;
  stop_waiters_.push_back(std::move(event->done));
  LOG(INFO) << "Stopping: shedding " << queue_.size() << " queued jobs, "
            << "cancelling " << running_.size() << " running jobs";
  for (const std::shared_ptr<Job>& job : queue_) {
    Release(*job);
    proto::ExecutionResult result = executor::CancelledResult();
    result.set_language(job->Request().language());
    job->Finish(JobState::CANCELLED, std::move(result));
  }
  queue_.clear();
  for (const auto& kv : running_) kv.second->Kill();
  CheckStopped();
}

void Scheduler::Start(const std::shared_ptr<Job>& job) {
  job->SetRunning();
  running_[job->Id()] = job;
  std::shared_ptr<Job> granted = job;
  CHECK(grants_.Enqueue(std::move(granted)))
      << "Job " << job->Id() << " granted after shutdown";
}

void Scheduler::Release(const Job& job) {
  auto it = per_caller_.find(job.Request().caller_id());
  CHECK(it != per_caller_.end()) << "Job " << job.Id() << " not accounted";
  if (--it->second == 0) per_caller_.erase(it);
}

void Scheduler::GrantQueued() {
  while (!stopping_ && !queue_.empty() &&
         static_cast<int32_t>(running_.size()) < num_workers_) {
    std::shared_ptr<Job> job = std::move(queue_.front());
    queue_.pop_front();
    Start(job);
  }
}

void Scheduler::CheckStopped() {
  if (!stopping_ || !running_.empty()) return;
  for (std::promise<void>& waiter : stop_waiters_) waiter.set_value();
  stop_waiters_.clear();
}

}  // namespace core
