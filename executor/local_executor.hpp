#ifndef EXECUTOR_LOCAL_EXECUTOR_HPP
#define EXECUTOR_LOCAL_EXECUTOR_HPP

#include "executor/environment.hpp"
#include "executor/executor.hpp"

namespace executor {

// Runs jobs on this host: every job gets its own environment, where the
// source is compiled (if needed) and then run.
class LocalExecutor : public Executor {
 public:
  static ExecutionEnvironment::Options OptionsFromFlags();

  explicit LocalExecutor(ExecutionEnvironment::Options options);

  std::string Id() const override { return "LOCAL"; }
  proto::ExecutionResult Execute(const proto::ExecutionRequest& request,
                                 const runtime::RuntimeProfile& profile,
                                 const std::atomic<bool>& cancelled) override;

  LocalExecutor(const LocalExecutor&) = delete;
  LocalExecutor& operator=(const LocalExecutor&) = delete;
  LocalExecutor(LocalExecutor&&) = delete;
  LocalExecutor& operator=(LocalExecutor&&) = delete;
  ~LocalExecutor() override = default;

 private:
  proto::ExecutionResult Run(ExecutionEnvironment* env,
                             const proto::ExecutionRequest& request,
                             const runtime::RuntimeProfile& profile,
                             const std::atomic<bool>& cancelled);

  ExecutionEnvironment::Options options_;
};

}  // namespace executor

#endif
