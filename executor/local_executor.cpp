#include "executor/local_executor.hpp"

#include <stdexcept>

#include "executor/result_assembler.hpp"
#include "glog/logging.h"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace executor {

// static
ExecutionEnvironment::Options LocalExecutor::OptionsFromFlags() {
  ExecutionEnvironment::Options options;
  options.temp_directory = FLAGS_temp_directory;
  options.keep_sandboxes = FLAGS_keep_sandboxes;
  options.sandbox_uid = FLAGS_sandbox_uid;
  options.sandbox_gid = FLAGS_sandbox_gid;
  options.require_isolation = FLAGS_require_isolation;
  options.poll_interval_millis = FLAGS_poll_interval_ms;
  return options;
}

LocalExecutor::LocalExecutor(ExecutionEnvironment::Options options)
    : options_(std::move(options)) {
  util::File::MakeDirs(options_.temp_directory);
}

proto::ExecutionResult LocalExecutor::Execute(
    const proto::ExecutionRequest& request,
    const runtime::RuntimeProfile& profile,
    const std::atomic<bool>& cancelled) {
  proto::ExecutionResult result;
  std::unique_ptr<ExecutionEnvironment> env;
  try {
    env = ExecutionEnvironment::Provision(options_, profile);
    result = Run(env.get(), request, profile, cancelled);
  } catch (const std::exception& exc) {
    LOG(ERROR) << "Running " << profile.name << " job from caller "
               << request.caller_id() << " failed: " << exc.what();
    result = InternalErrorResult();
  }
  if (env) env->Teardown();
  result.set_language(request.language());
  return result;
}

proto::ExecutionResult LocalExecutor::Run(
    ExecutionEnvironment* env, const proto::ExecutionRequest& request,
    const runtime::RuntimeProfile& profile,
    const std::atomic<bool>& cancelled) {
  env->Prepare(request.source_code(), request.stdin());
  std::string error_msg;
  if (profile.HasCompileStep()) {
    const auto& recipe = absl::get<runtime::CompiledRecipe>(profile.recipe);
    sandbox::ExecutionInfo compilation;
    if (!env->Run(runtime::ExpandCommand(recipe.compile_command,
                                         profile.source_name,
                                         profile.binary_name),
                  recipe.compile_limits, &cancelled, &compilation,
                  &error_msg)) {
      throw std::runtime_error("Compilation could not start: " + error_msg);
    }
    if (!StepSucceeded(compilation)) {
      return AssembleResult(Step::COMPILATION, compilation);
    }
  }
  sandbox::ExecutionInfo execution;
  if (!env->Run(runtime::ExpandCommand(profile.RunCommand(),
                                       profile.source_name,
                                       profile.binary_name),
                profile.limits, &cancelled, &execution, &error_msg)) {
    throw std::runtime_error("Execution could not start: " + error_msg);
  }
  return AssembleResult(Step::EXECUTION, execution);
}

}  // namespace executor
