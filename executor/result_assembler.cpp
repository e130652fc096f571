#include "executor/result_assembler.hpp"

#include <string.h>

#include "absl/strings/str_cat.h"

namespace executor {

namespace {

// Status and explanation of a breach.
void SetBreach(sandbox::Breach breach, proto::ExecutionResult* result) {
  switch (breach) {
    case sandbox::Breach::CANCELLED:
      result->set_status(proto::TIMEOUT);
      result->set_termination_reason(proto::CANCELLED);
      result->set_message("Execution cancelled");
      break;
    case sandbox::Breach::WALL_TIME:
      result->set_status(proto::TIMEOUT);
      result->set_termination_reason(proto::WALL_TIME);
      result->set_message("Wall clock limit exceeded");
      break;
    case sandbox::Breach::CPU_TIME:
      result->set_status(proto::TIMEOUT);
      result->set_termination_reason(proto::CPU_TIME);
      result->set_message("CPU time limit exceeded");
      break;
    case sandbox::Breach::MEMORY:
      result->set_status(proto::MEMORY_EXCEEDED);
      result->set_termination_reason(proto::MEMORY);
      result->set_message("Memory limit exceeded");
      break;
    case sandbox::Breach::OUTPUT:
      result->set_status(proto::OUTPUT_TRUNCATED);
      result->set_termination_reason(proto::OUTPUT);
      result->set_message("Output limit exceeded");
      break;
    case sandbox::Breach::NONE:
      break;
  }
}

}  // namespace

bool StepSucceeded(const sandbox::ExecutionInfo& info) {
  return info.breach == sandbox::Breach::NONE && info.exited &&
         info.status_code == 0;
}

proto::ExecutionResult AssembleResult(Step step,
                                      const sandbox::ExecutionInfo& info) {
  proto::ExecutionResult result;
  result.set_wall_time_ms(info.wall_time_millis);
  result.set_cpu_time_ms(info.cpu_time_millis + info.sys_time_millis);
  result.set_peak_memory_bytes(info.memory_usage_bytes);
  result.set_signal(info.signal);
  if (info.exited) result.set_exit_code(info.status_code);

  if (step == Step::COMPILATION) {
    result.set_stderr(info.stderr_data + info.stdout_data);
    result.set_stderr_truncated(info.stderr_truncated ||
                                info.stdout_truncated);
  } else {
    result.set_stdout(info.stdout_data);
    result.set_stdout_truncated(info.stdout_truncated);
    result.set_stderr(info.stderr_data);
    result.set_stderr_truncated(info.stderr_truncated);
  }

  if (info.breach != sandbox::Breach::NONE) {
    SetBreach(info.breach, &result);
  } else if (info.signal || info.status_code || !info.exited) {
    result.set_status(step == Step::COMPILATION ? proto::COMPILE_ERROR
                                                : proto::RUNTIME_ERROR);
    if (info.signal) {
      result.set_message(
          absl::StrCat("Killed by signal ", info.signal, " (",
                       strsignal(info.signal), ")"));
    } else if (step == Step::COMPILATION) {
      result.set_message("Compilation failed");
    } else {
      result.set_message(
          absl::StrCat("Exited with code ", info.status_code));
    }
  } else {
    result.set_status(proto::SUCCESS);
  }
  return result;
}

proto::ExecutionResult InternalErrorResult() {
  proto::ExecutionResult result;
  result.set_status(proto::INTERNAL_ERROR);
  result.set_message("internal error");
  return result;
}

proto::ExecutionResult CancelledResult() {
  proto::ExecutionResult result;
  result.set_status(proto::TIMEOUT);
  result.set_termination_reason(proto::CANCELLED);
  result.set_message("Execution cancelled");
  return result;
}

}  // namespace executor
