#ifndef EXECUTOR_RESULT_ASSEMBLER_HPP
#define EXECUTOR_RESULT_ASSEMBLER_HPP

#include "proto/response.pb.h"
#include "sandbox/sandbox.hpp"

namespace executor {

enum class Step { COMPILATION, EXECUTION };

// Whether a step ended normally: no limit exceeded, no signal and a zero exit
// code.
bool StepSucceeded(const sandbox::ExecutionInfo& info);

// Maps the raw outcome of a step into the result returned to the caller. For
// a compilation step the diagnostics are returned as stderr, and a failure
// that is not due to a limit is reported as COMPILE_ERROR.
// Limits take precedence over the exit status, in the order cancellation,
// wall time, CPU time, memory and output.
proto::ExecutionResult AssembleResult(Step step,
                                      const sandbox::ExecutionInfo& info);

// Result reported when the service fails. Details are only logged.
proto::ExecutionResult InternalErrorResult();

// Result of a job that was cancelled before it started.
proto::ExecutionResult CancelledResult();

}  // namespace executor

#endif
