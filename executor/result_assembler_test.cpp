#include "executor/result_assembler.hpp"

#include <signal.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::HasSubstr;

using namespace executor;

sandbox::ExecutionInfo Exited(int code) {
  sandbox::ExecutionInfo info;
  info.exited = true;
  info.status_code = code;
  info.wall_time_millis = 120;
  info.cpu_time_millis = 70;
  info.sys_time_millis = 10;
  info.memory_usage_bytes = 4096;
  info.stdout_data = "out";
  info.stderr_data = "err";
  return info;
}

sandbox::ExecutionInfo Killed(sandbox::Breach breach) {
  sandbox::ExecutionInfo info;
  info.signal = SIGKILL;
  info.killed = true;
  info.breach = breach;
  return info;
}

TEST(ResultAssemblerTest, Success) {
  proto::ExecutionResult result =
      AssembleResult(Step::EXECUTION, Exited(0));
  EXPECT_EQ(result.status(), proto::SUCCESS);
  EXPECT_TRUE(result.has_exit_code());
  EXPECT_EQ(result.exit_code(), 0);
  EXPECT_EQ(result.stdout(), "out");
  EXPECT_EQ(result.stderr(), "err");
  EXPECT_EQ(result.wall_time_ms(), 120);
  EXPECT_EQ(result.cpu_time_ms(), 80);
  EXPECT_EQ(result.peak_memory_bytes(), 4096);
  EXPECT_EQ(result.termination_reason(), proto::NOT_TERMINATED);
}

TEST(ResultAssemblerTest, NonZeroExit) {
  proto::ExecutionResult result =
      AssembleResult(Step::EXECUTION, Exited(3));
  EXPECT_EQ(result.status(), proto::RUNTIME_ERROR);
  EXPECT_EQ(result.exit_code(), 3);
  EXPECT_THAT(result.message(), HasSubstr("3"));
}

TEST(ResultAssemblerTest, Signal) {
  sandbox::ExecutionInfo info;
  info.signal = SIGSEGV;
  proto::ExecutionResult result = AssembleResult(Step::EXECUTION, info);
  EXPECT_EQ(result.status(), proto::RUNTIME_ERROR);
  EXPECT_FALSE(result.has_exit_code());
  EXPECT_EQ(result.signal(), SIGSEGV);
  EXPECT_THAT(result.message(), HasSubstr("signal 11"));
}

TEST(ResultAssemblerTest, Breaches) {
  struct {
    sandbox::Breach breach;
    proto::Status status;
    proto::TerminationReason reason;
  } cases[] = {
      {sandbox::Breach::CANCELLED, proto::TIMEOUT, proto::CANCELLED},
      {sandbox::Breach::WALL_TIME, proto::TIMEOUT, proto::WALL_TIME},
      {sandbox::Breach::CPU_TIME, proto::TIMEOUT, proto::CPU_TIME},
      {sandbox::Breach::MEMORY, proto::MEMORY_EXCEEDED, proto::MEMORY},
      {sandbox::Breach::OUTPUT, proto::OUTPUT_TRUNCATED, proto::OUTPUT},
  };
  for (const auto& c : cases) {
    proto::ExecutionResult result =
        AssembleResult(Step::EXECUTION, Killed(c.breach));
    EXPECT_EQ(result.status(), c.status) << sandbox::BreachName(c.breach);
    EXPECT_EQ(result.termination_reason(), c.reason);
    EXPECT_FALSE(result.has_exit_code());
    EXPECT_EQ(result.signal(), SIGKILL);
  }
}

TEST(ResultAssemblerTest, BreachWinsOverCleanExit) {
  sandbox::ExecutionInfo info = Exited(0);
  info.breach = sandbox::Breach::MEMORY;
  proto::ExecutionResult result = AssembleResult(Step::EXECUTION, info);
  EXPECT_EQ(result.status(), proto::MEMORY_EXCEEDED);
  // The program exited on its own, so its code is still known.
  EXPECT_EQ(result.exit_code(), 0);
}

TEST(ResultAssemblerTest, TruncatedOutputIsKept) {
  sandbox::ExecutionInfo info = Killed(sandbox::Breach::OUTPUT);
  info.stdout_data = std::string(100, 'x');
  info.stdout_truncated = true;
  proto::ExecutionResult result = AssembleResult(Step::EXECUTION, info);
  EXPECT_EQ(result.stdout(), std::string(100, 'x'));
  EXPECT_TRUE(result.stdout_truncated());
  EXPECT_FALSE(result.stderr_truncated());
}

TEST(ResultAssemblerTest, CompileError) {
  sandbox::ExecutionInfo info = Exited(1);
  info.stdout_data = "";
  info.stderr_data = "main.c:1: error";
  EXPECT_FALSE(StepSucceeded(info));
  proto::ExecutionResult result = AssembleResult(Step::COMPILATION, info);
  EXPECT_EQ(result.status(), proto::COMPILE_ERROR);
  EXPECT_EQ(result.stderr(), "main.c:1: error");
  EXPECT_EQ(result.stdout(), "");
}

TEST(ResultAssemblerTest, CompileTimeout) {
  proto::ExecutionResult result =
      AssembleResult(Step::COMPILATION, Killed(sandbox::Breach::WALL_TIME));
  EXPECT_EQ(result.status(), proto::TIMEOUT);
  EXPECT_EQ(result.termination_reason(), proto::WALL_TIME);
}

TEST(ResultAssemblerTest, StepSucceeded) {
  EXPECT_TRUE(StepSucceeded(Exited(0)));
  EXPECT_FALSE(StepSucceeded(Exited(2)));
  EXPECT_FALSE(StepSucceeded(Killed(sandbox::Breach::CPU_TIME)));
  sandbox::ExecutionInfo info = Exited(0);
  info.breach = sandbox::Breach::OUTPUT;
  EXPECT_FALSE(StepSucceeded(info));
}

TEST(ResultAssemblerTest, InternalError) {
  proto::ExecutionResult result = InternalErrorResult();
  EXPECT_EQ(result.status(), proto::INTERNAL_ERROR);
  EXPECT_EQ(result.message(), "internal error");
  EXPECT_FALSE(result.has_exit_code());
}

TEST(ResultAssemblerTest, Cancelled) {
  proto::ExecutionResult result = CancelledResult();
  EXPECT_EQ(result.status(), proto::TIMEOUT);
  EXPECT_EQ(result.termination_reason(), proto::CANCELLED);
  EXPECT_EQ(result.wall_time_ms(), 0);
  EXPECT_EQ(result.cpu_time_ms(), 0);
  EXPECT_EQ(result.peak_memory_bytes(), 0);
}

}  // namespace
