#include "executor/local_executor.hpp"

#include <dirent.h>
#include <unistd.h>

#include <memory>
#include <thread>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "runtime/registry.hpp"
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"
#include "util/which.hpp"

namespace {

using ::testing::HasSubstr;

using namespace executor;

bool IsEmptyDir(const std::string& path) {
  DIR* dir = opendir(path.c_str());
  if (dir == nullptr) return false;
  bool empty = true;
  while (struct dirent* entry = readdir(dir)) {
    std::string name = entry->d_name;
    if (name != "." && name != "..") empty = false;
  }
  closedir(dir);
  return empty;
}

runtime::ResourceLimits TestLimits() {
  runtime::ResourceLimits limits;
  limits.cpu_time_millis = 2000;
  limits.wall_time_millis = 5000;
  limits.memory_bytes = 64 * 1024 * 1024;
  limits.output_bytes = 64 * 1024;
  limits.scratch_bytes = 1024 * 1024;
  limits.max_processes = 64;
  return limits;
}

runtime::RuntimeProfile ShellProfile() {
  runtime::RuntimeProfile profile;
  profile.language = proto::BASH;
  profile.name = "sh";
  profile.source_name = "main.sh";
  profile.limits = TestLimits();
  profile.recipe =
      runtime::InterpretedRecipe{{"/bin/sh", runtime::kSourcePlaceholder}};
  return profile;
}

// Compiles by copying the source, which is expected to be a script.
runtime::RuntimeProfile CopyCompilerProfile(const std::string& compiler) {
  runtime::RuntimeProfile profile;
  profile.language = proto::C;
  profile.name = "copy";
  profile.source_name = "main.src";
  profile.binary_name = "prog";
  profile.limits = TestLimits();
  profile.recipe = runtime::CompiledRecipe{
      {"/bin/sh", "-c", compiler}, TestLimits(), {"./{binary}"}};
  return profile;
}

class LocalExecutorTest : public ::testing::Test {
 protected:
  LocalExecutorTest() : executor_(EnvOptions(base_.Path())) {}

  static ExecutionEnvironment::Options EnvOptions(const std::string& path) {
    ExecutionEnvironment::Options options;
    options.temp_directory = path;
    options.require_isolation = false;
    options.poll_interval_millis = 10;
    return options;
  }

  proto::ExecutionResult Run(const runtime::RuntimeProfile& profile,
                             const std::string& source,
                             const std::string& stdin_data = "") {
    proto::ExecutionRequest request;
    request.set_language(profile.language);
    request.set_source_code(source);
    request.set_stdin(stdin_data);
    request.set_caller_id("test");
    proto::ExecutionResult result =
        executor_.Execute(request, profile, cancelled_);
    // Every job leaves nothing behind.
    EXPECT_TRUE(IsEmptyDir(base_.Path()));
    return result;
  }

  util::TempDir base_{"/tmp/runbox_testdir"};
  std::atomic<bool> cancelled_{false};
  LocalExecutor executor_;
};

TEST_F(LocalExecutorTest, HelloWorldInEveryLanguage) {
  runtime::RuntimeRegistry registry = runtime::RuntimeRegistry::Create(
      runtime::RuntimeRegistry::Defaults(), proto::RuntimeCatalog());
  for (proto::Language language : registry.Languages()) {
    const runtime::RuntimeProfile& profile = registry.Resolve(language);
    for (const auto& kv : profile.templates) {
      proto::ExecutionResult result = Run(profile, kv.second);
      EXPECT_EQ(result.status(), proto::SUCCESS)
          << profile.name << " " << kv.first << ": " << result.message()
          << " " << result.stderr();
      EXPECT_EQ(result.stdout(), "Hello, World!\n")
          << profile.name << " " << kv.first;
      EXPECT_EQ(result.exit_code(), 0) << profile.name << " " << kv.first;
      EXPECT_EQ(result.language(), language);
    }
  }
}

TEST_F(LocalExecutorTest, Stdin) {
  proto::ExecutionResult result = Run(ShellProfile(), "cat\n", "1 2 3\n");
  EXPECT_EQ(result.status(), proto::SUCCESS);
  EXPECT_EQ(result.stdout(), "1 2 3\n");
  EXPECT_FALSE(result.stdout_truncated());
}

TEST_F(LocalExecutorTest, ScratchIsWritable) {
  proto::ExecutionResult result =
      Run(ShellProfile(), "echo data > out.txt\ncat out.txt\n");
  EXPECT_EQ(result.status(), proto::SUCCESS) << result.stderr();
  EXPECT_EQ(result.stdout(), "data\n");
}

TEST_F(LocalExecutorTest, SystemIsNotWritable) {
  proto::ExecutionResult result = Run(
      ShellProfile(),
      "if (echo x > /usr/runbox_write_test) 2>/dev/null; then echo writable;"
      " else echo denied; fi\n");
  EXPECT_EQ(result.status(), proto::SUCCESS);
  EXPECT_EQ(result.stdout(), "denied\n");
}

TEST_F(LocalExecutorTest, RuntimeError) {
  proto::ExecutionResult result =
      Run(ShellProfile(), "echo failing >&2\nexit 3\n");
  EXPECT_EQ(result.status(), proto::RUNTIME_ERROR);
  EXPECT_TRUE(result.has_exit_code());
  EXPECT_EQ(result.exit_code(), 3);
  EXPECT_EQ(result.stderr(), "failing\n");
}

TEST_F(LocalExecutorTest, WallTimeout) {
  runtime::RuntimeProfile profile = ShellProfile();
  profile.limits.wall_time_millis = 300;
  proto::ExecutionResult result = Run(profile, "sleep 10\n");
  EXPECT_EQ(result.status(), proto::TIMEOUT);
  EXPECT_EQ(result.termination_reason(), proto::WALL_TIME);
  EXPECT_FALSE(result.has_exit_code());
  EXPECT_GE(result.wall_time_ms(), 300);
  EXPECT_LT(result.wall_time_ms(), 2000);
}

TEST_F(LocalExecutorTest, CpuTimeout) {
  runtime::RuntimeProfile profile = ShellProfile();
  profile.limits.cpu_time_millis = 300;
  proto::ExecutionResult result = Run(profile, "while :; do :; done\n");
  EXPECT_EQ(result.status(), proto::TIMEOUT);
  EXPECT_EQ(result.termination_reason(), proto::CPU_TIME);
  EXPECT_GE(result.cpu_time_ms(), 300);
}

TEST_F(LocalExecutorTest, MemoryExceeded) {
  runtime::RuntimeProfile profile = ShellProfile();
  profile.limits.memory_bytes = 32 * 1024 * 1024;
  proto::ExecutionResult result =
      Run(profile, "x=x\nwhile :; do x=\"$x$x\"; done\n");
  EXPECT_EQ(result.status(), proto::MEMORY_EXCEEDED);
  EXPECT_EQ(result.termination_reason(), proto::MEMORY);
  // A cgroup stops the program at the limit itself.
  EXPECT_GT(result.peak_memory_bytes(), 16 * 1024 * 1024);
}

TEST_F(LocalExecutorTest, SingleLargeAllocation) {
  std::string python = util::which("python3");
  if (python.empty()) GTEST_SKIP() << "python3 not installed";
  runtime::RuntimeProfile profile = ShellProfile();
  profile.language = proto::PYTHON;
  profile.source_name = "main.py";
  profile.recipe =
      runtime::InterpretedRecipe{{python, "-S", runtime::kSourcePlaceholder}};
  // Four times the limit, touched by a single call.
  proto::ExecutionResult result =
      Run(profile, "data = b'x' * (256 * 1024 * 1024)\nprint(len(data))\n");
  EXPECT_EQ(result.status(), proto::MEMORY_EXCEEDED) << result.stderr();
  EXPECT_EQ(result.termination_reason(), proto::MEMORY);
  EXPECT_GT(result.peak_memory_bytes(), 32 * 1024 * 1024);
}

TEST_F(LocalExecutorTest, ScratchSizeIsCapped) {
  std::unique_ptr<sandbox::Sandbox> sandbox = sandbox::Sandbox::Create();
  ASSERT_NE(sandbox, nullptr);
  if (!sandbox->Isolated() && geteuid() != 0)
    GTEST_SKIP() << "scratch directories are only capped per file";
  // Every file is below the cap, their total is not.
  proto::ExecutionResult result = Run(
      ShellProfile(),
      "for i in 1 2 3 4 5; do\n"
      "  head -c 400000 /dev/zero > f$i 2>/dev/null || exit 3\n"
      "done\n");
  EXPECT_EQ(result.status(), proto::RUNTIME_ERROR) << result.message();
  EXPECT_EQ(result.exit_code(), 3);
}

TEST_F(LocalExecutorTest, OutputTruncated) {
  runtime::RuntimeProfile profile = ShellProfile();
  profile.limits.output_bytes = 1000;
  proto::ExecutionResult result =
      Run(profile, "while :; do echo 0123456789; done\n");
  EXPECT_EQ(result.status(), proto::OUTPUT_TRUNCATED);
  EXPECT_EQ(result.termination_reason(), proto::OUTPUT);
  EXPECT_EQ(result.stdout().size(), 1000u);
  EXPECT_TRUE(result.stdout_truncated());
}

TEST_F(LocalExecutorTest, CompileAndRun) {
  proto::ExecutionResult result =
      Run(CopyCompilerProfile("cp {source} {binary} && chmod 755 {binary}"),
          "#!/bin/sh\necho compiled\n");
  EXPECT_EQ(result.status(), proto::SUCCESS) << result.message();
  EXPECT_EQ(result.stdout(), "compiled\n");
}

TEST_F(LocalExecutorTest, CompileError) {
  proto::ExecutionResult result =
      Run(CopyCompilerProfile("echo 'main.src:1: syntax error' >&2; exit 1"),
          "whatever");
  EXPECT_EQ(result.status(), proto::COMPILE_ERROR);
  EXPECT_THAT(result.stderr(), HasSubstr("syntax error"));
  EXPECT_EQ(result.stdout(), "");
}

TEST_F(LocalExecutorTest, CompileErrorInC) {
  runtime::RuntimeRegistry registry = runtime::RuntimeRegistry::Create(
      runtime::RuntimeRegistry::Defaults(), proto::RuntimeCatalog());
  if (!registry.Supports(proto::C)) GTEST_SKIP() << "no C compiler";
  proto::ExecutionResult result =
      Run(registry.Resolve(proto::C), "int main() { return x; }\n");
  EXPECT_EQ(result.status(), proto::COMPILE_ERROR);
  EXPECT_THAT(result.stderr(), HasSubstr("error"));
}

TEST_F(LocalExecutorTest, Cancelled) {
  std::thread canceller([this]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    cancelled_ = true;
  });
  proto::ExecutionResult result = Run(ShellProfile(), "sleep 10\n");
  canceller.join();
  EXPECT_EQ(result.status(), proto::TIMEOUT);
  EXPECT_EQ(result.termination_reason(), proto::CANCELLED);
}

TEST_F(LocalExecutorTest, InternalError) {
  runtime::RuntimeProfile profile = ShellProfile();
  profile.recipe = runtime::InterpretedRecipe{{"/nonexistent/interpreter"}};
  proto::ExecutionResult result = Run(profile, "echo hi\n");
  EXPECT_EQ(result.status(), proto::INTERNAL_ERROR);
  EXPECT_EQ(result.message(), "internal error");
  EXPECT_EQ(result.language(), proto::BASH);
}

}  // namespace
