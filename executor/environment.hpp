#ifndef EXECUTOR_ENVIRONMENT_HPP
#define EXECUTOR_ENVIRONMENT_HPP

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "absl/types/optional.h"
#include "runtime/runtime_profile.hpp"
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"

namespace executor {

// Private working area of a single job: a scratch directory that is the only
// writable location of the program, the input file and the sandbox running
// the steps of the job. Everything is reclaimed by Teardown.
class ExecutionEnvironment {
 public:
  struct Options {
    std::string temp_directory = "temp";
    bool keep_sandboxes = false;
    // Identity of the programs when the service runs as root.
    int32_t sandbox_uid = 65534;
    int32_t sandbox_gid = 65534;
    // Refuse to run on hosts where only the fallback sandbox is available.
    bool require_isolation = true;
    int32_t poll_interval_millis = 50;
  };

  // Creates the scratch directory, capped at the scratch size of the profile,
  // and the sandbox. Throws if any of them cannot be created. Only the
  // fallback sandbox run without root may leave the directory uncapped.
  static std::unique_ptr<ExecutionEnvironment> Provision(
      const Options& options, const runtime::RuntimeProfile& profile);

  // Writes the source file in the scratch directory and the input of the
  // program.
  void Prepare(const std::string& source_code, const std::string& stdin_data);

  // Runs command with the given limits. Returns false and sets error_msg if
  // the command could not be started.
  bool Run(const std::vector<std::string>& command,
           const runtime::ResourceLimits& limits,
           const std::atomic<bool>* cancelled, sandbox::ExecutionInfo* info,
           std::string* error_msg);

  // Kills every process of the job, releases the sandbox and removes the
  // scratch directory. Idempotent, never throws.
  void Teardown();

  // Path of the scratch directory in this process, which may differ from the
  // one the programs see.
  const std::string& ScratchDir() const { return host_scratch_dir_; }
  bool Isolated() const { return isolated_; }

  ~ExecutionEnvironment() { Teardown(); }
  ExecutionEnvironment(const ExecutionEnvironment&) = delete;
  ExecutionEnvironment& operator=(const ExecutionEnvironment&) = delete;
  ExecutionEnvironment(ExecutionEnvironment&&) = delete;
  ExecutionEnvironment& operator=(ExecutionEnvironment&&) = delete;

 private:
  static const constexpr char* kBoxDir = "box";
  static const constexpr char* kRootDir = "root";
  static const constexpr char* kStdinFile = "stdin";

  ExecutionEnvironment(const Options& options,
                       const runtime::RuntimeProfile& profile);

  Options options_;
  const runtime::RuntimeProfile& profile_;
  absl::optional<util::TempDir> dir_;
  std::string scratch_dir_;
  std::string host_scratch_dir_;
  std::string new_root_;
  std::string stdin_file_;
  std::unique_ptr<sandbox::Sandbox> sandbox_;
  bool isolated_ = false;
  bool torn_down_ = false;
};

}  // namespace executor

#endif
