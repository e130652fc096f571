#include "executor/environment.hpp"

#include <errno.h>
#include <limits.h>
#include <sys/stat.h>
#include <unistd.h>

#include <system_error>

#include "absl/memory/memory.h"
#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "sandbox/namespaced.hpp"

namespace executor {

namespace {
const char* const kPath = "PATH=/usr/local/bin:/usr/bin:/bin";

// Sandboxes may resolve paths after changing their root.
std::string AbsolutePath(const std::string& path) {
  if (!path.empty() && path[0] == '/') return path;
  char cwd[PATH_MAX];
  if (getcwd(cwd, sizeof(cwd)) == nullptr)
    throw std::system_error(errno, std::system_category(), "getcwd");
  return util::File::JoinPath(cwd, path);
}
}  // namespace

ExecutionEnvironment::ExecutionEnvironment(
    const Options& options, const runtime::RuntimeProfile& profile)
    : options_(options), profile_(profile) {}

// static
std::unique_ptr<ExecutionEnvironment> ExecutionEnvironment::Provision(
    const Options& options, const runtime::RuntimeProfile& profile) {
  // The constructor is private, so make_unique cannot be used.
  std::unique_ptr<ExecutionEnvironment> env(
      new ExecutionEnvironment(options, profile));
  env->sandbox_ = sandbox::Sandbox::Create();
  if (!env->sandbox_) throw std::runtime_error("No sandbox available");
  env->isolated_ = env->sandbox_->Isolated();
  if (options.require_isolation && !env->isolated_) {
    throw std::runtime_error(absl::StrCat(
        "Sandbox ", env->sandbox_->Name(),
        " does not isolate programs, refusing to run"));
  }

  env->dir_.emplace(options.temp_directory);
  const std::string path = AbsolutePath(env->dir_->Path());
  env->scratch_dir_ = util::File::JoinPath(path, kBoxDir);
  env->host_scratch_dir_ = env->scratch_dir_;
  env->new_root_ = util::File::JoinPath(path, kRootDir);
  env->stdin_file_ = util::File::JoinPath(path, kStdinFile);
  util::File::MakeDirs(env->scratch_dir_);
  util::File::MakeDirs(env->new_root_);
  if (chmod(path.c_str(), 0711) == -1) {
    throw std::system_error(errno, std::system_category(), "chmod " + path);
  }

  int32_t uid = -1;
  int32_t gid = -1;
  if (geteuid() == 0) {
    uid = options.sandbox_uid;
    gid = options.sandbox_gid;
  }
  std::string error_msg;
  if (!env->sandbox_->LimitDirectory(env->scratch_dir_,
                                     profile.limits.scratch_bytes, uid, gid,
                                     &env->host_scratch_dir_, &error_msg)) {
    if (env->isolated_ || geteuid() == 0) {
      throw std::runtime_error(
          absl::StrCat("Cannot cap ", env->scratch_dir_, ": ", error_msg));
    }
    // Writes are then only limited per file, by RLIMIT_FSIZE.
    LOG_FIRST_N(WARNING, 1) << "Scratch directories are not capped: "
                            << error_msg;
  }
  VLOG(1) << "Provisioned " << path << " with sandbox "
          << env->sandbox_->Name();
  return env;
}

void ExecutionEnvironment::Prepare(const std::string& source_code,
                                   const std::string& stdin_data) {
  std::string source =
      util::File::JoinPath(host_scratch_dir_, profile_.source_name);
  util::File::Write(source, source_code, /*overwrite=*/true);
  util::File::Write(stdin_file_, stdin_data, /*overwrite=*/true);
  // The program may run as another user.
  if (chmod(source.c_str(), 0644) == -1 ||
      chmod(stdin_file_.c_str(), 0644) == -1) {
    throw std::system_error(errno, std::system_category(), "chmod");
  }
  if (geteuid() == 0 &&
      chown(source.c_str(), options_.sandbox_uid, options_.sandbox_gid) ==
          -1) {
    throw std::system_error(errno, std::system_category(), "chown " + source);
  }
}

bool ExecutionEnvironment::Run(const std::vector<std::string>& command,
                               const runtime::ResourceLimits& limits,
                               const std::atomic<bool>* cancelled,
                               sandbox::ExecutionInfo* info,
                               std::string* error_msg) {
  if (torn_down_) {
    *error_msg = "Environment already torn down";
    return false;
  }
  if (command.empty()) {
    *error_msg = "Empty command";
    return false;
  }
  auto options =
      absl::make_unique<sandbox::ExecutionOptions>(scratch_dir_, command[0]);
  options->SetArgs(std::vector<std::string>(command.begin() + 1,
                                            command.end()));
  const std::string home = isolated_
                               ? sandbox::Namespaced::kSandboxDir
                               : scratch_dir_;
  options->SetEnv(std::vector<std::string>{
      kPath, "HOME=" + home, "TMPDIR=" + home, "LANG=C.UTF-8"});
  sandbox::ExecutionOptions::stringcpy(options->new_root, new_root_);
  sandbox::ExecutionOptions::stringcpy(options->stdin_file, stdin_file_);

  options->cpu_limit_millis = limits.cpu_time_millis;
  options->wall_limit_millis = limits.wall_time_millis;
  options->memory_limit_bytes = limits.memory_bytes;
  options->output_limit_bytes = limits.output_bytes;
  options->max_file_size_bytes = limits.scratch_bytes;
  options->max_procs = limits.max_processes;
  options->poll_interval_millis = options_.poll_interval_millis;
  options->cancelled = cancelled;
  if (geteuid() == 0) {
    options->uid = options_.sandbox_uid;
    options->gid = options_.sandbox_gid;
  }

  VLOG(1) << "Running " << command[0] << " in " << scratch_dir_;
  return sandbox_->Execute(*options, info, error_msg);
}

void ExecutionEnvironment::Teardown() {
  if (torn_down_) return;
  torn_down_ = true;
  if (sandbox_) sandbox_->Terminate();
  // Releases the capped scratch directory.
  sandbox_.reset();
  if (!dir_) return;
  if (options_.keep_sandboxes) {
    LOG(INFO) << "Keeping sandbox in " << dir_->Path();
    dir_->Keep();
  }
  // The destructor of TempDir removes the tree, logging failures.
  dir_.reset();
}

}  // namespace executor
