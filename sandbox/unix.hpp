#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP

#include <memory>
#include <string>

#include "absl/synchronization/mutex.h"
#include "sandbox/cgroup.hpp"
#include "sandbox/limiter.hpp"
#include "sandbox/process_tree.hpp"
#include "sandbox/sandbox.hpp"

namespace sandbox {

// Base class for sandboxes for UNIX-like systems. On its own, it runs the
// program in a new session, in the scratch directory, with resource limits
// and possibly as a different user, but shares the filesystem, the network
// and the process table with the host.
class Unix : public Sandbox {
 public:
  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg) override;
  void Terminate() override;
  bool Isolated() const override { return false; }
  bool LimitDirectory(const std::string& dir, int64_t size_bytes, int32_t uid,
                      int32_t gid, std::string* host_dir,
                      std::string* error_msg) override;
  const char* Name() const override { return StaticName(); }
  ~Unix() override;

  static Sandbox* Create() { return new Unix(); }
  static int Score() { return 1; }
  static const char* StaticName() { return "unix"; }

 protected:
  Unix() = default;

  // Executed before creating the child process. Returns false and sets
  // error_msg if setup fails.
  bool Setup(std::string* error_msg);

  // Hook that is executed at the end of Setup.
  virtual bool OnSetup(std::string* error_msg) { return true; }

  // Creates a child process and saves its PID in child_pid_. The child process
  // should execute Child and must not return.
  virtual bool DoFork(std::string* error_msg);

  // Function that is executed in the child process.
  [[noreturn]] void Child();

  // The following hooks run in the child process, in this order. They return
  // false if something went wrong and exec should not be called. The
  // error_msg string must not be longer than buflen characters. They must not
  // use dynamic memory allocation.

  // Moves the process into the directory the program runs in.
  virtual bool OnEnterRoot(char* error_msg, size_t buflen);
  // May create the process that will exec the program; returns only in it.
  virtual bool OnSpawn(char* error_msg, size_t buflen) { return true; }
  // Executed just before exec, after resource limits are applied.
  virtual bool OnChild(char* error_msg, size_t buflen);

  // Waits for the termination of the child, killing it if it exceeds one of
  // the limits, and collects its output.
  bool Wait(ExecutionInfo* info, std::string* error_msg);

  // Which processes belong to the program.
  virtual ProcessTree::Membership TreeMembership() const {
    return ProcessTree::Membership::SESSION;
  }

  // Kills every process of the program. Called with mutex_ held while the
  // child has not been reaped yet.
  virtual void KillTree();

  // Kills the members of the cgroup of the execution, then calls KillTree.
  void KillAll();

  // Translates the wait status of the child into the one of the program.
  // Returns false if the program did not report its status.
  virtual bool ProgramStatus(int child_status, int* program_status) {
    *program_status = child_status;
    return true;
  }

  // Executed when the child program exits. May change the execution info with
  // "better" values, or perform clean up.
  virtual void OnFinish(ExecutionInfo* info) {}

  // Closes the descriptors created by Setup.
  virtual void CloseFds();

  static void CloseFd(int* fd);

  // Appends prefix and the description of errno to error_msg, and returns
  // false. Safe to call in the child process.
  static bool ChildError(char* error_msg, size_t buflen, const char* prefix);

  int pipe_fds_[2] = {-1, -1};
  int stdout_fds_[2] = {-1, -1};
  int stderr_fds_[2] = {-1, -1};
  // Whether RLIMIT_NPROC can be applied, since it counts the processes of the
  // whole user.
  bool limit_processes_ = false;
  const ExecutionOptions* options_ = nullptr;
  // Descriptor of cgroup.procs of the cgroup of the execution, or -1.
  int cgroup_procs_fd_ = -1;
  // Size-capped directory mounted by LimitDirectory.
  std::string limited_dir_;

  absl::Mutex mutex_;
  int child_pid_ GUARDED_BY(mutex_) = 0;
  std::unique_ptr<Cgroup> cgroup_ GUARDED_BY(mutex_);
};

}  // namespace sandbox
#endif
