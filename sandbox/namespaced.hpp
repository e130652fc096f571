#ifndef SANDBOX_NAMESPACED_HPP
#define SANDBOX_NAMESPACED_HPP

#include <string>
#include <vector>

#include "sandbox/unix.hpp"

namespace sandbox {

// Linux sandbox that runs the program in new mount, pid, network, ipc and uts
// namespaces. The program sees a read-only root containing the system
// directories, a few devices and its scratch directory mounted at /sandbox,
// and has no network interface other than a down loopback.
//
// When not running as root, every execution of a sandbox object enters the
// same user namespace, created with the sandbox. The service is root in it,
// and the program runs as nobody, which is a subordinate id of the service
// user when /etc/subuid and /etc/subgid grant one. A size-capped scratch
// directory lives in a mount namespace of the sandbox, so it needs no
// privilege on the host.
//
// The child of the service only relays the termination of the init of the
// pid namespace: killing it kills the init, and with it every process the
// program created.
class Namespaced : public Unix {
 public:
  bool Isolated() const override { return true; }
  bool LimitDirectory(const std::string& dir, int64_t size_bytes, int32_t uid,
                      int32_t gid, std::string* host_dir,
                      std::string* error_msg) override;
  const char* Name() const override { return StaticName(); }
  ~Namespaced() override;

  static Sandbox* Create() { return new Namespaced(); }
  static int Score();
  static const char* StaticName() { return "namespaced"; }

  // Path of the scratch directory as seen by the program.
  static const char* const kSandboxDir;

 protected:
  Namespaced() = default;

  bool OnSetup(std::string* error_msg) override;
  bool DoFork(std::string* error_msg) override;
  bool OnEnterRoot(char* error_msg, size_t buflen) override;
  bool OnSpawn(char* error_msg, size_t buflen) override;
  bool OnChild(char* error_msg, size_t buflen) override;
  ProcessTree::Membership TreeMembership() const override {
    return ProcessTree::Membership::PID_NAMESPACE;
  }
  void KillTree() override;
  bool ProgramStatus(int child_status, int* program_status) override;
  void CloseFds() override;

 private:
  struct MountPoint {
    enum Kind { DIRECTORY, EMPTY_DIR, FILE, SYMLINK, PROC };
    Kind kind;
    std::string source;
    // Absolute path under the new root.
    std::string target;
    // Flags of the remount; some are locked by the original mount.
    unsigned long flags;
  };

  // Creates the user (when not root) and mount namespaces shared by the
  // executions, with a tmpfs of at most size_bytes mounted on dir in the
  // latter when dir is not empty.
  bool CreateNamespaces(const std::string& dir, int64_t size_bytes,
                        int32_t uid, int32_t gid, std::string* error_msg);

  bool WriteIdMaps(pid_t pid, std::string* error_msg);

  // Waits for the init and exits, so that it can be killed by killing the
  // child of the service.
  [[noreturn]] void Relay(pid_t init, int lifeline);

  // Runs as pid 1 of the namespace: reaps every process and reports the wait
  // status of the program.
  [[noreturn]] void Init(pid_t program);

  std::vector<MountPoint> mounts_;
  // Namespaces of the sandbox. The user namespace is -1 when running as root.
  int user_ns_fd_ = -1;
  int mount_ns_fd_ = -1;
  // The size-capped directory, as mounted in the namespace.
  int limited_dir_fd_ = -1;
  // Whether programs run as a subordinate id of the service user.
  bool subordinate_ids_ = false;
  // Carries the wait status of the program from the init.
  int status_fds_[2] = {-1, -1};
};

}  // namespace sandbox
#endif
