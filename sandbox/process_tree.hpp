#ifndef SANDBOX_PROCESS_TREE_HPP
#define SANDBOX_PROCESS_TREE_HPP

#include <sys/types.h>

#include <cstdint>
#include <string>
#include <vector>

namespace sandbox {

// Fields of /proc/<pid>/stat used by the sandbox.
struct ProcStat {
  pid_t pid = 0;
  char state = 0;
  pid_t ppid = 0;
  pid_t session = 0;
  // In clock ticks.
  int64_t utime = 0;
  int64_t stime = 0;
  int64_t cutime = 0;
  int64_t cstime = 0;
  // In pages.
  int64_t rss = 0;
};

// Parses the content of a /proc/<pid>/stat file. Returns false if the content
// is malformed.
bool ParseProcStat(const std::string& content, ProcStat* stat);

// Aggregated usage of a tree: CPU time of the live processes and of the
// children they reaped, resident memory of the live ones.
struct TreeUsage {
  int64_t user_millis = 0;
  int64_t system_millis = 0;
  int64_t rss_bytes = 0;
  int32_t processes = 0;

  int64_t cpu_millis() const { return user_millis + system_millis; }
};

// All the processes started by a sandboxed program. Members are found by
// scanning /proc, so processes that were reparented after their parent died
// are still accounted for.
class ProcessTree {
 public:
  enum class Membership {
    // Processes in the session led by the root.
    SESSION,
    // The root and the processes in the pid namespace it created for its
    // children, once it has created one.
    PID_NAMESPACE
  };

  ProcessTree(pid_t root, Membership membership);

  std::vector<pid_t> Members() const;
  TreeUsage Sample() const;
  // Sends SIGKILL to every member. Returns the number of processes signalled.
  int KillAll() const;

 private:
  bool IsMember(const ProcStat& stat) const;
  // Resolves the pid namespace of the members. Returns 0 while the root has
  // not created it yet.
  ino_t MemberNamespace() const;

  pid_t root_;
  Membership membership_;
  mutable ino_t pid_namespace_ = 0;
};

}  // namespace sandbox

#endif
