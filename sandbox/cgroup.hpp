#ifndef SANDBOX_CGROUP_HPP
#define SANDBOX_CGROUP_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace sandbox {

// Counters of a cgroup, from cpu.stat, memory.events and memory.peak.
struct CgroupUsage {
  int64_t user_millis = 0;
  int64_t system_millis = 0;
  // Processes killed because the group reached memory.max.
  int64_t oom_kills = 0;
  // Highest memory usage of the group, page cache included. Zero on kernels
  // without memory.peak.
  int64_t peak_memory_bytes = 0;
};

// Parse the content of cpu.stat and memory.events into usage. Return false if
// a field they must contain is missing.
bool ParseCpuStat(const std::string& content, CgroupUsage* usage);
bool ParseMemoryEvents(const std::string& content, CgroupUsage* usage);

// A cgroup v2 created for a single execution, as a child of the cgroup the
// service runs in. Every process created by a member of the group is a member
// too, so the group accounts the CPU time of processes that were already
// reaped and caps the memory of all of them together.
class Cgroup {
 public:
  // Creates a group whose members may use at most memory_limit_bytes
  // (unlimited if zero). Returns nullptr if the service cannot create groups
  // with the memory controller.
  static std::unique_ptr<Cgroup> Create(int64_t memory_limit_bytes);

  // Whether Create can succeed. Checked once per process.
  static bool Available();

  // Descriptor of the cgroup.procs file of the group, open for writing. A
  // process joins the group by writing "0" to it.
  int ProcsFd() const { return procs_fd_; }

  // Reads the counters of the group. Returns false if they are unavailable.
  bool Usage(CgroupUsage* usage) const;

  // Kills every member of the group. Does nothing on kernels without
  // cgroup.kill.
  void Kill() const;

  // Removes the group, waiting briefly for its last members to be reaped.
  ~Cgroup();

  Cgroup(const Cgroup&) = delete;
  Cgroup& operator=(const Cgroup&) = delete;

 private:
  explicit Cgroup(std::string path) : path_(std::move(path)) {}

  std::string path_;
  int procs_fd_ = -1;
};

}  // namespace sandbox

#endif
