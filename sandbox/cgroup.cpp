#include "sandbox/cgroup.hpp"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <atomic>
#include <vector>

#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"
#include "glog/logging.h"

namespace sandbox {
namespace {

const char* const kCgroupRoot = "/sys/fs/cgroup";
// Cgroup the processes of the service are moved to, since a cgroup that
// enables controllers for its children cannot have processes of its own.
const char* const kServiceGroup = "service";
const constexpr int kRemoveAttempts = 100;
const constexpr useconds_t kRemoveDelayMicros = 10 * 1000;

bool ReadControl(const std::string& path, std::string* content) {
  int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd == -1) return false;
  char buf[4096];
  content->clear();
  ssize_t cur = 0;
  do {
    cur = read(fd, buf, sizeof(buf));
    if (cur < 0) {
      if (errno == EINTR) continue;
      close(fd);
      return false;
    }
    content->append(buf, cur);
  } while (cur > 0);
  close(fd);
  return true;
}

// Leaves errno set on failure.
bool WriteControl(const std::string& path, const std::string& value) {
  int fd = open(path.c_str(), O_WRONLY | O_CLOEXEC);
  if (fd == -1) return false;
  ssize_t written = write(fd, value.data(), value.size());
  int err = errno;
  close(fd);
  errno = err;
  return written == static_cast<ssize_t>(value.size());
}

bool HasToken(const std::string& content, absl::string_view token) {
  for (absl::string_view word :
       absl::StrSplit(content, absl::ByAnyChar(" \n"), absl::SkipEmpty())) {
    if (word == token) return true;
  }
  return false;
}

// Reads "key value" lines, the format of the flat keyed cgroup files.
bool ReadKey(const std::string& content, absl::string_view key,
             int64_t* value) {
  for (absl::string_view line :
       absl::StrSplit(content, '\n', absl::SkipEmpty())) {
    std::vector<absl::string_view> fields =
        absl::StrSplit(line, ' ', absl::SkipEmpty());
    if (fields.size() == 2 && fields[0] == key)
      return absl::SimpleAtoi(fields[1], value);
  }
  return false;
}

// Moves every process of the cgroup at from into the cgroup at to.
bool MoveProcesses(const std::string& from, const std::string& to) {
  // Processes may fork while being moved.
  for (int round = 0; round < 16; round++) {
    std::string procs;
    if (!ReadControl(from + "/cgroup.procs", &procs)) {
      PLOG(INFO) << "Cannot read " << from << "/cgroup.procs";
      return false;
    }
    if (procs.empty()) return true;
    for (absl::string_view pid :
         absl::StrSplit(procs, '\n', absl::SkipEmpty())) {
      if (!WriteControl(to + "/cgroup.procs", std::string(pid)) &&
          errno != ESRCH) {
        PLOG(INFO) << "Cannot move process " << pid << " to " << to;
        return false;
      }
    }
  }
  return false;
}

// Checks that a new process can be moved into the group, which also requires
// write access to the common ancestor of the two groups.
bool CanJoin(const Cgroup& cgroup) {
  pid_t pid = fork();
  if (pid == -1) {
    PLOG(INFO) << "fork";
    return false;
  }
  if (pid == 0) _exit(write(cgroup.ProcsFd(), "0", 1) == 1 ? 0 : 1);
  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      PLOG(INFO) << "waitpid";
      return false;
    }
  }
  return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

// Returns the cgroup under which the groups of the executions are created,
// or an empty string if the service cannot use cgroups.
std::string SetupParent() {
  std::string self;
  if (!ReadControl("/proc/self/cgroup", &self)) {
    PLOG(INFO) << "Cannot read /proc/self/cgroup";
    return "";
  }
  // Only the unified hierarchy is supported.
  std::string path;
  for (absl::string_view line :
       absl::StrSplit(self, '\n', absl::SkipEmpty())) {
    if (absl::StartsWith(line, "0::")) path = std::string(line.substr(3));
  }
  if (path.empty()) {
    LOG(INFO) << "No cgroup v2 hierarchy";
    return "";
  }
  std::string parent = kCgroupRoot;
  if (path != "/") parent += path;
  std::string controllers;
  if (!ReadControl(parent + "/cgroup.controllers", &controllers) ||
      !HasToken(controllers, "memory")) {
    LOG(INFO) << "The memory controller is not available in " << parent;
    return "";
  }
  if (access((parent + "/cgroup.subtree_control").c_str(), W_OK) == -1 ||
      access((parent + "/cgroup.procs").c_str(), W_OK) == -1) {
    LOG(INFO) << "Cgroup " << parent << " is not delegated to this user";
    return "";
  }
  std::string subtree;
  if (!ReadControl(parent + "/cgroup.subtree_control", &subtree)) {
    PLOG(INFO) << "Cannot read " << parent << "/cgroup.subtree_control";
    return "";
  }
  if (!HasToken(subtree, "memory")) {
    // The root of the hierarchy is the only cgroup without a type, and the
    // only one allowed to have both processes and controllers.
    struct stat st;
    if (stat((parent + "/cgroup.type").c_str(), &st) == 0) {
      std::string service = absl::StrCat(parent, "/", kServiceGroup);
      if (mkdir(service.c_str(), 0755) == -1 && errno != EEXIST) {
        PLOG(INFO) << "mkdir " << service;
        return "";
      }
      if (!MoveProcesses(parent, service)) return "";
    }
    if (!WriteControl(parent + "/cgroup.subtree_control", "+memory")) {
      PLOG(INFO) << "Cannot enable the memory controller in " << parent;
      return "";
    }
  }
  return parent;
}

const std::string& Parent() {
  static const std::string* parent = new std::string(SetupParent());
  return *parent;
}

}  // namespace

bool ParseCpuStat(const std::string& content, CgroupUsage* usage) {
  int64_t user_usec = 0;
  int64_t system_usec = 0;
  if (!ReadKey(content, "user_usec", &user_usec) ||
      !ReadKey(content, "system_usec", &system_usec)) {
    return false;
  }
  usage->user_millis = user_usec / 1000;
  usage->system_millis = system_usec / 1000;
  return true;
}

bool ParseMemoryEvents(const std::string& content, CgroupUsage* usage) {
  return ReadKey(content, "oom_kill", &usage->oom_kills);
}

// static
bool Cgroup::Available() {
  static const bool available = [] {
    if (Parent().empty()) return false;
    std::unique_ptr<Cgroup> cgroup = Create(0);
    if (cgroup == nullptr || !CanJoin(*cgroup)) {
      LOG(INFO) << "Processes cannot be moved to the cgroups in " << Parent();
      return false;
    }
    LOG(INFO) << "Executions are confined in cgroups under " << Parent();
    return true;
  }();
  return available;
}

// static
std::unique_ptr<Cgroup> Cgroup::Create(int64_t memory_limit_bytes) {
  const std::string& parent = Parent();
  if (parent.empty()) return nullptr;
  static std::atomic<int64_t> next_id{0};
  std::string path = absl::StrCat(parent, "/runbox-", getpid(), "-", next_id++);
  if (mkdir(path.c_str(), 0755) == -1) {
    PLOG(WARNING) << "mkdir " << path;
    return nullptr;
  }
  std::unique_ptr<Cgroup> cgroup(new Cgroup(path));
  if (memory_limit_bytes > 0) {
    if (!WriteControl(path + "/memory.max",
                      std::to_string(memory_limit_bytes))) {
      PLOG(WARNING) << "Cannot limit the memory of " << path;
      return nullptr;
    }
    // Swap would let the group exceed the limit unnoticed. The file is
    // missing when swap is not accounted.
    if (!WriteControl(path + "/memory.swap.max", "0") && errno != ENOENT) {
      PLOG(WARNING) << "Cannot disable the swap of " << path;
      return nullptr;
    }
    // The program is killed as a whole instead of losing a random process.
    if (!WriteControl(path + "/memory.oom.group", "1") && errno != ENOENT) {
      PLOG(WARNING) << "Cannot set memory.oom.group of " << path;
    }
  }
  cgroup->procs_fd_ =
      open((path + "/cgroup.procs").c_str(), O_WRONLY | O_CLOEXEC);
  if (cgroup->procs_fd_ == -1) {
    PLOG(WARNING) << "open " << path << "/cgroup.procs";
    return nullptr;
  }
  return cgroup;
}

bool Cgroup::Usage(CgroupUsage* usage) const {
  std::string content;
  if (!ReadControl(path_ + "/cpu.stat", &content) ||
      !ParseCpuStat(content, usage)) {
    return false;
  }
  if (!ReadControl(path_ + "/memory.events", &content) ||
      !ParseMemoryEvents(content, usage)) {
    return false;
  }
  if (ReadControl(path_ + "/memory.peak", &content) &&
      !absl::SimpleAtoi(absl::StripAsciiWhitespace(content),
                        &usage->peak_memory_bytes)) {
    return false;
  }
  return true;
}

void Cgroup::Kill() const {
  if (!WriteControl(path_ + "/cgroup.kill", "1") && errno != ENOENT)
    PLOG(WARNING) << "Cannot kill the members of " << path_;
}

Cgroup::~Cgroup() {
  if (procs_fd_ != -1) close(procs_fd_);
  for (int attempt = 0; attempt < kRemoveAttempts; attempt++) {
    if (rmdir(path_.c_str()) == 0) return;
    if (errno != EBUSY) break;
    usleep(kRemoveDelayMicros);
  }
  PLOG(WARNING) << "rmdir " << path_;
}

}  // namespace sandbox
