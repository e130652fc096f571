#include "sandbox/process_tree.hpp"

#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cstdio>

#include "absl/strings/numbers.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "glog/logging.h"

namespace sandbox {
namespace {

bool ReadProcFile(const std::string& path, std::string* content) {
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

bool ReadStat(pid_t pid, ProcStat* stat) {
  std::string content;
  if (!ReadProcFile("/proc/" + std::to_string(pid) + "/stat", &content))
    return false;
  return ParseProcStat(content, stat);
}

ino_t NamespaceInode(const std::string& path) {
  struct stat st;
  if (stat(path.c_str(), &st) == -1) return 0;
  return st.st_ino;
}

ino_t PidNamespace(pid_t pid) {
  return NamespaceInode("/proc/" + std::to_string(pid) + "/ns/pid");
}

std::vector<pid_t> AllPids() {
  std::vector<pid_t> pids;
  DIR* dir = opendir("/proc");
  if (dir == nullptr) {
    PLOG(ERROR) << "opendir /proc";
    return pids;
  }
  while (struct dirent* entry = readdir(dir)) {
    int pid = 0;
    if (absl::SimpleAtoi(entry->d_name, &pid) && pid > 0) pids.push_back(pid);
  }
  closedir(dir);
  return pids;
}

}  // namespace

bool ParseProcStat(const std::string& content, ProcStat* stat) {
  // The command name is enclosed in parentheses and may contain anything,
  // including spaces and parentheses.
  size_t open_paren = content.find('(');
  size_t close_paren = content.rfind(')');
  if (open_paren == std::string::npos || close_paren == std::string::npos ||
      close_paren < open_paren) {
    return false;
  }
  if (!absl::SimpleAtoi(
          absl::string_view(content.data(), open_paren), &stat->pid)) {
    return false;
  }
  std::vector<absl::string_view> fields =
      absl::StrSplit(absl::string_view(content).substr(close_paren + 1), ' ',
                     absl::SkipWhitespace());
  // Field indices are relative to the state, which is the third field of the
  // file.
  if (fields.size() < 22 || fields[0].size() != 1) return false;
  stat->state = fields[0][0];
  return absl::SimpleAtoi(fields[1], &stat->ppid) &&
         absl::SimpleAtoi(fields[3], &stat->session) &&
         absl::SimpleAtoi(fields[11], &stat->utime) &&
         absl::SimpleAtoi(fields[12], &stat->stime) &&
         absl::SimpleAtoi(fields[13], &stat->cutime) &&
         absl::SimpleAtoi(fields[14], &stat->cstime) &&
         absl::SimpleAtoi(fields[21], &stat->rss);
}

ProcessTree::ProcessTree(pid_t root, Membership membership)
    : root_(root), membership_(membership) {}

ino_t ProcessTree::MemberNamespace() const {
  if (pid_namespace_ != 0) return pid_namespace_;
  static const ino_t own = NamespaceInode("/proc/self/ns/pid");
  ino_t ns = NamespaceInode("/proc/" + std::to_string(root_) +
                            "/ns/pid_for_children");
  // Until the root unshares, its children would share our own namespace.
  if (ns != 0 && ns != own) pid_namespace_ = ns;
  return pid_namespace_;
}

bool ProcessTree::IsMember(const ProcStat& stat) const {
  if (stat.pid == root_) return true;
  switch (membership_) {
    case Membership::SESSION:
      return stat.session == root_;
    case Membership::PID_NAMESPACE: {
      ino_t ns = MemberNamespace();
      return ns != 0 && PidNamespace(stat.pid) == ns;
    }
  }
  return false;
}

std::vector<pid_t> ProcessTree::Members() const {
  std::vector<pid_t> members;
  for (pid_t pid : AllPids()) {
    ProcStat stat;
    // The process may have exited in the meantime.
    if (!ReadStat(pid, &stat)) continue;
    if (IsMember(stat)) members.push_back(pid);
  }
  return members;
}

TreeUsage ProcessTree::Sample() const {
  static const int64_t ticks_per_second = sysconf(_SC_CLK_TCK);
  static const int64_t page_size = sysconf(_SC_PAGESIZE);
  TreeUsage usage;
  int64_t user_ticks = 0;
  int64_t system_ticks = 0;
  for (pid_t pid : AllPids()) {
    ProcStat stat;
    if (!ReadStat(pid, &stat) || !IsMember(stat)) continue;
    // Reaped children are no longer members, so their time is only visible
    // in the counters of the member that waited for them.
    user_ticks += stat.utime + stat.cutime;
    system_ticks += stat.stime + stat.cstime;
    if (stat.state != 'Z') {
      usage.rss_bytes += stat.rss * page_size;
      usage.processes++;
    }
  }
  usage.user_millis = user_ticks * 1000 / ticks_per_second;
  usage.system_millis = system_ticks * 1000 / ticks_per_second;
  return usage;
}

int ProcessTree::KillAll() const {
  int killed = 0;
  for (pid_t pid : Members()) {
    if (kill(pid, SIGKILL) == 0) {
      killed++;
    } else if (errno != ESRCH) {
      PLOG(WARNING) << "kill " << pid;
    }
  }
  return killed;
}

}  // namespace sandbox
