#include "sandbox/namespaced.hpp"

#include <errno.h>
#include <fcntl.h>
#include <grp.h>
#include <limits.h>
#include <pwd.h>
#include <sched.h>
#include <signal.h>
#include <string.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <exception>
#include <vector>

#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "sandbox/id_map.hpp"
#include "util/file.hpp"
#include "util/which.hpp"

namespace sandbox {
namespace {

// Identity of the program inside the user namespace.
const constexpr int32_t kNobody = 65534;

const char* const kSystemDirs[] = {"/bin",   "/sbin",   "/lib", "/lib32",
                                   "/lib64", "/libx32", "/usr", "/etc"};
const char* const kDevices[] = {"/dev/null", "/dev/zero", "/dev/random",
                                "/dev/urandom"};

int NamespaceFlags() {
  int flags = CLONE_NEWNS | CLONE_NEWPID | CLONE_NEWNET | CLONE_NEWIPC |
              CLONE_NEWUTS;
  if (geteuid() != 0) flags |= CLONE_NEWUSER;
  return flags;
}

unsigned long MountFlags(const struct statvfs& st) {
  unsigned long flags = 0;
  if (st.f_flag & ST_NOSUID) flags |= MS_NOSUID;
  if (st.f_flag & ST_NODEV) flags |= MS_NODEV;
  if (st.f_flag & ST_NOEXEC) flags |= MS_NOEXEC;
  if (st.f_flag & ST_NOATIME) flags |= MS_NOATIME;
  if (st.f_flag & ST_NODIRATIME) flags |= MS_NODIRATIME;
  if (st.f_flag & ST_RELATIME) flags |= MS_RELATIME;
  return flags;
}

// Flags of the mount containing path that a bind remount must preserve, since
// unprivileged users are not allowed to clear them.
unsigned long LockedFlags(const char* path) {
  struct statvfs st;
  if (statvfs(path, &st) == -1) return 0;
  return MountFlags(st);
}

unsigned long LockedFlags(int fd) {
  struct statvfs st;
  if (fstatvfs(fd, &st) == -1) return 0;
  return MountFlags(st);
}

int CheckNamespaces() {
  long pid = syscall(SYS_clone, NamespaceFlags() | SIGCHLD, nullptr, nullptr,
                     nullptr, nullptr);
  if (pid == -1) {
    PLOG(INFO) << "Namespaces are not available";
    return -1;
  }
  if (pid == 0) {
    bool ok = mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) == 0 &&
              mount("tmpfs", "/", "tmpfs", 0, "size=16k") == 0;
    _exit(ok ? 0 : 1);
  }
  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno == EINTR) continue;
    PLOG(ERROR) << "waitpid";
    return -1;
  }
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    LOG(INFO) << "Mounts are not allowed in a new namespace";
    return -1;
  }
  return 3;
}

// Ids granted to the service user in /etc/subuid and /etc/subgid, and the
// setuid helpers that map them.
struct SubordinateIds {
  bool usable = false;
  int64_t uid = 0;
  int64_t gid = 0;
  std::string newuidmap;
  std::string newgidmap;
};

SubordinateIds FindSubordinateIds() {
  SubordinateIds ids;
  struct passwd pwd;
  struct passwd* found = nullptr;
  char buf[4096];
  if (getpwuid_r(geteuid(), &pwd, buf, sizeof(buf), &found) != 0 ||
      found == nullptr) {
    return ids;
  }
  const std::string user = pwd.pw_name;
  try {
    absl::optional<IdRange> uids = FindSubordinateRange(
        util::File::Read("/etc/subuid"), user, geteuid());
    absl::optional<IdRange> gids = FindSubordinateRange(
        util::File::Read("/etc/subgid"), user, geteuid());
    if (!uids.has_value() || !gids.has_value()) return ids;
    ids.newuidmap = util::which("newuidmap");
    ids.newgidmap = util::which("newgidmap");
    if (ids.newuidmap.empty() || ids.newgidmap.empty()) return ids;
    ids.uid = uids->first;
    ids.gid = gids->first;
  } catch (const std::exception& exc) {
    VLOG(1) << "No subordinate ids: " << exc.what();
    return ids;
  }
  ids.usable = true;
  LOG(INFO) << "Programs run as uid " << ids.uid << " and gid " << ids.gid;
  return ids;
}

const SubordinateIds& Subordinate() {
  static const SubordinateIds* ids = new SubordinateIds(FindSubordinateIds());
  return *ids;
}

bool RunHelper(const std::vector<std::string>& args, std::string* error_msg) {
  std::vector<char*> argv;
  for (const std::string& arg : args)
    argv.push_back(const_cast<char*>(arg.c_str()));
  argv.push_back(nullptr);
  pid_t pid = fork();
  if (pid == -1) {
    *error_msg = absl::StrCat("fork: ", strerror(errno));
    return false;
  }
  if (pid == 0) {
    execv(argv[0], argv.data());
    _exit(127);
  }
  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno == EINTR) continue;
    *error_msg = absl::StrCat("waitpid: ", strerror(errno));
    return false;
  }
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    *error_msg = absl::StrCat(args[0], " failed with status ", status);
    return false;
  }
  return true;
}

bool WriteProcFile(const std::string& path, const std::string& content,
                   std::string* error_msg) {
  int fd = open(path.c_str(), O_WRONLY | O_CLOEXEC);
  if (fd == -1 || write(fd, content.data(), content.size()) !=
                      static_cast<ssize_t>(content.size())) {
    *error_msg = absl::StrCat(path, ": ", strerror(errno));
    if (fd != -1) close(fd);
    return false;
  }
  close(fd);
  return true;
}

// Reads the result of a step of the namespace holder: 0 or an errno value.
bool ReadStep(int fd, int* err) {
  ssize_t num_read = 0;
  do {
    num_read = read(fd, err, sizeof(*err));
  } while (num_read == -1 && errno == EINTR);
  return num_read == sizeof(*err);
}

}  // namespace

const char* const Namespaced::kSandboxDir = "/sandbox";

int Namespaced::Score() {
  static const int score = CheckNamespaces();
  return score;
}

Namespaced::~Namespaced() {
  Terminate();
  CloseFds();
  CloseFd(&limited_dir_fd_);
  CloseFd(&mount_ns_fd_);
  CloseFd(&user_ns_fd_);
}

bool Namespaced::LimitDirectory(const std::string& dir, int64_t size_bytes,
                                int32_t uid, int32_t gid,
                                std::string* host_dir,
                                std::string* error_msg) {
  if (mount_ns_fd_ != -1) {
    *error_msg = "The namespaces of the sandbox already exist";
    return false;
  }
  if (dir.empty() || dir[0] != '/') {
    *error_msg = "Not an absolute path: " + dir;
    return false;
  }
  if (!CreateNamespaces(dir, size_bytes, uid, gid, error_msg)) return false;
  *host_dir = absl::StrCat("/proc/self/fd/", limited_dir_fd_);
  return true;
}

bool Namespaced::CreateNamespaces(const std::string& dir, int64_t size_bytes,
                                  int32_t uid, int32_t gid,
                                  std::string* error_msg) {
  const bool rootless = geteuid() != 0;
  // The service owns the directory. Programs running as a subordinate id need
  // to be allowed in.
  std::string data =
      absl::StrCat("mode=", rootless && Subordinate().usable ? "0777" : "0700");
  if (size_bytes > 0) absl::StrAppend(&data, ",size=", size_bytes);
  if (uid >= 0) absl::StrAppend(&data, ",uid=", uid);
  if (gid >= 0) absl::StrAppend(&data, ",gid=", gid);
  const char* target = dir.empty() ? nullptr : dir.c_str();
  const char* options = data.c_str();
  const int flags = rootless ? CLONE_NEWUSER | CLONE_NEWNS : CLONE_NEWNS;

  int to_holder[2] = {-1, -1};
  int from_holder[2] = {-1, -1};
  if (pipe2(to_holder, O_CLOEXEC) == -1 ||
      pipe2(from_holder, O_CLOEXEC) == -1) {
    *error_msg = absl::StrCat("pipe2: ", strerror(errno));
    for (int* fd : {&to_holder[0], &to_holder[1]}) CloseFd(fd);
    return false;
  }
  // The holder creates the namespaces, and lives until they are pinned by
  // the descriptors of this process.
  pid_t holder = fork();
  if (holder == -1) {
    *error_msg = absl::StrCat("fork: ", strerror(errno));
    for (int* fd : {&to_holder[0], &to_holder[1], &from_holder[0],
                    &from_holder[1]}) {
      CloseFd(fd);
    }
    return false;
  }
  if (holder == 0) {
    close(to_holder[1]);
    close(from_holder[0]);
    auto report = [&from_holder](int err) {
      if (write(from_holder[1], &err, sizeof(err)) != sizeof(err)) _exit(1);
      if (err != 0) _exit(1);
    };
    report(unshare(flags) == -1 ? errno : 0);
    char c;
    if (read(to_holder[0], &c, 1) != 1) _exit(1);
    int err = 0;
    if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) == -1) {
      err = errno;
    } else if (target != nullptr &&
               mount("tmpfs", target, "tmpfs", MS_NOSUID | MS_NODEV,
                     options) == -1) {
      err = errno;
    }
    report(err);
    while (read(to_holder[0], &c, 1) == -1 && errno == EINTR) {
    }
    _exit(0);
  }
  CloseFd(&to_holder[0]);
  CloseFd(&from_holder[1]);

  auto step = [this, holder, &to_holder, &from_holder, error_msg,
               rootless]() {
    int err = 0;
    if (!ReadStep(from_holder[0], &err) || err != 0) {
      *error_msg = absl::StrCat("unshare: ", strerror(err));
      return false;
    }
    if (rootless && !WriteIdMaps(holder, error_msg)) return false;
    if (write(to_holder[1], "m", 1) != 1) {
      *error_msg = absl::StrCat("write: ", strerror(errno));
      return false;
    }
    if (!ReadStep(from_holder[0], &err) || err != 0) {
      *error_msg = absl::StrCat("mount: ", strerror(err));
      return false;
    }
    return true;
  };
  bool ok = step();
  if (ok) {
    const std::string proc = absl::StrCat("/proc/", holder);
    auto open_ns = [error_msg](const std::string& path, int flags, int* fd) {
      *fd = open(path.c_str(), flags | O_CLOEXEC);
      if (*fd == -1) *error_msg = absl::StrCat(path, ": ", strerror(errno));
      return *fd != -1;
    };
    ok = (!rootless || open_ns(proc + "/ns/user", O_RDONLY, &user_ns_fd_)) &&
         open_ns(proc + "/ns/mnt", O_RDONLY, &mount_ns_fd_) &&
         (dir.empty() || open_ns(proc + "/root" + dir, O_RDONLY | O_DIRECTORY,
                                 &limited_dir_fd_));
  }
  // Lets the holder exit.
  CloseFd(&to_holder[1]);
  CloseFd(&from_holder[0]);
  int status = 0;
  while (waitpid(holder, &status, 0) == -1) {
    if (errno == EINTR) continue;
    PLOG(ERROR) << "waitpid";
    break;
  }
  if (!ok) {
    CloseFd(&limited_dir_fd_);
    CloseFd(&mount_ns_fd_);
    CloseFd(&user_ns_fd_);
    return false;
  }
  VLOG(1) << "Created the namespaces of the sandbox"
          << (subordinate_ids_ ? " with subordinate ids" : "");
  return true;
}

bool Namespaced::WriteIdMaps(pid_t pid, std::string* error_msg) {
  const std::string pid_str = std::to_string(pid);
  const SubordinateIds& ids = Subordinate();
  if (ids.usable) {
    // The service is root in the namespace, and the program is nobody.
    if (!RunHelper({ids.newuidmap, pid_str, "0", std::to_string(geteuid()),
                    "1", std::to_string(kNobody), std::to_string(ids.uid),
                    "1"},
                   error_msg) ||
        !RunHelper({ids.newgidmap, pid_str, "0", std::to_string(getegid()),
                    "1", std::to_string(kNobody), std::to_string(ids.gid),
                    "1"},
                   error_msg)) {
      return false;
    }
    subordinate_ids_ = true;
    return true;
  }
  // Without other ids, the service and the program share the same one.
  const std::string proc = "/proc/" + pid_str;
  return WriteProcFile(proc + "/setgroups", "deny", error_msg) &&
         WriteProcFile(proc + "/uid_map",
                       absl::StrCat(kNobody, " ", geteuid(), " 1\n"),
                       error_msg) &&
         WriteProcFile(proc + "/gid_map",
                       absl::StrCat(kNobody, " ", getegid(), " 1\n"),
                       error_msg);
}

bool Namespaced::OnSetup(std::string* error_msg) {
  if (!options_->new_root[0]) {
    *error_msg = "No directory for the new root";
    return false;
  }
  if (mount_ns_fd_ == -1 && !CreateNamespaces("", 0, -1, -1, error_msg))
    return false;
  if (pipe2(status_fds_, O_CLOEXEC) == -1) {
    *error_msg = absl::StrCat("pipe2: ", strerror(errno));
    return false;
  }
  const std::string root = options_->new_root;
  mounts_.clear();
  for (const char* dir : kSystemDirs) {
    struct stat st;
    if (lstat(dir, &st) == -1) continue;
    if (S_ISLNK(st.st_mode)) {
      // Merged /usr layouts are reproduced as they are.
      char link[PATH_MAX] = {};
      ssize_t len = readlink(dir, link, sizeof(link) - 1);
      if (len <= 0) continue;
      mounts_.push_back(
          {MountPoint::SYMLINK, std::string(link, len), root + dir, 0});
    } else if (S_ISDIR(st.st_mode)) {
      mounts_.push_back({MountPoint::DIRECTORY, dir, root + dir,
                         MS_RDONLY | MS_NOSUID | LockedFlags(dir)});
    }
  }
  mounts_.push_back({MountPoint::EMPTY_DIR, "", root + "/dev", 0});
  for (const char* device : kDevices) {
    struct stat st;
    if (stat(device, &st) == -1 || !S_ISCHR(st.st_mode)) continue;
    mounts_.push_back({MountPoint::FILE, device, root + device, 0});
  }
  mounts_.push_back({MountPoint::PROC, "proc", root + "/proc", 0});
  unsigned long scratch_flags = limited_dir_fd_ != -1
                                    ? LockedFlags(limited_dir_fd_)
                                    : LockedFlags(options_->root);
  mounts_.push_back({MountPoint::DIRECTORY, options_->root, root + kSandboxDir,
                     MS_NOSUID | MS_NODEV | scratch_flags});
  mounts_.push_back({MountPoint::SYMLINK, kSandboxDir + 1, root + "/tmp", 0});
  return true;
}

bool Namespaced::DoFork(std::string* error_msg) {
  if (!Unix::DoFork(error_msg)) return false;
  CloseFd(&status_fds_[1]);
  return true;
}

bool Namespaced::OnEnterRoot(char* error_msg, size_t buflen) {
  close(status_fds_[0]);
  auto fail = [error_msg, buflen](const char* prefix) {
    return ChildError(error_msg, buflen, prefix);
  };
  if (user_ns_fd_ != -1 && setns(user_ns_fd_, CLONE_NEWUSER) == -1)
    return fail("setns user: ");
  if (setns(mount_ns_fd_, CLONE_NEWNS) == -1) return fail("setns mount: ");
  if (unshare(CLONE_NEWNS | CLONE_NEWPID | CLONE_NEWNET | CLONE_NEWIPC |
              CLONE_NEWUTS) == -1) {
    return fail("unshare: ");
  }
  // Readable without blocking once the relay is gone.
  int lifeline[2];
  if (pipe2(lifeline, O_CLOEXEC | O_NONBLOCK) == -1) return fail("pipe2: ");
  long init = syscall(SYS_clone, SIGCHLD, nullptr, nullptr, nullptr, nullptr);
  if (init == -1) return fail("clone: ");
  if (init != 0) Relay(init, lifeline[0]);

  if (prctl(PR_SET_PDEATHSIG, SIGKILL) == -1) return fail("prctl: ");
  close(lifeline[1]);
  char c;
  if (read(lifeline[0], &c, 1) == 0) _exit(1);
  close(lifeline[0]);

  if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) == -1)
    return fail("mount private: ");
  if (mount("tmpfs", options_->new_root, "tmpfs", MS_NOSUID | MS_NODEV,
            "mode=0755,size=1m") == -1) {
    return fail("mount root: ");
  }
  for (const MountPoint& mount_point : mounts_) {
    const char* source = mount_point.source.c_str();
    const char* target = mount_point.target.c_str();
    switch (mount_point.kind) {
      case MountPoint::EMPTY_DIR:
        if (mkdir(target, 0755) == -1) return fail("mkdir: ");
        break;
      case MountPoint::SYMLINK:
        if (symlink(source, target) == -1) return fail("symlink: ");
        break;
      case MountPoint::FILE: {
        int fd = open(target, O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
        if (fd == -1) return fail("open: ");
        close(fd);
        if (mount(source, target, nullptr, MS_BIND, nullptr) == -1)
          return fail("bind device: ");
        break;
      }
      case MountPoint::DIRECTORY:
        if (mkdir(target, 0755) == -1) return fail("mkdir: ");
        if (mount(source, target, nullptr, MS_BIND | MS_REC, nullptr) == -1)
          return fail("bind: ");
        if (mount(nullptr, target, nullptr,
                  MS_REMOUNT | MS_BIND | mount_point.flags, nullptr) == -1) {
          return fail("remount: ");
        }
        break;
      case MountPoint::PROC:
        if (mkdir(target, 0555) == -1) return fail("mkdir: ");
        // Not allowed when the host hides parts of its own /proc.
        mount("proc", target, "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC,
              nullptr);
        break;
    }
  }
  if (chdir(options_->new_root) == -1) return fail("chdir: ");
  if (syscall(SYS_pivot_root, ".", ".") == -1) return fail("pivot_root: ");
  if (umount2(".", MNT_DETACH) == -1) return fail("umount: ");
  if (chdir("/") == -1) return fail("chdir: ");
  if (mount(nullptr, "/", nullptr, MS_REMOUNT | MS_RDONLY | MS_NOSUID | MS_NODEV,
            nullptr) == -1) {
    return fail("remount root: ");
  }
  if (chdir(kSandboxDir) == -1) return fail("chdir: ");
  sethostname("runbox", 6);
  return true;
}

void Namespaced::Relay(pid_t init, int lifeline) {
  // Only the init and the program may keep the pipes open.
  close(lifeline);
  close(pipe_fds_[1]);
  close(stdout_fds_[1]);
  close(stderr_fds_[1]);
  close(status_fds_[1]);
  int status = 0;
  while (waitpid(init, &status, 0) == -1) {
    if (errno != EINTR) _exit(1);
  }
  _exit(0);
}

bool Namespaced::OnChild(char* error_msg, size_t buflen) {
  if (subordinate_ids_) {
    auto fail = [error_msg, buflen](const char* prefix) {
      return ChildError(error_msg, buflen, prefix);
    };
    // Denied when the helper did not allow it; there are no groups anyway.
    if (setgroups(0, nullptr) == -1 && errno != EPERM)
      return fail("setgroups: ");
    if (setgid(kNobody) == -1) return fail("setgid: ");
    if (setuid(kNobody) == -1) return fail("setuid: ");
  }
  return Unix::OnChild(error_msg, buflen);
}

bool Namespaced::OnSpawn(char* error_msg, size_t buflen) {
  long program =
      syscall(SYS_clone, SIGCHLD, nullptr, nullptr, nullptr, nullptr);
  if (program == -1) return ChildError(error_msg, buflen, "clone: ");
  if (program != 0) Init(program);
  close(status_fds_[1]);
  return true;
}

void Namespaced::Init(pid_t program) {
  // Only the program may keep the output and the error pipe open.
  close(pipe_fds_[1]);
  close(stdout_fds_[1]);
  close(stderr_fds_[1]);
  int status = 0;
  while (true) {
    pid_t pid = waitpid(-1, &status, 0);
    if (pid == program) {
      ssize_t written = write(status_fds_[1], &status, sizeof(status));
      _exit(written == sizeof(status) ? 0 : 1);
    }
    if (pid == -1 && errno != EINTR) _exit(1);
  }
}

void Namespaced::KillTree() {
  // The init dies with the relay, and the kernel kills the whole namespace
  // with the init.
  if (kill(child_pid_, SIGKILL) == -1 && errno != ESRCH) {
    PLOG(WARNING) << "kill " << child_pid_;
  }
}

bool Namespaced::ProgramStatus(int child_status, int* program_status) {
  ssize_t num_read = 0;
  do {
    num_read = read(status_fds_[0], program_status, sizeof(*program_status));
  } while (num_read == -1 && errno == EINTR);
  return num_read == sizeof(*program_status);
}

void Namespaced::CloseFds() {
  Unix::CloseFds();
  CloseFd(&status_fds_[0]);
  CloseFd(&status_fds_[1]);
}

namespace {
Sandbox::Register<Namespaced> r;
}  // namespace

}  // namespace sandbox
