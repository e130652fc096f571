#include "sandbox/unix.hpp"

#include <errno.h>
#include <fcntl.h>
#include <grp.h>
#include <limits.h>
#include <poll.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <utility>

#include "absl/strings/str_cat.h"
#include "glog/logging.h"

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

const constexpr int32_t kDefaultPollIntervalMillis = 50;
// Longest wait between two checks for the exit of the program.
const constexpr int kMaxPollMillis = 10;
// How long the output of killed programs is drained before giving up.
const constexpr int64_t kDrainGraceMillis = 1000;
const constexpr size_t kReadChunk = 64 * 1024;

// Closes every descriptor above stderr except keep. Must not allocate.
void CloseFdsExcept(int keep) {
#ifdef SYS_close_range
  if ((keep <= 3 || syscall(SYS_close_range, 3, keep - 1, 0) == 0) &&
      syscall(SYS_close_range, std::max(keep + 1, 3), ~0U, 0) == 0) {
    return;
  }
#endif
  struct rlimit rlim;
  int max_fd = 4096;
  if (getrlimit(RLIMIT_NOFILE, &rlim) == 0 && rlim.rlim_cur != RLIM_INFINITY)
    max_fd = static_cast<int>(rlim.rlim_cur);
  for (int fd = 3; fd < max_fd; fd++) {
    if (fd != keep) close(fd);
  }
}

struct Stream {
  int* fd;
  std::string* data;
  bool* truncated;
};

// Reads what is available on the open streams, waiting at most timeout_millis
// for something to happen. Returns false when all the streams are closed.
bool Pump(Stream* streams, size_t num_streams, int timeout_millis,
          sandbox::ResourceLimiter* limiter) {
  struct pollfd fds[2];
  Stream* polled[2];
  nfds_t nfds = 0;
  for (size_t i = 0; i < num_streams; i++) {
    if (*streams[i].fd == -1) continue;
    fds[nfds].fd = *streams[i].fd;
    fds[nfds].events = POLLIN;
    fds[nfds].revents = 0;
    polled[nfds++] = &streams[i];
  }
  if (nfds == 0) {
    if (timeout_millis > 0) usleep(timeout_millis * 1000);
    return false;
  }
  int ret = poll(fds, nfds, timeout_millis);
  if (ret == -1) {
    if (errno != EINTR) PLOG(ERROR) << "poll";
    return true;
  }
  char buf[kReadChunk];
  for (nfds_t i = 0; i < nfds; i++) {
    if (fds[i].revents == 0) continue;
    Stream* stream = polled[i];
    ssize_t num_read = read(*stream->fd, buf, kReadChunk);
    if (num_read > 0) {
      size_t admitted = limiter->AdmitOutput(num_read);
      stream->data->append(buf, admitted);
      if (admitted < static_cast<size_t>(num_read)) *stream->truncated = true;
    } else if (num_read == 0 || (errno != EINTR && errno != EAGAIN)) {
      close(*stream->fd);
      *stream->fd = -1;
    }
  }
  return true;
}

int64_t Millis(const struct timeval& tv) {
  return static_cast<int64_t>(tv.tv_sec) * 1000 + tv.tv_usec / 1000;
}
}  // namespace

namespace sandbox {

static const constexpr size_t kStrErrorBufSize = 2048;

Unix::~Unix() {
  Terminate();
  CloseFds();
  if (!limited_dir_.empty() && umount2(limited_dir_.c_str(), MNT_DETACH) == -1)
    PLOG(WARNING) << "umount " << limited_dir_;
}

bool Unix::Execute(const ExecutionOptions& options, ExecutionInfo* info,
                   std::string* error_msg) {
  options_ = &options;
  bool ok = Setup(error_msg) && DoFork(error_msg) && Wait(info, error_msg);
  CloseFds();
  std::unique_ptr<Cgroup> cgroup;
  {
    absl::MutexLock lock(&mutex_);
    cgroup = std::move(cgroup_);
  }
  cgroup_procs_fd_ = -1;
  return ok;
}

bool Unix::LimitDirectory(const std::string& dir, int64_t size_bytes,
                          int32_t uid, int32_t gid, std::string* host_dir,
                          std::string* error_msg) {
  if (geteuid() != 0) {
    *error_msg = "Only root can mount a size-capped directory";
    return false;
  }
  std::string data = "mode=0700";
  if (size_bytes > 0) absl::StrAppend(&data, ",size=", size_bytes);
  if (uid >= 0) absl::StrAppend(&data, ",uid=", uid);
  if (gid >= 0) absl::StrAppend(&data, ",gid=", gid);
  if (mount("tmpfs", dir.c_str(), "tmpfs", MS_NOSUID | MS_NODEV,
            data.c_str()) == -1) {
    char buf[kStrErrorBufSize] = {};
    *error_msg = absl::StrCat("mount ", dir, ": ",
                              mystrerror(errno, buf, kStrErrorBufSize));
    return false;
  }
  limited_dir_ = dir;
  *host_dir = dir;
  return true;
}

bool Unix::Setup(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  if (pipe2(pipe_fds_, O_CLOEXEC) == -1 ||
      pipe2(stdout_fds_, O_CLOEXEC) == -1 ||
      pipe2(stderr_fds_, O_CLOEXEC) == -1) {
    *error_msg = "pipe2: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    CloseFds();
    return false;
  }
  limit_processes_ = options_->max_procs && options_->uid >= 0 &&
                     geteuid() == 0;
  if (Cgroup::Available()) {
    std::unique_ptr<Cgroup> cgroup =
        Cgroup::Create(options_->memory_limit_bytes);
    if (cgroup != nullptr) cgroup_procs_fd_ = cgroup->ProcsFd();
    absl::MutexLock lock(&mutex_);
    cgroup_ = std::move(cgroup);
  }
  return OnSetup(error_msg);
}

void Unix::CloseFd(int* fd) {
  if (*fd == -1) return;
  close(*fd);
  *fd = -1;
}

void Unix::CloseFds() {
  for (int* fds : {pipe_fds_, stdout_fds_, stderr_fds_}) {
    CloseFd(&fds[0]);
    CloseFd(&fds[1]);
  }
}

bool Unix::DoFork(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = "fork: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  if (fork_result == 0) Child();
  absl::MutexLock lock(&mutex_);
  child_pid_ = fork_result;
  return true;
}

bool Unix::ChildError(char* error_msg, size_t buflen, const char* prefix) {
  char buf[256] = {};
  const char* err = mystrerror(errno, buf, sizeof(buf));
  strncat(error_msg, prefix, buflen - strlen(error_msg) - 1);
  strncat(error_msg, err, buflen - strlen(error_msg) - 1);
  return false;
}

bool Unix::OnEnterRoot(char* error_msg, size_t buflen) {
  if (chdir(options_->root) == -1)
    return ChildError(error_msg, buflen, "chdir: ");
  return true;
}

bool Unix::OnChild(char* error_msg, size_t buflen) {
  auto fail = [error_msg, buflen](const char* prefix) {
    return ChildError(error_msg, buflen, prefix);
  };
  if (options_->uid >= 0) {
    if (setgroups(0, nullptr) == -1) return fail("setgroups: ");
    if (options_->gid >= 0 && setgid(options_->gid) == -1)
      return fail("setgid: ");
    if (setuid(options_->uid) == -1) return fail("setuid: ");
  }
  if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) == -1)
    return fail("prctl: ");
  return true;
}

void Unix::Child() {
  close(pipe_fds_[0]);
  close(stdout_fds_[0]);
  close(stderr_fds_[0]);
  auto die2 = [this](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 2] = {};
    strncat(buf, prefix, 64);
    strncat(buf, ": ", 2);
    strncat(buf, err, kStrErrorBufSize);
    int len = strlen(buf);
    if (write(pipe_fds_[1], &len, sizeof(len)) == sizeof(len)) {
      if (write(pipe_fds_[1], buf, len) != len) _Exit(1);
    }
    close(pipe_fds_[1]);
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));
  };

  // Change session, so that we do not receive Ctrl-Cs in the terminal and all
  // the processes of the program can be found and killed.
  if (setsid() == -1) die("setsid", errno);
  // Every process the program creates inherits the cgroup.
  if (cgroup_procs_fd_ != -1 && write(cgroup_procs_fd_, "0", 1) != 1)
    die("cgroup", errno);

  // The input file is opened before entering the sandbox, since it lives
  // outside of it.
  int stdin_fd = open(options_->stdin_file[0] ? options_->stdin_file
                                              : "/dev/null",
                      O_RDONLY | O_CLOEXEC);
  if (stdin_fd == -1) die("open", errno);

  char buf[kStrErrorBufSize] = {};
  if (!OnEnterRoot(buf, kStrErrorBufSize)) die2("root", buf);
  if (!OnSpawn(buf, kStrErrorBufSize)) die2("spawn", buf);

  // Prepare args and environment.
  char* args[ExecutionOptions::narg + 1] = {};
  for (size_t i = 0; i < ExecutionOptions::narg && options_->args[i][0]; i++)
    args[i] = const_cast<char*>(options_->args[i]);
  char* env[ExecutionOptions::nenv + 1] = {};
  for (size_t i = 0; i < ExecutionOptions::nenv && options_->env[i][0]; i++)
    env[i] = const_cast<char*>(options_->env[i]);

  // Handle I/O redirection.
#define DUP(fd, target)                                     \
  if (dup2(fd, target) == -1) die("redir " #target, errno);
  DUP(stdin_fd, STDIN_FILENO);
  DUP(stdout_fds_[1], STDOUT_FILENO);
  DUP(stderr_fds_[1], STDERR_FILENO);
#undef DUP
  // Descriptors opened by other threads of the parent may lack O_CLOEXEC.
  CloseFdsExcept(pipe_fds_[1]);

  // Set resource limits.
  struct rlimit rlim;
#define SET_RLIM(res, value)                    \
  {                                             \
    rlim_t lim = value;                         \
    if (lim) {                                  \
      rlim.rlim_cur = lim;                      \
      rlim.rlim_max = lim;                      \
      if (setrlimit(RLIMIT_##res, &rlim) < 0) { \
        die("setrlim " #res, errno);            \
      }                                         \
    }                                           \
  }

  // Backstop for the CPU time watchdog, rounded up and one second late.
  SET_RLIM(CPU, options_->cpu_limit_millis
                    ? (options_->cpu_limit_millis + 999) / 1000 + 1
                    : 0);
  SET_RLIM(FSIZE, options_->max_file_size_bytes);
  SET_RLIM(NOFILE, options_->max_files);
  if (limit_processes_) SET_RLIM(NPROC, options_->max_procs);
#undef SET_RLIM
  rlim.rlim_cur = rlim.rlim_max = 0;
  if (setrlimit(RLIMIT_CORE, &rlim) < 0) die("setrlim CORE", errno);

  if (!OnChild(buf, kStrErrorBufSize)) {
    die2("OnChild", buf);
  }
  int count = 0;
  do {
    execve(options_->executable, args, env);
    usleep(100);
    // We try at most 16 times to avoid livelocks (which should not be possible,
    // but better safe than sorry).
  } while (errno == ETXTBSY && count++ < 16);
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(1);
}

void Unix::KillTree() {
  if (kill(-child_pid_, SIGKILL) == -1 && errno != ESRCH) {
    PLOG(WARNING) << "kill " << -child_pid_;
  }
  // Processes may change their process group, or be forked while killing.
  ProcessTree tree(child_pid_, ProcessTree::Membership::SESSION);
  for (int round = 0; round < 16 && tree.KillAll() > 0; round++) {
  }
}

void Unix::KillAll() {
  if (cgroup_ != nullptr) cgroup_->Kill();
  KillTree();
}

void Unix::Terminate() {
  absl::MutexLock lock(&mutex_);
  if (child_pid_ == 0) return;
  KillAll();
}

bool Unix::Wait(ExecutionInfo* info, std::string* error_msg) {
  CloseFd(&pipe_fds_[1]);
  CloseFd(&stdout_fds_[1]);
  CloseFd(&stderr_fds_[1]);
  int error_len = 0;
  ssize_t header = 0;
  do {
    header = read(pipe_fds_[0], &error_len, sizeof(error_len));
  } while (header == -1 && errno == EINTR);
  if (header == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    ssize_t len = read(pipe_fds_[0], error,
                       std::min<size_t>(error_len, PIPE_BUF - 1));
    *error_msg = len > 0 ? error : "unknown error in the sandboxed process";
    absl::MutexLock lock(&mutex_);
    KillAll();
    int child_status = 0;
    while (waitpid(child_pid_, &child_status, 0) == -1 && errno == EINTR) {
    }
    child_pid_ = 0;
    return false;
  }
  CloseFd(&pipe_fds_[0]);

  Limits limits;
  limits.cpu_time_millis = options_->cpu_limit_millis;
  limits.wall_time_millis = options_->wall_limit_millis;
  limits.memory_bytes = options_->memory_limit_bytes;
  limits.output_bytes = options_->output_limit_bytes;
  ResourceLimiter limiter(limits, options_->cancelled);
  pid_t child_pid = 0;
  // Owned by this thread until Execute returns.
  const Cgroup* cgroup = nullptr;
  {
    absl::MutexLock lock(&mutex_);
    child_pid = child_pid_;
    cgroup = cgroup_.get();
  }
  // Observes what only the cgroup knows: processes reaped by other processes
  // of the program, and kills by the kernel.
  auto observe_cgroup = [cgroup, &limiter](TreeUsage* usage) {
    CgroupUsage group;
    if (cgroup == nullptr || !cgroup->Usage(&group)) return;
    usage->user_millis = std::max(usage->user_millis, group.user_millis);
    usage->system_millis = std::max(usage->system_millis, group.system_millis);
    // The kernel killed the program before a sample could see it at the
    // ceiling.
    if (group.oom_kills > 0) {
      limiter.ObserveOutOfMemory();
      usage->rss_bytes = std::max(usage->rss_bytes, group.peak_memory_bytes);
    }
  };
  ProcessTree tree(child_pid, TreeMembership());
  Stream streams[2] = {
      {&stdout_fds_[0], &info->stdout_data, &info->stdout_truncated},
      {&stderr_fds_[0], &info->stderr_data, &info->stderr_truncated}};

  int32_t poll_interval = options_->poll_interval_millis
                              ? options_->poll_interval_millis
                              : kDefaultPollIntervalMillis;
  auto program_start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - program_start)
        .count();
  };

  // The child is only reaped after its tree is killed, so that its pid (and
  // session id) cannot be reused in the meantime.
  int64_t next_sample = 0;
  TreeUsage last_usage;
  while (true) {
    int64_t now = elapsed_millis();
    int timeout = static_cast<int>(
        std::min<int64_t>(std::max<int64_t>(next_sample - now, 0),
                          kMaxPollMillis));
    Pump(streams, 2, timeout, &limiter);
    if (limiter.breach() != Breach::NONE) break;
    now = elapsed_millis();
    if (now >= next_sample) {
      TreeUsage usage = tree.Sample();
      observe_cgroup(&usage);
      last_usage = usage;
      if (limiter.Observe(now, usage.cpu_millis(), usage.rss_bytes) !=
          Breach::NONE) {
        break;
      }
      next_sample = now + poll_interval;
    }
    siginfo_t si;
    si.si_pid = 0;
    if (waitid(P_PID, child_pid, &si, WEXITED | WNOHANG | WNOWAIT) == -1) {
      if (errno == EINTR) continue;
      char buf[kStrErrorBufSize] = {};
      LOG(ERROR) << "waitid: " << mystrerror(errno, buf, kStrErrorBufSize);
      break;
    }
    if (si.si_pid == child_pid) break;
  }

  int child_status = 0;
  struct rusage rusage = {};
  {
    absl::MutexLock lock(&mutex_);
    KillAll();
    while (wait4(child_pid_, &child_status, 0, &rusage) == -1) {
      if (errno == EINTR) continue;
      char buf[kStrErrorBufSize] = {};
      *error_msg = "wait4: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      child_pid_ = 0;
      return false;
    }
    child_pid_ = 0;
  }
  info->wall_time_millis = elapsed_millis();

  // Data written before the processes were killed is still in the pipes.
  int64_t drain_end = info->wall_time_millis + kDrainGraceMillis;
  while (Pump(streams, 2, kMaxPollMillis, &limiter)) {
    if (elapsed_millis() > drain_end) {
      LOG(WARNING) << "Output of process " << child_pid
                   << " still open after it was killed";
      break;
    }
  }
  CloseFd(&stdout_fds_[0]);
  CloseFd(&stderr_fds_[0]);

  int program_status = 0;
  if (ProgramStatus(child_status, &program_status)) {
    info->exited = WIFEXITED(program_status);
    info->status_code = info->exited ? WEXITSTATUS(program_status) : 0;
    info->signal = WIFSIGNALED(program_status) ? WTERMSIG(program_status) : 0;
  } else {
    info->exited = false;
    info->status_code = 0;
    info->signal = SIGKILL;
  }
  // The rusage of the child misses its descendants that were not reaped by
  // one of its waited-for children.
  TreeUsage final_usage;
  final_usage.user_millis =
      std::max(Millis(rusage.ru_utime), last_usage.user_millis);
  final_usage.system_millis =
      std::max(Millis(rusage.ru_stime), last_usage.system_millis);
  final_usage.rss_bytes = static_cast<int64_t>(rusage.ru_maxrss) * 1024;
  observe_cgroup(&final_usage);
  info->cpu_time_millis = final_usage.user_millis;
  info->sys_time_millis = final_usage.system_millis;
  limiter.ObserveSignal(info->signal);
  // Limits are also checked on the final accounting, so that a program that
  // exits between two samples cannot escape them.
  limiter.Observe(info->wall_time_millis, final_usage.cpu_millis(),
                  final_usage.rss_bytes);
  info->memory_usage_bytes = limiter.peak_memory_bytes();
  info->breach = limiter.breach();
  info->killed = info->breach != Breach::NONE && !info->exited;
  if (info->breach != Breach::NONE) {
    VLOG(1) << "Process " << child_pid << " exceeded the "
            << BreachName(info->breach) << " limit";
  }

  OnFinish(info);
  return true;
}

namespace {
Sandbox::Register<Unix> r;
}  // namespace

}  // namespace sandbox
