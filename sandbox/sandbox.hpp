#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <atomic>
#include <cstdint>
#include <cstring>
#include <functional>
#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "sandbox/limiter.hpp"

namespace sandbox {

// Settings to execute the program in the sandbox. Only fixed-size buffers are
// used, so that the child process never needs to allocate memory between
// fork and exec.
struct ExecutionOptions {
  static const constexpr size_t str_len = 1024;
  static const constexpr size_t narg = 32;
  static const constexpr size_t nenv = 8;

  // Optional values
  int64_t cpu_limit_millis = 0;
  int64_t wall_limit_millis = 0;
  int64_t memory_limit_bytes = 0;
  int64_t output_limit_bytes = 0;
  int64_t max_file_size_bytes = 0;
  int32_t max_procs = 0;
  int32_t max_files = 0;
  int32_t poll_interval_millis = 0;
  // Identity the program runs as; negative values keep the current one.
  int32_t uid = -1;
  int32_t gid = -1;
  // When set to true by another thread, the execution is terminated.
  const std::atomic<bool>* cancelled = nullptr;

  char stdin_file[str_len] = {};
  char args[narg][str_len] = {};
  char env[nenv][str_len] = {};

  // Required values
  // Directory the program runs in. It is the only writable location.
  char root[str_len] = {};
  // Empty directory that sandboxes with a private filesystem view may use
  // as the mount point of the new root.
  char new_root[str_len] = {};
  char executable[str_len] = {};

  ExecutionOptions(const std::string& root_, const std::string& executable_) {
    stringcpy(root, root_);
    stringcpy(executable, executable_);
    strncpy(&args[0][0], executable, str_len);
  }
  template <typename T>
  void SetArgs(const T& a_) {
    size_t i = 1;
    for (const std::string& s : a_) {
      if (i >= narg) throw std::runtime_error("Too many arguments");
      stringcpy(&args[i++][0], s);
    }
  }
  void SetArgs(const std::initializer_list<const char*>& a_) {
    size_t i = 1;
    for (const char* s : a_) {
      if (i >= narg) throw std::runtime_error("Too many arguments");
      stringcpy(&args[i++][0], s);
    }
  }
  template <typename T>
  void SetEnv(const T& e_) {
    size_t i = 0;
    for (const std::string& s : e_) {
      if (i >= nenv - 1) throw std::runtime_error("Too many variables");
      stringcpy(&env[i++][0], s);
    }
  }

  static void stringcpy(char* dst, const std::string& s) {
    if (s.size() >= str_len) throw std::runtime_error("string too long");
    strncpy(dst, s.c_str(), str_len - 1);
  }
};

// Results of the execution.
struct ExecutionInfo {
  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
  int64_t wall_time_millis = 0;
  int64_t memory_usage_bytes = 0;
  // True if the program terminated by itself with an exit code.
  bool exited = false;
  int32_t status_code = 0;
  int32_t signal = 0;
  // True if the sandbox forced the termination of the program.
  bool killed = false;
  Breach breach = Breach::NONE;
  std::string stdout_data;
  bool stdout_truncated = false;
  std::string stderr_data;
  bool stderr_truncated = false;
  std::string message;
};

// Sandbox interface. Implementations need to register themselves by creating a
// global object of type Sandbox::Register<SandboxImpl> and should define the
// Create, Score and StaticName static functions. Create should return a
// pointer to a newly allocated instance of the given implementation, while
// Score should return a value that defines how "good" that sandbox is:
// negative if the sandbox should not/cannot be used in the current
// configuration, positive otherwise (a bigger value means a better sandbox).
// Registering a sandbox is not thread-safe and should be done before any
// threads are created.
class Sandbox {
 public:
  using create_t = std::function<Sandbox*()>;
  using score_t = std::function<int()>;

  // Creates the best sandbox available, or returns nullptr.
  static std::unique_ptr<Sandbox> Create();
  // Creates the sandbox with the given name, if it is usable.
  static std::unique_ptr<Sandbox> Create(const std::string& name);

  // Runs the specified command, enforcing the limits of options. Returns true
  // if the program was started, and sets fields in info. Otherwise, returns
  // false and sets error_msg. A sandbox object runs one program at a time.
  virtual bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) = 0;

  // Kills every process started by the last call to Execute. Idempotent.
  virtual void Terminate() = 0;

  // Whether the program gets a private network, filesystem and process view.
  virtual bool Isolated() const = 0;

  // Caps at size_bytes the total size of the files that programs run by this
  // sandbox can write in dir. Must be called before the first call to
  // Execute. New files in dir are owned by uid and gid when they are not
  // negative. On success, sets host_dir to a path through which this process
  // sees the content of dir as the programs do, and returns true.
  // Otherwise, returns false and sets error_msg.
  virtual bool LimitDirectory(const std::string& dir, int64_t size_bytes,
                              int32_t uid, int32_t gid, std::string* host_dir,
                              std::string* error_msg) = 0;

  virtual const char* Name() const = 0;

  // Constructor and destructors
  virtual ~Sandbox() = default;
  Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;

  template <typename T>
  class Register {
   public:
    Register() { Sandbox::Register_(T::StaticName(), &T::Create, &T::Score); }
  };

 private:
  struct Entry {
    std::string name;
    create_t create;
    score_t score;
  };
  using store_t = std::vector<Entry>;
  static store_t* Boxes_();
  static void Register_(const std::string& name, create_t create,
                        score_t score);
  template <typename T>
  friend class Register;
};

}  // namespace sandbox

#endif
