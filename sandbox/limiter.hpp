#ifndef SANDBOX_LIMITER_HPP
#define SANDBOX_LIMITER_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace sandbox {

// Limit that caused the forced termination of a program.
enum class Breach { NONE, WALL_TIME, CPU_TIME, MEMORY, OUTPUT, CANCELLED };

const char* BreachName(Breach breach);

// Ceilings enforced on a single execution. A zero value disables the
// corresponding check.
struct Limits {
  int64_t cpu_time_millis = 0;
  int64_t wall_time_millis = 0;
  int64_t memory_bytes = 0;
  int64_t output_bytes = 0;
};

// Watches the resource consumption of one execution and records the first
// limit it exceeds. Once a breach is recorded it never changes, so that later
// observations cannot hide the original reason. Within a single observation
// the checks run in order cancellation, wall time, CPU time, memory.
// Not thread-safe: the cancellation flag is the only input that may be
// written by other threads.
class ResourceLimiter {
 public:
  ResourceLimiter(const Limits& limits, const std::atomic<bool>* cancelled);

  // Observes a sample of the elapsed wall time, of the CPU time and of the
  // resident memory of the program. Returns the current breach.
  Breach Observe(int64_t wall_millis, int64_t cpu_millis, int64_t rss_bytes);

  // Accounts n more bytes written by the program, on any of its output
  // streams. Returns how many of them fit below the output ceiling and should
  // be kept.
  size_t AdmitOutput(size_t n);

  // Records the breach implied by the program being killed by the given
  // signal (for example SIGXCPU for the CPU time backstop).
  Breach ObserveSignal(int signal);

  // Records that the kernel killed a process of the program because the
  // memory of all of them reached the ceiling.
  Breach ObserveOutOfMemory();

  Breach breach() const { return breach_; }
  int64_t peak_memory_bytes() const { return peak_memory_bytes_; }
  int64_t output_bytes() const { return output_bytes_; }

 private:
  void Record(Breach breach) {
    if (breach_ == Breach::NONE) breach_ = breach;
  }

  Limits limits_;
  const std::atomic<bool>* cancelled_;
  Breach breach_ = Breach::NONE;
  int64_t peak_memory_bytes_ = 0;
  int64_t output_bytes_ = 0;
};

}  // namespace sandbox

#endif
