#include "sandbox/limiter.hpp"

#include <signal.h>

#include <algorithm>

namespace sandbox {

const char* BreachName(Breach breach) {
  switch (breach) {
    case Breach::NONE:
      return "none";
    case Breach::WALL_TIME:
      return "wall time";
    case Breach::CPU_TIME:
      return "cpu time";
    case Breach::MEMORY:
      return "memory";
    case Breach::OUTPUT:
      return "output";
    case Breach::CANCELLED:
      return "cancelled";
  }
  return "unknown";
}

ResourceLimiter::ResourceLimiter(const Limits& limits,
                                 const std::atomic<bool>* cancelled)
    : limits_(limits), cancelled_(cancelled) {}

Breach ResourceLimiter::Observe(int64_t wall_millis, int64_t cpu_millis,
                                int64_t rss_bytes) {
  peak_memory_bytes_ = std::max(peak_memory_bytes_, rss_bytes);
  if (cancelled_ && cancelled_->load()) Record(Breach::CANCELLED);
  if (limits_.wall_time_millis && wall_millis > limits_.wall_time_millis)
    Record(Breach::WALL_TIME);
  if (limits_.cpu_time_millis && cpu_millis > limits_.cpu_time_millis)
    Record(Breach::CPU_TIME);
  if (limits_.memory_bytes && peak_memory_bytes_ > limits_.memory_bytes)
    Record(Breach::MEMORY);
  return breach_;
}

size_t ResourceLimiter::AdmitOutput(size_t n) {
  size_t admitted = n;
  if (limits_.output_bytes) {
    int64_t room = std::max<int64_t>(limits_.output_bytes - output_bytes_, 0);
    if (static_cast<int64_t>(n) > room) {
      admitted = room;
      Record(Breach::OUTPUT);
    }
  }
  output_bytes_ += n;
  return admitted;
}

Breach ResourceLimiter::ObserveSignal(int signal) {
  if (signal == SIGXCPU) Record(Breach::CPU_TIME);
  return breach_;
}

Breach ResourceLimiter::ObserveOutOfMemory() {
  Record(Breach::MEMORY);
  return breach_;
}

}  // namespace sandbox
