#ifndef CORE_CHANNEL_HPP
#define CORE_CHANNEL_HPP

#include <queue>
#include <utility>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/types/optional.h"

namespace core {

// Unbounded multi-producer queue. After Stop() no new item is accepted, but
// the items already queued are still returned by Dequeue.
template <typename T>
class Channel {
 public:
  // Returns false if the channel was stopped.
  bool Enqueue(T&& item) {
    absl::MutexLock lck(&mutex_);
    if (stopped_) return false;
    queue_.push(std::move(item));
    return true;
  }

  // Blocks until an item is available. Returns an empty optional when the
  // channel is stopped and drained.
  absl::optional<T> Dequeue() {
    absl::MutexLock lck(&mutex_);
    auto cond = [this]() {
      mutex_.AssertHeld();
      return stopped_ || !queue_.empty();
    };
    mutex_.Await(absl::Condition(&cond));
    if (queue_.empty()) return {};
    absl::optional<T> item = std::move(queue_.front());
    queue_.pop();
    return item;
  }

  void Stop() {
    absl::MutexLock lck(&mutex_);
    stopped_ = true;
  }

 private:
  absl::Mutex mutex_;
  std::queue<T> queue_ GUARDED_BY(mutex_);
  bool stopped_ GUARDED_BY(mutex_) = false;
};

}  // namespace core

#endif
