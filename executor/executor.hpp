#ifndef EXECUTOR_EXECUTOR_HPP
#define EXECUTOR_EXECUTOR_HPP

#include <atomic>
#include <string>

#include "proto/request.pb.h"
#include "proto/response.pb.h"
#include "runtime/runtime_profile.hpp"

namespace executor {

class Executor {
 public:
  // A string that identifies this executor.
  virtual std::string Id() const = 0;

  // Runs the request with the given runtime and returns its result. The
  // execution is terminated as soon as cancelled becomes true. Failures of
  // the service itself are reported as INTERNAL_ERROR results.
  virtual proto::ExecutionResult Execute(
      const proto::ExecutionRequest& request,
      const runtime::RuntimeProfile& profile,
      const std::atomic<bool>& cancelled) = 0;

  Executor() = default;
  virtual ~Executor() = default;
  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;
  Executor(Executor&&) = delete;
  Executor& operator=(Executor&&) = delete;
};

}  // namespace executor

#endif
