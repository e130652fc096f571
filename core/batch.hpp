#ifndef CORE_BATCH_HPP
#define CORE_BATCH_HPP

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>

#include "core/scheduler.hpp"
#include "google/protobuf/message.h"

namespace core {

// Serializes message as single-line JSON, with the proto field names and the
// fields set to their defaults.
std::string ToJson(const google::protobuf::Message& message);

// Reads one JSON ExecutionRequest per line from in and writes one JSON
// SubmitResponse per line to out, in the same order. All the requests are
// submitted before the first result is awaited, so they run concurrently up
// to the limits of the scheduler. Empty lines are skipped; a line that is not
// a valid request gets an INVALID_REQUEST admission error naming the line.
// Returns the number of responses written.
int64_t RunBatch(Scheduler* scheduler, std::istream* in, std::ostream* out);

}  // namespace core

#endif
