#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

// Scheduler
DECLARE_int32(max_concurrent_jobs);
DECLARE_int32(max_queue_length);
DECLARE_int32(per_caller_quota);

// Request validation
DECLARE_int64(max_source_bytes);
DECLARE_int64(max_stdin_bytes);

// Resource limits
DECLARE_int64(output_byte_limit);
DECLARE_int64(scratch_disk_limit_bytes);
DECLARE_int32(poll_interval_ms);
DECLARE_string(runtimes_config);

// Sandboxes
DECLARE_string(temp_directory);
DECLARE_bool(keep_sandboxes);
DECLARE_int32(sandbox_uid);
DECLARE_int32(sandbox_gid);
DECLARE_bool(require_isolation);

#endif
