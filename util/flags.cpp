#include "util/flags.hpp"

DEFINE_int32(max_concurrent_jobs, 0,
             "Number of jobs that may run at the same time. If unset, "
             "autodetect");
DEFINE_int32(max_queue_length, 64,
             "Number of admitted jobs that may wait for a slot. Requests "
             "beyond this are rejected as overloaded");
DEFINE_int32(per_caller_quota, 4,
             "Number of queued or running jobs a single caller may have");

DEFINE_int64(max_source_bytes, 64 * 1024, "Maximum size of a source file");
DEFINE_int64(max_stdin_bytes, 1024 * 1024,
             "Maximum size of the standard input of a job");

DEFINE_int64(output_byte_limit, 64 * 1024,
             "Maximum number of bytes of stdout+stderr a job may produce");
DEFINE_int64(scratch_disk_limit_bytes, 10 * 1024 * 1024,
             "Maximum size of the files a job may write in its scratch "
             "directory");
DEFINE_int32(poll_interval_ms, 50,
             "Interval between two checks of the resource limits");
DEFINE_string(runtimes_config, "",
              "Text-format RuntimeCatalog with per-language overrides");

DEFINE_string(temp_directory, "temp", "Where the sandboxes should be created");
DEFINE_bool(keep_sandboxes, false,
            "Do not delete the scratch directories after the execution");
DEFINE_int32(sandbox_uid, 65534,
             "User id the submitted code runs as, when started as root");
DEFINE_int32(sandbox_gid, 65534,
             "Group id the submitted code runs as, when started as root");
DEFINE_bool(require_isolation, true,
            "Refuse to run code if no namespace-based sandbox is available");
