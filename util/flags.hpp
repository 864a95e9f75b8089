#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

// Execution limits
DECLARE_int32(execution_timeout_seconds);
DECLARE_int32(max_code_length);
DECLARE_string(denied_patterns);
DECLARE_int32(cpu_limit_seconds);
DECLARE_int64(memory_limit_kb);
DECLARE_int64(max_file_size_kb);
DECLARE_int64(max_stack_kb);
DECLARE_int32(max_open_files);
DECLARE_int32(max_procs);
DECLARE_int32(max_concurrent_executions);

// Child process environment
DECLARE_string(temp_directory);
DECLARE_string(work_directory);
DECLARE_string(child_path);
DECLARE_string(python_interpreter);
DECLARE_string(c_compiler);

// Throttling
DECLARE_int32(rate_limit_requests);
DECLARE_int32(rate_limit_window_seconds);

#endif
