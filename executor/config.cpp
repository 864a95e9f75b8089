#include "executor/config.hpp"

#include "absl/strings/str_split.h"
#include "util/flags.hpp"

namespace executor {

std::vector<std::string> ExecutorConfig::DefaultDeniedPatterns() {
  return {"import os", "import sys", "import subprocess", "eval(",
          "exec(",     "__import__", "globals()",         "locals()",
          "open(",     "file(",      "system(",           "popen(",
          "spawn(",    "fork(",      "kill("};
}

ExecutorConfig ExecutorConfig::FromFlags() {
  ExecutorConfig config;
  config.execution_timeout_seconds = FLAGS_execution_timeout_seconds;
  config.max_code_length = FLAGS_max_code_length;
  config.denied_patterns =
      absl::StrSplit(FLAGS_denied_patterns, ',', absl::SkipEmpty());
  config.temp_directory = FLAGS_temp_directory;
  config.work_directory = FLAGS_work_directory;
  config.child_path = FLAGS_child_path;
  config.python_interpreter = FLAGS_python_interpreter;
  config.c_compiler = FLAGS_c_compiler;
  config.cpu_limit_seconds = FLAGS_cpu_limit_seconds;
  config.memory_limit_kb = FLAGS_memory_limit_kb;
  config.max_file_size_kb = FLAGS_max_file_size_kb;
  config.max_stack_kb = FLAGS_max_stack_kb;
  config.max_open_files = FLAGS_max_open_files;
  config.max_procs = FLAGS_max_procs;
  config.max_concurrent_executions = FLAGS_max_concurrent_executions;
  return config;
}

}  // namespace executor
