#ifndef EXECUTOR_CONFIG_HPP
#define EXECUTOR_CONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace executor {

// Everything the execution core needs to know about its environment. Nothing
// in the core reads flags directly.
struct ExecutorConfig {
  int32_t execution_timeout_seconds = 10;
  int32_t max_code_length = 50000;
  std::vector<std::string> denied_patterns = DefaultDeniedPatterns();

  // Scratch files are created here.
  std::string temp_directory = "/tmp";
  // Working directory of every child process.
  std::string work_directory = "/tmp";
  // Value of PATH inside child processes.
  std::string child_path = "/usr/bin:/bin";
  std::string python_interpreter = "python3";
  std::string c_compiler = "gcc";

  // Resource limits of every child process, compiler included. 0 disables
  // the limit.
  int32_t cpu_limit_seconds = 0;
  int64_t memory_limit_kb = 0;
  int64_t max_file_size_kb = 0;
  int64_t max_stack_kb = 0;
  int32_t max_open_files = 0;
  int32_t max_procs = 0;
  // If 0, the number of cores is used.
  int32_t max_concurrent_executions = 0;

  static std::vector<std::string> DefaultDeniedPatterns();

  // Builds a configuration from the command line flags in util/flags.hpp.
  static ExecutorConfig FromFlags();
};

}  // namespace executor

#endif
