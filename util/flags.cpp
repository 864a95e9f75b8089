#include "util/flags.hpp"

DEFINE_int32(execution_timeout_seconds, 10,
             "Wall clock limit for every compilation and execution");
DEFINE_int32(max_code_length, 50000,
             "Maximum number of characters of submitted code");
DEFINE_string(denied_patterns,
              "import os,import sys,import subprocess,eval(,exec(,__import__,"
              "globals(),locals(),open(,file(,system(,popen(,spawn(,fork(,"
              "kill(",
              "Comma separated list of substrings that cause code to be "
              "rejected. This is a heuristic filter, not a sandbox");
DEFINE_int32(cpu_limit_seconds, 0,
             "CPU time limit for child processes, on top of the wall clock "
             "limit. If 0, unlimited");
DEFINE_int64(memory_limit_kb, 0,
             "Address space limit for child processes. If 0, unlimited");
DEFINE_int64(max_file_size_kb, 0,
             "Maximum size of files written by child processes, captured "
             "output included. If 0, unlimited");
DEFINE_int64(max_stack_kb, 0,
             "Stack size limit for child processes. If 0, inherited");
DEFINE_int32(max_open_files, 0,
             "Maximum number of file descriptors of a child process. If 0, "
             "inherited");
DEFINE_int32(max_procs, 0,
             "Maximum number of processes of the user running the child. If "
             "0, unlimited");
DEFINE_int32(max_concurrent_executions, 0,
             "Number of child processes that may run at the same time. If "
             "unset, autodetect");

DEFINE_string(temp_directory, "/tmp",
              "Where scratch sources, binaries and outputs are created");
DEFINE_string(work_directory, "/tmp",
              "Working directory of the child processes");
DEFINE_string(child_path, "/usr/bin:/bin", "PATH given to child processes");
DEFINE_string(python_interpreter, "python3", "Interpreter for Python code");
DEFINE_string(c_compiler, "gcc", "Compiler for C code");

DEFINE_int32(rate_limit_requests, 50,
             "Requests allowed per client in every window. If 0, unlimited");
DEFINE_int32(rate_limit_window_seconds, 3600, "Rate limiting window");
