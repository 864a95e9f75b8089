#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP
#include "sandbox/sandbox.hpp"

namespace sandbox {

// Sandbox for UNIX-like systems. It only provides rlimits, a wall time limit
// and a process group that is killed as a whole: there is no isolation of
// the filesystem, the network or other users.
class Unix : public Sandbox {
 public:
  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg) override;
  static Sandbox* Create() { return new Unix(); }
  static int Score() { return 2; }

 protected:
  Unix() = default;

  // Executed before creating the child process. Prepares everything the child
  // needs, so that it does not allocate memory. Returns false and sets
  // error_msg if setup fails.
  bool Setup(std::string* error_msg);

  // Creates a child process and saves its PID in child_pid_. The child process
  // executes Child and does not return.
  bool DoFork(std::string* error_msg);

  // Function that is executed in the child process.
  [[noreturn]] void Child();

  // Waits for the termination of the child, killing its whole process group if
  // it exceeds the provided wall time limit.
  bool Wait(ExecutionInfo* info, std::string* error_msg);

  // Sends SIGKILL to every process in the child's process group.
  void KillGroup();

  int pipe_fds_[2] = {};
  int child_pid_ = 0;
  const ExecutionOptions* options_ = nullptr;
  std::vector<std::vector<char>> arg_storage_;
  std::vector<char*> argv_;
  std::vector<std::vector<char>> env_storage_;
  std::vector<char*> envp_;
};

}  // namespace sandbox
#endif
