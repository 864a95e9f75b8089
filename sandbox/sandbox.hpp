#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace sandbox {

// Kernel limits applied to the child before exec. A zero field is not
// enforced.
struct ResourceLimits {
  int64_t cpu_seconds = 0;
  // Enforced by the parent, which kills the process group when it expires.
  int64_t wall_millis = 0;
  int64_t address_space_kb = 0;
  int32_t processes = 0;
  int32_t open_files = 0;
  int64_t file_size_kb = 0;
  int64_t stack_kb = 0;
};

// What to run and how. The child always reads from /dev/null.
struct ExecutionOptions {
  // Working directory of the child. A relative executable is looked up here.
  std::string root;
  std::string executable;
  std::vector<std::string> args;
  // NAME=value strings; this is the whole environment of the child.
  std::vector<std::string> env;
  // Files that receive the output streams, truncated first. Empty means the
  // stream is shared with the caller.
  std::string stdout_file;
  std::string stderr_file;
  ResourceLimits limits;

  ExecutionOptions(std::string root, std::string executable)
      : root(std::move(root)), executable(std::move(executable)) {}
};

// Outcome of a program that was started.
struct ExecutionInfo {
  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
  int64_t wall_time_millis = 0;
  int32_t status_code = 0;
  // Non zero if the program died because of a signal.
  int32_t signal = 0;
  bool timed_out = false;
};

// Runs programs under resource limits. Each implementation registers itself
// with a static Sandbox::Register<Impl>, providing Impl::Create to build an
// instance and Impl::Score to rate it: Create() picks the registered sandbox
// with the highest positive score, once per process. Registration happens
// during static initialization, before any thread exists.
class Sandbox {
 public:
  using create_t = std::function<Sandbox*()>;
  using score_t = std::function<int()>;
  static std::unique_ptr<Sandbox> Create();

  // Runs the program and waits for it. Returns false, with the reason in
  // error_msg, only if it could not be started; a crash or a timeout still
  // returns true and is described by info. One instance runs one program at a
  // time.
  virtual bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) = 0;

  virtual ~Sandbox() = default;
  Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;

  template <typename T>
  class Register {
   public:
    Register() { Sandbox::Register_(&T::Create, &T::Score); }
  };

 private:
  using store_t = std::vector<std::pair<create_t, score_t>>;
  static store_t* Boxes_();
  static void Register_(create_t, score_t);
  template <typename T>
  friend class Register;
};

}  // namespace sandbox

#endif
