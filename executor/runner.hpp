#ifndef EXECUTOR_RUNNER_HPP
#define EXECUTOR_RUNNER_HPP

#include <memory>
#include <string>
#include <vector>

#include "absl/types/optional.h"
#include "executor/config.hpp"
#include "proto/coderun.pb.h"
#include "sandbox/sandbox.hpp"

namespace executor {

static const constexpr char* kTimedOutMessage = "Execution timed out";
static const constexpr char* kInvalidOutputMessage =
    "program output is not valid UTF-8 text";

// What a runner reports back for one piece of code.
struct RunOutput {
  absl::optional<std::string> stdout_text;
  absl::optional<std::string> stderr_text;
  proto::Status status = proto::COMPLETED;

  bool Success() const { return !stderr_text || stderr_text->empty(); }
  void ToProto(proto::ExecutionResult* result) const;

  static RunOutput TimedOut();
  // "Execution error: <message>"
  static RunOutput Error(const std::string& message);
};

// Runs source code of a given language in child processes. Every file a run
// creates (source, binary, captured output) is removed before Run returns,
// whatever the outcome.
class Runner {
 public:
  // Returns the runner for a language that is executed on this machine, or
  // nullptr for languages that are not (HTML, JavaScript).
  static std::unique_ptr<Runner> ForLanguage(proto::Language language,
                                             const ExecutorConfig& config);

  // Runs code. Does not throw: any failure ends up in stderr_text.
  RunOutput Run(const std::string& code);

  virtual ~Runner() = default;
  Runner(const Runner&) = delete;
  Runner(Runner&&) = delete;
  Runner& operator=(const Runner&) = delete;
  Runner& operator=(Runner&&) = delete;

 protected:
  explicit Runner(ExecutorConfig config) : config_(std::move(config)) {}

  virtual RunOutput DoRun(const std::string& code) = 0;

  struct Capture {
    sandbox::ExecutionInfo info;
    std::string stdout_text;
    std::string stderr_text;
  };

  // Runs executable with the time limit, rlimits and working directory of the
  // configuration and with env as the whole environment. Output is captured
  // unless the program timed out. Returns false and sets error_msg if the
  // program could not be started.
  bool Launch(const std::string& executable,
              const std::vector<std::string>& args,
              const std::vector<std::string>& env, Capture* capture,
              std::string* error_msg);

  // Output of a program that ran to completion. Output that is not UTF-8
  // text turns into an error.
  static RunOutput Completed(const Capture& capture);

  ExecutorConfig config_;
};

}  // namespace executor

#endif
