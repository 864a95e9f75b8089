#include "executor/runner.hpp"

#include <string.h>

#include "absl/memory/memory.h"
#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "util/file.hpp"
#include "util/utf8.hpp"
#include "util/which.hpp"

namespace executor {

namespace {

// Runs the source file directly with an interpreter.
class InterpretedRunner : public Runner {
 public:
  InterpretedRunner(const ExecutorConfig& config, std::string interpreter,
                    std::string extension, std::vector<std::string> env)
      : Runner(config),
        interpreter_(std::move(interpreter)),
        extension_(std::move(extension)),
        env_(std::move(env)) {}

 protected:
  RunOutput DoRun(const std::string& code) override;

 private:
  std::string interpreter_;
  std::string extension_;
  std::vector<std::string> env_;
};

// Compiles the source file to a binary and runs the binary.
class CompiledRunner : public Runner {
 public:
  CompiledRunner(const ExecutorConfig& config, std::string compiler,
                 std::string extension, std::vector<std::string> flags,
                 std::vector<std::string> env)
      : Runner(config),
        compiler_(std::move(compiler)),
        extension_(std::move(extension)),
        flags_(std::move(flags)),
        env_(std::move(env)) {}

 protected:
  RunOutput DoRun(const std::string& code) override;

 private:
  std::string compiler_;
  std::string extension_;
  std::vector<std::string> flags_;
  std::vector<std::string> env_;
};

RunOutput InterpretedRunner::DoRun(const std::string& code) {
  std::string interpreter = util::which(interpreter_);
  if (interpreter.empty()) {
    LOG(ERROR) << "Interpreter " << interpreter_ << " not found";
    return RunOutput::Error("interpreter " + interpreter_ + " not found");
  }

  util::ScratchFile source(config_.temp_directory, extension_);
  util::File::Write(source.Path(), code);

  Capture capture;
  std::string error_msg;
  if (!Launch(interpreter, {source.Path()}, env_, &capture, &error_msg)) {
    LOG(ERROR) << "Cannot run " << interpreter << ": " << error_msg;
    return RunOutput::Error(error_msg);
  }
  if (capture.info.timed_out) return RunOutput::TimedOut();
  return Completed(capture);
}

RunOutput CompiledRunner::DoRun(const std::string& code) {
  std::string compiler = util::which(compiler_);
  if (compiler.empty()) {
    LOG(ERROR) << "Compiler " << compiler_ << " not found";
    RunOutput output;
    output.status = proto::FAILED;
    output.stderr_text = "C compiler not found: " + compiler_ +
                         ". Please install it to run C code.";
    return output;
  }

  util::ScratchFile source(config_.temp_directory, extension_);
  // The source name is unique, and so is its stem.
  util::ScratchFile binary = util::ScratchFile::Adopt(source.Path().substr(
      0, source.Path().size() - extension_.size()));
  util::File::Write(source.Path(), code);

  std::vector<std::string> args = {source.Path(), "-o", binary.Path()};
  args.insert(args.end(), flags_.begin(), flags_.end());

  Capture compilation;
  std::string error_msg;
  if (!Launch(compiler, args, env_, &compilation, &error_msg)) {
    LOG(ERROR) << "Cannot run " << compiler << ": " << error_msg;
    return RunOutput::Error(error_msg);
  }
  if (compilation.info.timed_out) {
    LOG(WARNING) << "Compilation of " << source.Path() << " timed out";
    return RunOutput::TimedOut();
  }
  if (compilation.info.status_code != 0 || compilation.info.signal != 0) {
    VLOG(1) << "Compilation of " << source.Path() << " failed with status "
            << compilation.info.status_code;
    if (!util::IsValidUtf8(compilation.stderr_text)) {
      return RunOutput::Error(kInvalidOutputMessage);
    }
    RunOutput output;
    output.status = proto::FAILED;
    output.stderr_text = compilation.stderr_text.empty()
                             ? "Compilation failed"
                             : compilation.stderr_text;
    return output;
  }

  Capture execution;
  if (!Launch(binary.Path(), {}, env_, &execution, &error_msg)) {
    LOG(ERROR) << "Cannot run " << binary.Path() << ": " << error_msg;
    return RunOutput::Error(error_msg);
  }
  if (execution.info.timed_out) return RunOutput::TimedOut();
  return Completed(execution);
}

}  // namespace

void RunOutput::ToProto(proto::ExecutionResult* result) const {
  if (stdout_text) result->set_stdout_text(*stdout_text);
  if (stderr_text) result->set_stderr_text(*stderr_text);
  result->set_success(Success());
  result->set_status(status);
}

RunOutput RunOutput::TimedOut() {
  RunOutput output;
  output.stderr_text = kTimedOutMessage;
  output.status = proto::TIMED_OUT;
  return output;
}

RunOutput RunOutput::Error(const std::string& message) {
  RunOutput output;
  output.stderr_text = "Execution error: " + message;
  output.status = proto::FAILED;
  return output;
}

// static
std::unique_ptr<Runner> Runner::ForLanguage(proto::Language language,
                                            const ExecutorConfig& config) {
  std::string path_var = "PATH=" + config.child_path;
  switch (language) {
    case proto::PYTHON:
      return absl::make_unique<InterpretedRunner>(
          config, config.python_interpreter, ".py",
          std::vector<std::string>{path_var, "PYTHONPATH="});
    case proto::C:
      return absl::make_unique<CompiledRunner>(
          config, config.c_compiler, ".c",
          std::vector<std::string>{"-Wall", "-Wextra"},
          std::vector<std::string>{path_var});
    default:
      return nullptr;
  }
}

RunOutput Runner::Run(const std::string& code) {
  try {
    return DoRun(code);
  } catch (const std::exception& e) {
    LOG(ERROR) << "Execution error: " << e.what();
    return RunOutput::Error(e.what());
  }
}

bool Runner::Launch(const std::string& executable,
                    const std::vector<std::string>& args,
                    const std::vector<std::string>& env, Capture* capture,
                    std::string* error_msg) {
  util::ScratchFile stdout_file(config_.temp_directory, ".stdout");
  util::ScratchFile stderr_file(config_.temp_directory, ".stderr");

  sandbox::ExecutionOptions options(config_.work_directory, executable);
  options.args = args;
  options.env = env;
  sandbox::ResourceLimits& limits = options.limits;
  limits.wall_millis =
      static_cast<int64_t>(config_.execution_timeout_seconds) * 1000;
  limits.cpu_seconds = config_.cpu_limit_seconds;
  limits.address_space_kb = config_.memory_limit_kb;
  limits.file_size_kb = config_.max_file_size_kb;
  limits.stack_kb = config_.max_stack_kb;
  limits.open_files = config_.max_open_files;
  limits.processes = config_.max_procs;
  options.stdout_file = stdout_file.Path();
  options.stderr_file = stderr_file.Path();

  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
  if (!sb) {
    *error_msg = "no sandbox available";
    return false;
  }
  VLOG(1) << "Running " << executable << " in " << options.root;
  if (!sb->Execute(options, &capture->info, error_msg)) return false;
  VLOG(1) << executable << " finished in " << capture->info.wall_time_millis
          << "ms with status " << capture->info.status_code << " signal "
          << capture->info.signal;
  if (!capture->info.timed_out) {
    capture->stdout_text = util::File::Read(stdout_file.Path());
    capture->stderr_text = util::File::Read(stderr_file.Path());
  }
  return true;
}

// static
RunOutput Runner::Completed(const Capture& capture) {
  if (!util::IsValidUtf8(capture.stdout_text) ||
      !util::IsValidUtf8(capture.stderr_text)) {
    VLOG(1) << "Discarding output that is not valid UTF-8";
    return RunOutput::Error(kInvalidOutputMessage);
  }
  RunOutput output;
  output.stdout_text = capture.stdout_text;
  std::string stderr_text = capture.stderr_text;
  if (capture.info.signal != 0) {
    // A program killed by a signal usually leaves nothing on stderr.
    if (!stderr_text.empty() && stderr_text.back() != '\n') stderr_text += '\n';
    absl::StrAppend(&stderr_text, "Program terminated by signal ",
                    capture.info.signal, " (", strsignal(capture.info.signal),
                    ")");
  }
  if (!stderr_text.empty()) output.stderr_text = std::move(stderr_text);
  return output;
}

}  // namespace executor
