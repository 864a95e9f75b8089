#include "executor/local_executor.hpp"

#include <stdexcept>
#include <thread>

#include "executor/language.hpp"
#include "executor/runner.hpp"
#include "glog/logging.h"
#include "util/file.hpp"
#include "util/utf8.hpp"

namespace executor {

namespace {
// JavaScript is never run here: it is meant for the console of the browser
// showing the result.
std::string JavaScriptEcho(const std::string& code) {
  return "JavaScript code:\n" + code +
         "\n\n(JavaScript execution in browser console)";
}
}  // namespace

proto::ExecutionResponse LocalExecutor::Execute(
    const proto::ExecutionRequest& request) {
  try {
    return Dispatch(request);
  } catch (const std::exception& e) {
    LOG(ERROR) << "Execution error: " << e.what();
    proto::ExecutionResponse response;
    RunOutput::Error(e.what()).ToProto(response.mutable_result());
    return response;
  }
}

proto::ExecutionResponse LocalExecutor::Dispatch(
    const proto::ExecutionRequest& request) {
  LOG(INFO) << "Execution request: language=" << request.language()
            << " size=" << request.code().size();
  proto::ExecutionResponse response;

  absl::optional<ValidationError> error =
      validator_.Validate(request.code(), request.language());
  if (error) {
    LOG(INFO) << "Request rejected: " << error->message;
    *response.mutable_rejection() = error->ToProto();
    return response;
  }

  absl::optional<proto::Language> language =
      ParseLanguage(request.language());
  if (!language) {
    LOG(INFO) << "Unsupported language: " << request.language();
    proto::Rejection* rejection = response.mutable_rejection();
    rejection->set_kind(proto::UNSUPPORTED_LANGUAGE);
    rejection->set_message("Unsupported language: " +
                           util::ToValidUtf8(request.language()));
    return response;
  }

  switch (*language) {
    case proto::HTML:
      response.set_html_preview(request.code());
      return response;
    case proto::JAVASCRIPT: {
      proto::ExecutionResult* result = response.mutable_result();
      result->set_stdout_text(JavaScriptEcho(request.code()));
      result->set_success(true);
      result->set_status(proto::SKIPPED);
      return response;
    }
    default:
      break;
  }

  std::unique_ptr<Runner> runner = Runner::ForLanguage(*language, config_);
  if (!runner) {
    throw std::logic_error("No runner for " + LanguageId(*language));
  }
  RunOutput output;
  {
    ThreadGuard guard(this);
    output = runner->Run(request.code());
  }
  if (output.status == proto::TIMED_OUT) {
    LOG(WARNING) << LanguageId(*language) << " execution timed out after "
                 << config_.execution_timeout_seconds << "s";
  }
  output.ToProto(response.mutable_result());
  return response;
}

LocalExecutor::LocalExecutor(ExecutorConfig config)
    : config_(std::move(config)), validator_(config_) {
  util::File::MakeDirs(config_.temp_directory);
  util::File::MakeDirs(config_.work_directory);
  config_.temp_directory = util::File::Absolute(config_.temp_directory);
  config_.work_directory = util::File::Absolute(config_.work_directory);

  if (config_.max_concurrent_executions > 0) {
    max_threads_ = config_.max_concurrent_executions;
  } else {
    max_threads_ = std::thread::hardware_concurrency();
  }
  if (max_threads_ == 0) max_threads_ = 1;
}

LocalExecutor::ThreadGuard::ThreadGuard(LocalExecutor* executor)
    : executor_(executor) {
  std::unique_lock<std::mutex> lck(executor_->slots_mutex_);
  executor_->slot_available_.wait(lck, [this]() {
    return executor_->cur_threads_ < executor_->max_threads_;
  });
  executor_->cur_threads_++;
}

LocalExecutor::ThreadGuard::~ThreadGuard() {
  std::lock_guard<std::mutex> lck(executor_->slots_mutex_);
  executor_->cur_threads_--;
  executor_->slot_available_.notify_one();
}

}  // namespace executor
