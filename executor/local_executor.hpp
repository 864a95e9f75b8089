#ifndef EXECUTOR_LOCAL_EXECUTOR_HPP
#define EXECUTOR_LOCAL_EXECUTOR_HPP

#include <condition_variable>
#include <mutex>

#include "executor/config.hpp"
#include "executor/executor.hpp"
#include "executor/validator.hpp"

namespace executor {

// Executes code with child processes on this machine.
class LocalExecutor : public Executor {
 public:
  std::string Id() const override { return "LOCAL"; }
  proto::ExecutionResponse Execute(
      const proto::ExecutionRequest& request) override;

  // Creates the scratch and working directories if needed. Relative
  // directories are made absolute, as children run in another directory.
  explicit LocalExecutor(ExecutorConfig config);
  LocalExecutor(const LocalExecutor&) = delete;
  LocalExecutor& operator=(const LocalExecutor&) = delete;
  LocalExecutor(LocalExecutor&&) = delete;
  LocalExecutor& operator=(LocalExecutor&&) = delete;
  ~LocalExecutor() override = default;

  const ExecutorConfig& Config() const { return config_; }

 private:
  // Holds one of the execution slots for its lifetime, waiting for one to
  // become free if needed.
  class ThreadGuard {
   public:
    explicit ThreadGuard(LocalExecutor* executor);
    ~ThreadGuard();
    ThreadGuard(const ThreadGuard&) = delete;
    ThreadGuard& operator=(const ThreadGuard&) = delete;
    ThreadGuard(ThreadGuard&&) = delete;
    ThreadGuard& operator=(ThreadGuard&&) = delete;

   private:
    LocalExecutor* executor_;
  };

  proto::ExecutionResponse Dispatch(const proto::ExecutionRequest& request);

  ExecutorConfig config_;
  Validator validator_;

  std::mutex slots_mutex_;
  std::condition_variable slot_available_;
  size_t max_threads_;
  size_t cur_threads_ = 0;
};

}  // namespace executor

#endif
