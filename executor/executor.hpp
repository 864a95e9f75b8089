#ifndef EXECUTOR_EXECUTOR_HPP
#define EXECUTOR_EXECUTOR_HPP

#include <string>

#include "proto/coderun.pb.h"

namespace executor {

class Executor {
 public:
  // A string that identifies this executor.
  virtual std::string Id() const = 0;

  // Validates the request, then runs, previews or rejects the code depending
  // on its language. Failures of the execution itself are reported in the
  // response.
  virtual proto::ExecutionResponse Execute(
      const proto::ExecutionRequest& request) = 0;

  Executor() = default;
  virtual ~Executor() = default;
  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;
  Executor(Executor&&) = delete;
  Executor& operator=(Executor&&) = delete;
};

}  // namespace executor

#endif
