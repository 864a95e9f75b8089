#ifndef REMOTE_CODE_RUNNER_SERVICE_HPP
#define REMOTE_CODE_RUNNER_SERVICE_HPP

#include <string>

#include "executor/executor.hpp"
#include "proto/coderun.grpc.pb.h"
#include "remote/rate_limiter.hpp"

namespace remote {

// Turns a gRPC peer such as "ipv4:127.0.0.1:5000" or "ipv6:[::1]:5000" into
// the address without the port. Other peers are returned unchanged.
std::string ClientAddress(const std::string& peer);

class CodeRunnerService : public proto::CodeRunner::Service {
 public:
  // Does not take ownership of its arguments, which must outlive the service.
  CodeRunnerService(executor::Executor* executor, RateLimiter* rate_limiter)
      : executor_(executor), rate_limiter_(rate_limiter) {}

  grpc::Status Execute(grpc::ServerContext* context,
                       const proto::ExecutionRequest* request,
                       proto::ExecutionResponse* response) override;

  grpc::Status Languages(grpc::ServerContext* context,
                         const proto::LanguagesRequest* request,
                         proto::LanguagesResponse* response) override;

  // Implementation of Execute, with the peer given explicitly.
  grpc::Status HandleExecute(const std::string& peer,
                             const proto::ExecutionRequest& request,
                             proto::ExecutionResponse* response);

 private:
  executor::Executor* executor_;
  RateLimiter* rate_limiter_;
};

}  // namespace remote

#endif
