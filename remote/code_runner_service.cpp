#include "remote/code_runner_service.hpp"

#include "absl/strings/match.h"
#include "executor/language.hpp"
#include "glog/logging.h"

namespace remote {

std::string ClientAddress(const std::string& peer) {
  if (absl::StartsWith(peer, "ipv4:")) {
    std::string address = peer.substr(5);
    return address.substr(0, address.find_last_of(':'));
  }
  if (absl::StartsWith(peer, "ipv6:")) {
    std::string address = peer.substr(5);
    size_t end = address.find(']');
    if (!address.empty() && address[0] == '[' && end != std::string::npos) {
      return address.substr(1, end - 1);
    }
    return address;
  }
  return peer;
}

grpc::Status CodeRunnerService::Execute(grpc::ServerContext* context,
                                        const proto::ExecutionRequest* request,
                                        proto::ExecutionResponse* response) {
  return HandleExecute(context->peer(), *request, response);
}

grpc::Status CodeRunnerService::HandleExecute(
    const std::string& peer, const proto::ExecutionRequest& request,
    proto::ExecutionResponse* response) {
  std::string client =
      request.client_id().empty() ? ClientAddress(peer) : request.client_id();
  if (!rate_limiter_->Allow(client)) {
    return grpc::Status(grpc::StatusCode::RESOURCE_EXHAUSTED,
                        "Rate limit exceeded. Please try again later.");
  }
  try {
    *response = executor_->Execute(request);
    return grpc::Status::OK;
  } catch (const std::exception& e) {
    LOG(ERROR) << "Execute from " << client << ": " << e.what();
    return grpc::Status(grpc::StatusCode::INTERNAL, "Internal server error");
  }
}

grpc::Status CodeRunnerService::Languages(
    grpc::ServerContext* /*context*/,
    const proto::LanguagesRequest* /*request*/,
    proto::LanguagesResponse* response) {
  for (const proto::LanguageInfo& info : executor::SupportedLanguages()) {
    *response->add_language() = info;
  }
  return grpc::Status::OK;
}

}  // namespace remote
