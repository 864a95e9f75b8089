#include <chrono>
#include <memory>
#include <string>
#include <system_error>

#include "absl/memory/memory.h"
#include "executor/local_executor.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "grpc++/security/server_credentials.h"
#include "grpc++/server.h"
#include "grpc++/server_builder.h"
#include "remote/code_runner_service.hpp"
#include "remote/rate_limiter.hpp"
#include "util/flags.hpp"

DEFINE_string(address, "0.0.0.0", "address to listen on");  // NOLINT
DEFINE_int32(port, 7070, "port to listen on");                // NOLINT

int main(int argc, char** argv) {
  gflags::SetUsageMessage("Serves code execution requests over gRPC");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  std::unique_ptr<executor::LocalExecutor> local_executor;
  try {
    local_executor = absl::make_unique<executor::LocalExecutor>(
        executor::ExecutorConfig::FromFlags());
  } catch (const std::system_error& e) {
    LOG(ERROR) << "Cannot set up the executor: " << e.what();
    return 1;
  }
  remote::FixedWindowRateLimiter rate_limiter(
      FLAGS_rate_limit_requests,
      std::chrono::seconds(FLAGS_rate_limit_window_seconds));
  remote::CodeRunnerService service(local_executor.get(), &rate_limiter);

  std::string server_address = FLAGS_address + ":" + std::to_string(FLAGS_port);
  grpc::ServerBuilder builder;
  builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
  if (!server) {
    LOG(ERROR) << "Cannot listen on " << server_address;
    return 1;
  }
  LOG(INFO) << "Server listening on " << server_address;
  server->Wait();
}
