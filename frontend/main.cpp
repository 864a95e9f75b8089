#include <chrono>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>

#include "executor/language.hpp"
#include "executor/local_executor.hpp"
#include "frontend/json.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "grpc++/channel.h"
#include "grpc++/client_context.h"
#include "grpc++/create_channel.h"
#include "grpc++/security/credentials.h"
#include "proto/coderun.grpc.pb.h"
#include "util/file.hpp"
#include "util/flags.hpp"

DEFINE_string(language, "",
              "Language of the code. If unset, it is guessed from the file "
              "name");  // NOLINT
DEFINE_string(server, "",
              "Address of a coderun_server to send the code to, instead of "
              "running it locally");                            // NOLINT
DEFINE_string(client_id, "", "Client identity sent to the server");  // NOLINT
DEFINE_int64(max_upload_kb, 16 * 1024, "Maximum size of the source file");
DEFINE_bool(list_languages, false, "Print the supported languages and exit");

namespace {

// Reads the code to run from path, or from stdin if path is "-". Returns false
// and sets error if the file cannot be used.
bool ReadSource(const std::string& path, std::string* code,
                std::string* error) {
  if (path == "-") {
    code->assign(std::istreambuf_iterator<char>(std::cin),
                 std::istreambuf_iterator<char>());
    return true;
  }
  if (!executor::IsAllowedUpload(path)) {
    *error = "Invalid file type. Allowed: .py, .c, .html, .txt, .js, .css";
    return false;
  }
  int64_t size = util::File::Size(path);
  if (size < 0) {
    *error = "Cannot open " + path;
    return false;
  }
  if (size > FLAGS_max_upload_kb * 1024) {
    *error = "File too large. Maximum size is " +
             std::to_string(FLAGS_max_upload_kb) + " KB.";
    return false;
  }
  *code = util::File::Read(path);
  return true;
}

std::unique_ptr<proto::CodeRunner::Stub> Connect() {
  return proto::CodeRunner::NewStub(
      grpc::CreateChannel(FLAGS_server, grpc::InsecureChannelCredentials()));
}

void CheckStatus(const grpc::Status& status) {
  if (!status.ok()) {
    throw std::runtime_error(FLAGS_server + ": " + status.error_message());
  }
}

proto::ExecutionResponse ExecuteRemotely(
    const proto::ExecutionRequest& request) {
  std::unique_ptr<proto::CodeRunner::Stub> stub = Connect();
  grpc::ClientContext context;
  // Compilation and execution may both take the whole time limit.
  context.set_deadline(
      std::chrono::system_clock::now() +
      std::chrono::seconds(2 * FLAGS_execution_timeout_seconds + 30));
  proto::ExecutionResponse response;
  CheckStatus(stub->Execute(&context, request, &response));
  return response;
}

proto::LanguagesResponse Languages() {
  proto::LanguagesResponse response;
  if (FLAGS_server.empty()) {
    for (const proto::LanguageInfo& info : executor::SupportedLanguages()) {
      *response.add_language() = info;
    }
    return response;
  }
  std::unique_ptr<proto::CodeRunner::Stub> stub = Connect();
  grpc::ClientContext context;
  CheckStatus(stub->Languages(&context, proto::LanguagesRequest(), &response));
  return response;
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage(
      "Runs a source file and prints the result as JSON.\n"
      "Usage: coderun [flags] <file|->");
  FLAGS_logtostderr = true;
  FLAGS_minloglevel = 1;  // WARNING
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  try {
    if (FLAGS_list_languages) {
      std::cout << frontend::ToJson(Languages()) << std::endl;
      return 0;
    }
    if (argc != 2) {
      gflags::ShowUsageWithFlagsRestrict(argv[0], "frontend");
      return 1;
    }

    std::string path = argv[1];
    proto::ExecutionRequest request;
    std::string error;
    if (!ReadSource(path, request.mutable_code(), &error)) {
      LOG(ERROR) << error;
      return 1;
    }
    request.set_language(
        FLAGS_language.empty()
            ? executor::LanguageId(executor::LanguageFromFilename(path))
            : FLAGS_language);
    request.set_client_id(FLAGS_client_id);

    proto::ExecutionResponse response;
    if (FLAGS_server.empty()) {
      executor::LocalExecutor local_executor(
          executor::ExecutorConfig::FromFlags());
      response = local_executor.Execute(request);
    } else {
      response = ExecuteRemotely(request);
    }
    std::cout << frontend::ToJson(response) << std::endl;
    return frontend::IsSuccess(response) ? 0 : 1;
  } catch (const std::exception& e) {
    LOG(ERROR) << e.what();
    return 1;
  }
}
