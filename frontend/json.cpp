#include "frontend/json.hpp"

#include <stdexcept>

#include "google/protobuf/util/json_util.h"
#include "util/utf8.hpp"

namespace frontend {

namespace {

// JSON strings must be UTF-8: the printer would silently cut the text short
// at the first invalid byte.
void SetString(google::protobuf::Value* value, const std::string* text) {
  if (text) {
    value->set_string_value(util::ToValidUtf8(*text));
  } else {
    value->set_null_value(google::protobuf::NULL_VALUE);
  }
}

std::string Print(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
  std::string json;
  auto status =
      google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Cannot render JSON: " + status.ToString());
  }
  return json;
}

}  // namespace

std::string ToJson(const proto::ExecutionResponse& response) {
  proto::JsonReply reply;
  switch (response.outcome_case()) {
    case proto::ExecutionResponse::kResult: {
      const proto::ExecutionResult& result = response.result();
      SetString(reply.mutable_output(),
                result.has_stdout_text() ? &result.stdout_text() : nullptr);
      // An empty stderr is reported as no error at all.
      SetString(reply.mutable_error(),
                result.has_stderr_text() && !result.stderr_text().empty()
                    ? &result.stderr_text()
                    : nullptr);
      reply.set_success(result.success());
      break;
    }
    case proto::ExecutionResponse::kHtmlPreview:
      reply.set_html_preview(util::ToValidUtf8(response.html_preview()));
      break;
    case proto::ExecutionResponse::kRejection:
      SetString(reply.mutable_error(), &response.rejection().message());
      break;
    default:
      reply.mutable_error()->set_string_value("Internal server error");
      break;
  }
  return Print(reply);
}

std::string ToJson(const proto::LanguagesResponse& languages) {
  return Print(languages);
}

bool IsSuccess(const proto::ExecutionResponse& response) {
  switch (response.outcome_case()) {
    case proto::ExecutionResponse::kResult:
      return response.result().success();
    case proto::ExecutionResponse::kHtmlPreview:
      return true;
    default:
      return false;
  }
}

}  // namespace frontend
