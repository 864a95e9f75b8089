#ifndef FRONTEND_JSON_HPP
#define FRONTEND_JSON_HPP

#include <string>

#include "proto/coderun.pb.h"

namespace frontend {

// Renders a response in the JSON shape of the web interface:
//   {"output": string|null, "error": string|null, "success": bool}
// for executions, {"html_preview": string} for previews and
// {"error": string} for rejected requests.
std::string ToJson(const proto::ExecutionResponse& response);

// Renders the table of supported languages.
std::string ToJson(const proto::LanguagesResponse& languages);

// Whether the response is a preview or an execution without errors.
bool IsSuccess(const proto::ExecutionResponse& response);

}  // namespace frontend

#endif
