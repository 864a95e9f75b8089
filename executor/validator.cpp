#include "executor/validator.hpp"

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "util/utf8.hpp"

namespace executor {

proto::Rejection ValidationError::ToProto() const {
  proto::Rejection rejection;
  switch (kind) {
    case EMPTY_CODE:
      rejection.set_kind(proto::EMPTY_CODE);
      break;
    case INVALID_ENCODING:
      rejection.set_kind(proto::INVALID_ENCODING);
      break;
    case TOO_LONG:
      rejection.set_kind(proto::TOO_LONG);
      break;
    case DENIED_PATTERN:
      rejection.set_kind(proto::DENIED_PATTERN);
      rejection.set_pattern(pattern);
      break;
  }
  rejection.set_message(message);
  return rejection;
}

Validator::Validator(const ExecutorConfig& config)
    : max_code_length_(config.max_code_length < 0 ? 0
                                                  : config.max_code_length) {
  for (const std::string& pattern : config.denied_patterns) {
    if (!pattern.empty())
      denied_patterns_.push_back(absl::AsciiStrToLower(pattern));
  }
}

absl::optional<ValidationError> Validator::Validate(
    const std::string& code, const std::string& /*language*/) const {
  if (!util::IsValidUtf8(code)) {
    return ValidationError{ValidationError::INVALID_ENCODING,
                           "Code must be valid UTF-8 text", ""};
  }
  if (IsBlank(code)) {
    return ValidationError{ValidationError::EMPTY_CODE, "Code cannot be empty",
                           ""};
  }

  if (CodePointLength(code) > max_code_length_) {
    return ValidationError{
        ValidationError::TOO_LONG,
        absl::StrCat("Code too long. Maximum ", max_code_length_,
                     " characters allowed."),
        ""};
  }

  std::string code_lower = absl::AsciiStrToLower(code);
  for (const std::string& pattern : denied_patterns_) {
    if (absl::StrContains(code_lower, pattern)) {
      return ValidationError{
          ValidationError::DENIED_PATTERN,
          absl::StrCat("Potentially dangerous code detected: ", pattern),
          pattern};
    }
  }
  return absl::nullopt;
}

size_t CodePointLength(const std::string& text) {
  size_t length = 0;
  uint32_t code_point = 0;
  for (size_t pos = 0; pos < text.size(); length++) {
    size_t width = util::DecodeUtf8(text, pos, &code_point);
    pos += width ? width : 1;
  }
  return length;
}

bool IsBlank(const std::string& text) {
  uint32_t c = 0;
  for (size_t pos = 0; pos < text.size();) {
    size_t width = util::DecodeUtf8(text, pos, &c);
    if (width == 0) return false;
    pos += width;
    bool space = (c >= 0x09 && c <= 0x0D) || c == 0x20 || c == 0x85 ||
                 c == 0xA0 || c == 0x1680 || (c >= 0x2000 && c <= 0x200A) ||
                 c == 0x2028 || c == 0x2029 || c == 0x202F || c == 0x205F ||
                 c == 0x3000;
    if (!space) return false;
  }
  return true;
}

}  // namespace executor
