#ifndef EXECUTOR_VALIDATOR_HPP
#define EXECUTOR_VALIDATOR_HPP

#include <string>
#include <vector>

#include "absl/types/optional.h"
#include "executor/config.hpp"
#include "proto/coderun.pb.h"

namespace executor {

struct ValidationError {
  enum Kind { EMPTY_CODE, INVALID_ENCODING, TOO_LONG, DENIED_PATTERN };
  Kind kind;
  // User facing description of the problem.
  std::string message;
  // The denylisted substring that was found, for DENIED_PATTERN.
  std::string pattern;

  proto::Rejection ToProto() const;
};

// Rejects code that is blank, not UTF-8, too long or contains a denylisted
// substring. Blank means made only of Unicode whitespace.
//
// The denylist is a heuristic filter on the text of the code and is trivially
// bypassed (string concatenation, getattr, other spellings...). It is not a
// security boundary and must not be treated as one. Case folding is ASCII
// only: non-ASCII letters that lowercase to ASCII ones, such as the Kelvin
// sign, are not folded.
class Validator {
 public:
  explicit Validator(const ExecutorConfig& config);

  // Returns the first problem found in code, if any. The language is not
  // used: the same rules apply to every language.
  absl::optional<ValidationError> Validate(const std::string& code,
                                           const std::string& language) const;

 private:
  size_t max_code_length_;
  std::vector<std::string> denied_patterns_;
};

// Number of Unicode code points in a UTF-8 string. Invalid sequences are
// counted byte by byte.
size_t CodePointLength(const std::string& text);

// Whether text is empty or made only of whitespace code points, as defined by
// Unicode (White_Space property).
bool IsBlank(const std::string& text);

}  // namespace executor

#endif
