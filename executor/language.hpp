#ifndef EXECUTOR_LANGUAGE_HPP
#define EXECUTOR_LANGUAGE_HPP

#include <string>
#include <vector>

#include "absl/types/optional.h"
#include "proto/coderun.pb.h"

namespace executor {

// Parses a language identifier such as "python" or "c". Identifiers are case
// sensitive: "Python" is not a supported language.
absl::optional<proto::Language> ParseLanguage(const std::string& name);

// Lowercase identifier of the language, as accepted by ParseLanguage.
std::string LanguageId(proto::Language language);

// Guesses the language from the extension of a file name. Unknown extensions
// are treated as Python.
proto::Language LanguageFromFilename(const std::string& filename);

// Whether a file with this name may be loaded as source code.
bool IsAllowedUpload(const std::string& filename);

// Display information and starter code for every supported language.
const std::vector<proto::LanguageInfo>& SupportedLanguages();

}  // namespace executor

#endif
