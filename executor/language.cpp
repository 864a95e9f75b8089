#include "executor/language.hpp"

#include <algorithm>

#include "absl/strings/ascii.h"

namespace executor {

namespace {

std::string Extension(const std::string& filename) {
  std::string base = filename.substr(filename.find_last_of('/') + 1);
  size_t dot = base.find_last_of('.');
  // Hidden files such as ".py" have no extension.
  if (dot == std::string::npos || dot == 0) return "";
  return absl::AsciiStrToLower(base.substr(dot));
}

proto::LanguageInfo MakeInfo(proto::Language language, const char* name,
                             const char* extension, const char* syntax,
                             const char* starter_code) {
  proto::LanguageInfo info;
  info.set_language(language);
  info.set_id(LanguageId(language));
  info.set_name(name);
  info.set_extension(extension);
  info.set_syntax(syntax);
  info.set_starter_code(starter_code);
  return info;
}

}  // namespace

absl::optional<proto::Language> ParseLanguage(const std::string& name) {
  proto::Language language;
  // Only the exact lowercase identifiers are accepted.
  if (!proto::Language_Parse(absl::AsciiStrToUpper(name), &language) ||
      language == proto::UNKNOWN_LANGUAGE || LanguageId(language) != name) {
    return absl::nullopt;
  }
  return language;
}

std::string LanguageId(proto::Language language) {
  return absl::AsciiStrToLower(proto::Language_Name(language));
}

proto::Language LanguageFromFilename(const std::string& filename) {
  std::string ext = Extension(filename);
  if (ext == ".c") return proto::C;
  if (ext == ".html") return proto::HTML;
  if (ext == ".js") return proto::JAVASCRIPT;
  return proto::PYTHON;
}

bool IsAllowedUpload(const std::string& filename) {
  static const char* const kAllowed[] = {".py", ".c",  ".html",
                                         ".txt", ".js", ".css"};
  std::string ext = Extension(filename);
  return std::find(std::begin(kAllowed), std::end(kAllowed), ext) !=
         std::end(kAllowed);
}

const std::vector<proto::LanguageInfo>& SupportedLanguages() {
  static const std::vector<proto::LanguageInfo>* languages =
      new std::vector<proto::LanguageInfo>{
          MakeInfo(proto::PYTHON, "Python", ".py", "python",
                   "print(\"Hello, World!\")"),
          MakeInfo(proto::C, "C", ".c", "c",
                   "#include <stdio.h>\n\nint main() {\n    printf(\"Hello, "
                   "World!\\n\");\n    return 0;\n}"),
          MakeInfo(proto::HTML, "HTML", ".html", "html",
                   "<!DOCTYPE html>\n<html>\n<head>\n    <title>Hello "
                   "World</title>\n</head>\n<body>\n    <h1>Hello, "
                   "World!</h1>\n</body>\n</html>"),
          MakeInfo(proto::JAVASCRIPT, "JavaScript", ".js", "javascript",
                   "console.log(\"Hello, World!\");"),
      };
  return *languages;
}

}  // namespace executor
