#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP

#include <cstdint>
#include <string>
#include <system_error>

namespace util {

class File {
 public:
  // Reads the whole file specified by path.
  static std::string Read(const std::string& path);

  // Replaces the contents of the file specified by path.
  static void Write(const std::string& path, const std::string& contents);

  // Creates all the folders that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Resolves path to an absolute path without symbolic links. The path must
  // exist.
  static std::string Absolute(const std::string& path);

  // Computes a file's size. Returns a negative number in case of errors.
  static int64_t Size(const std::string& path);
};

// A uniquely named directory, removed with its contents on destruction.
class TempDir {
 public:
  explicit TempDir(const std::string& base);
  const std::string& Path() const;
  ~TempDir();

  TempDir(TempDir&&) = default;
  TempDir& operator=(TempDir&&) = default;
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

 private:
  std::string path_;
};

// A file owned by a single execution. The file is removed when the object
// goes out of scope; failures to remove it are ignored.
class ScratchFile {
 public:
  // Creates a new empty file in dir, with a unique name ending in suffix.
  ScratchFile(const std::string& dir, const std::string& suffix);

  // Takes ownership of path, which does not need to exist yet.
  static ScratchFile Adopt(std::string path);

  const std::string& Path() const { return path_; }

  ~ScratchFile();
  ScratchFile(ScratchFile&& other) noexcept;
  ScratchFile& operator=(ScratchFile&& other) noexcept;
  ScratchFile(const ScratchFile&) = delete;
  ScratchFile& operator=(const ScratchFile&) = delete;

 private:
  ScratchFile() = default;
  void Release();

  std::string path_;
};

}  // namespace util

#endif
