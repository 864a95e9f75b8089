#include "util/file.hpp"

#include <errno.h>
#include <fcntl.h>
#include <ftw.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fstream>
#include <memory>

namespace {

static const constexpr char* kPathSeparators = "/";
static const constexpr size_t kChunkSize = 32 * 1024;
static const constexpr char* kScratchPrefix = "coderun_";

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemove(const std::string& path) { return remove(path.c_str()) != -1; }

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* sb, int typeflags,
                 struct FTW* ftwbuf) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) != -1;
}

std::string OsTempDir(const std::string& path) {
  std::string tmp = util::File::JoinPath(path, "XXXXXX");
  std::unique_ptr<char[]> data{strdup(tmp.c_str())};
  if (mkdtemp(data.get()) == nullptr) {
    return "";
  }
  return data.get();
}

// Returns the file descriptor of the new file, or -1 with errno set.
int OsTempFile(const std::string& dir, const std::string& suffix,
               std::string* tmp) {
  *tmp = util::File::JoinPath(dir, std::string(kScratchPrefix) + "XXXXXX") +
         suffix;
  std::unique_ptr<char[]> data{strdup(tmp->c_str())};
  int fd = mkostemps(data.get(), suffix.size(), O_CLOEXEC);
  *tmp = data.get();
  return fd;
}

// Returns errno, or 0 on success.
int OsRead(const std::string& path, std::string* contents) {
  int fd = open(path.c_str(), O_CLOEXEC | O_RDONLY);
  if (fd == -1) return errno;
  char buf[kChunkSize] = {};
  ssize_t amount;
  while ((amount = read(fd, buf, kChunkSize))) {
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) break;
    contents->append(buf, amount);
  }
  if (amount == -1) {
    int error = errno;
    close(fd);
    return error;
  }
  return close(fd) == -1 ? errno : 0;
}

// Returns errno, or 0 on success.
int OsWrite(const std::string& path, const std::string& contents) {
  int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                S_IRUSR | S_IWUSR);
  if (fd == -1) return errno;
  size_t pos = 0;
  while (pos < contents.size()) {
    ssize_t written = write(fd, contents.c_str() + pos, contents.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) {
      int error = errno;
      close(fd);
      return error;
    }
    pos += written;
  }
  return close(fd) == -1 ? errno : 0;
}

}  // namespace

namespace util {

std::string File::Read(const std::string& path) {
  std::string contents;
  int err = OsRead(path, &contents);
  if (err) throw std::system_error(err, std::system_category(), "Read " + path);
  return contents;
}

void File::Write(const std::string& path, const std::string& contents) {
  int err = OsWrite(path, contents);
  if (err)
    throw std::system_error(err, std::system_category(), "Write " + path);
}

void File::MakeDirs(const std::string& path) {
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir " + path);
    }
  }
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (!second.empty() && strchr(kPathSeparators, second[0])) return second;
  if (!first.empty() && strchr(kPathSeparators, first.back()))
    return first + second;
  return first + kPathSeparators[0] + second;
}

std::string File::Absolute(const std::string& path) {
  std::unique_ptr<char, decltype(&free)> resolved{
      realpath(path.c_str(), nullptr), &free};
  if (!resolved)
    throw std::system_error(errno, std::system_category(), "realpath " + path);
  return resolved.get();
}

int64_t File::Size(const std::string& path) {
  std::ifstream fin(path, std::ios::ate | std::ios::binary);
  if (!fin) return -1;
  return fin.tellg();
}

TempDir::TempDir(const std::string& base) {
  path_ = OsTempDir(base);
  if (path_ == "")
    throw std::system_error(errno, std::system_category(), "mkdtemp");
}
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {
  if (path_.empty()) return;
  OsRemoveTree(path_);
}

ScratchFile::ScratchFile(const std::string& dir, const std::string& suffix) {
  int fd = OsTempFile(dir, suffix, &path_);
  if (fd == -1) {
    int error = errno;
    path_.clear();
    throw std::system_error(error, std::system_category(),
                            "mkostemps " + dir);
  }
  close(fd);
}

ScratchFile ScratchFile::Adopt(std::string path) {
  ScratchFile file;
  file.path_ = std::move(path);
  return file;
}

ScratchFile::ScratchFile(ScratchFile&& other) noexcept
    : path_(std::move(other.path_)) {
  other.path_.clear();
}

ScratchFile& ScratchFile::operator=(ScratchFile&& other) noexcept {
  if (this != &other) {
    Release();
    path_ = std::move(other.path_);
    other.path_.clear();
  }
  return *this;
}

ScratchFile::~ScratchFile() { Release(); }

void ScratchFile::Release() {
  if (path_.empty()) return;
  // The file may legitimately be missing, e.g. a binary that was never
  // produced because compilation failed.
  OsRemove(path_);
  path_.clear();
}

}  // namespace util
