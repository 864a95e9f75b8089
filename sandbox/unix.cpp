#include "sandbox/unix.hpp"

#include <chrono>
#include <thread>

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "glog/logging.h"

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

int MakePipe(int fds[2]) {
#ifdef __linux__
  return pipe2(fds, O_CLOEXEC);
#else
  if (pipe(fds) == -1) return -1;
  if (fcntl(fds[0], F_SETFD, FD_CLOEXEC) == -1 ||
      fcntl(fds[1], F_SETFD, FD_CLOEXEC) == -1) {
    close(fds[0]);
    close(fds[1]);
    return -1;
  }
  return 0;
#endif
}

void ToCharVector(const std::string& s,
                  std::vector<std::vector<char>>* storage) {
  storage->emplace_back(s.begin(), s.end());
  storage->back().push_back(0);
}

const auto kPollInterval = std::chrono::milliseconds(5);  // NOLINT
}  // namespace

namespace sandbox {

static const constexpr size_t kStrErrorBufSize = 2048;

bool Unix::Execute(const ExecutionOptions& options, ExecutionInfo* info,
                   std::string* error_msg) {
  options_ = &options;
  if (!Setup(error_msg)) return false;
  if (!DoFork(error_msg)) return false;
  if (!Wait(info, error_msg)) return false;
  return true;
}

bool Unix::Setup(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};

  arg_storage_.clear();
  argv_.clear();
  ToCharVector(options_->executable, &arg_storage_);
  for (const std::string& arg : options_->args)
    ToCharVector(arg, &arg_storage_);
  for (std::vector<char>& arg : arg_storage_) argv_.push_back(arg.data());
  argv_.push_back(nullptr);

  env_storage_.clear();
  envp_.clear();
  for (const std::string& var : options_->env)
    ToCharVector(var, &env_storage_);
  for (std::vector<char>& var : env_storage_) envp_.push_back(var.data());
  envp_.push_back(nullptr);

  if (MakePipe(pipe_fds_) == -1) {
    *error_msg = "pipe: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  return true;
}

bool Unix::DoFork(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = "fork: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    close(pipe_fds_[0]);
    close(pipe_fds_[1]);
    return false;
  }
  if (fork_result) {
    child_pid_ = fork_result;
    return true;
  }
  Child();
}

void Unix::Child() {
  close(pipe_fds_[0]);
  auto die2 = [this](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 2] = {};
    strncat(buf, prefix, 64);
    strncat(buf, ": ", 2);
    strncat(buf, err, kStrErrorBufSize);
    int len = strlen(buf);
    if (write(pipe_fds_[1], &len, sizeof(len)) == sizeof(len)) {
      // Nothing else can be done if this fails.
      (void)!write(pipe_fds_[1], buf, len);
    }
    close(pipe_fds_[1]);
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));
  };

  // New session and process group, so that the whole tree of processes can be
  // killed at once and Ctrl-Cs in the terminal do not reach it.
  if (setsid() == -1) die("setsid", errno);

  int stdin_fd = open("/dev/null", O_RDONLY);
  int stdout_fd = -1;
  int stderr_fd = -1;
  if (stdin_fd == -1) die("open /dev/null", errno);
  if (options_->stdout_file != "") {
    stdout_fd = open(options_->stdout_file.c_str(),
                     O_WRONLY | O_CREAT | O_TRUNC, S_IRUSR | S_IWUSR);
    if (stdout_fd == -1) die("open stdout", errno);
  }
  if (options_->stderr_file != "") {
    stderr_fd = open(options_->stderr_file.c_str(),
                     O_WRONLY | O_CREAT | O_TRUNC, S_IRUSR | S_IWUSR);
    if (stderr_fd == -1) die("open stderr", errno);
  }

  if (chdir(options_->root.c_str()) == -1) {
    die("chdir", errno);
  }

  // Handle I/O redirection.
#define DUP(field, fd)                          \
  if (field##_fd != -1) {                       \
    int ret = dup2(field##_fd, fd);             \
    if (ret == -1) die("redir " #field, errno); \
    if (field##_fd != fd) close(field##_fd);    \
  }
  DUP(stdin, STDIN_FILENO);
  DUP(stdout, STDOUT_FILENO);
  DUP(stderr, STDERR_FILENO);
#undef DUP

  // Set resource limits.
  struct rlimit rlim;
#define SET_RLIM(res, value)                    \
  {                                             \
    rlim_t lim = value;                         \
    if (lim) {                                  \
      rlim.rlim_cur = lim;                      \
      rlim.rlim_max = lim;                      \
      if (setrlimit(RLIMIT_##res, &rlim) < 0) { \
        die("setrlim " #res, errno);            \
      }                                         \
    }                                           \
  }

  const ResourceLimits& limits = options_->limits;
  SET_RLIM(AS, limits.address_space_kb * 1024);
  SET_RLIM(CPU, limits.cpu_seconds);
  SET_RLIM(FSIZE, limits.file_size_kb * 1024);
  SET_RLIM(NOFILE, limits.open_files);
  SET_RLIM(NPROC, limits.processes);
  SET_RLIM(STACK, limits.stack_kb * 1024);
#undef SET_RLIM

  int count = 0;
  do {
    execve(argv_[0], argv_.data(), envp_.data());
    usleep(100);
    // A freshly compiled executable may still be open for writing for a
    // short while. We try at most 16 times to avoid livelocks.
  } while (errno == ETXTBSY && count++ < 16);
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(1);
}

void Unix::KillGroup() {
  if (kill(-child_pid_, SIGKILL) == -1 && errno != ESRCH) {
    PLOG(WARNING) << "kill " << -child_pid_;
  }
}

bool Unix::Wait(ExecutionInfo* info, std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  close(pipe_fds_[1]);
  int error_len = 0;
  ssize_t header = 0;
  do {
    header = read(pipe_fds_[0], &error_len, sizeof(error_len));
  } while (header == -1 && errno == EINTR);
  if (header == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    if (error_len > 0 && error_len < PIPE_BUF &&
        read(pipe_fds_[0], error, error_len) > 0) {
      *error_msg = error;
    } else {
      *error_msg = "child setup failed";
    }
    close(pipe_fds_[0]);
    while (waitpid(child_pid_, nullptr, 0) == -1 && errno == EINTR) {
    }
    return false;
  }
  close(pipe_fds_[0]);

  auto program_start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - program_start)
        .count();
  };

  // wait4 is marked as obsolete, but waitpid does not return the resource
  // usage of the child and getrusage() may include other children that exited
  // in the meantime.
  int child_status = 0;
  bool has_exited = false;
  struct rusage rusage {};
  while (!has_exited && (options_->limits.wall_millis == 0 ||
                         elapsed_millis() < options_->limits.wall_millis)) {
    int ret = wait4(child_pid_, &child_status,
                    options_->limits.wall_millis ? WNOHANG : 0, &rusage);
    if (ret == -1 && errno == EINTR) continue;
    if (ret == -1) {
      *error_msg = "wait4: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      KillGroup();
      return false;
    }
    if (ret == child_pid_) {
      has_exited = true;
      break;
    }
    std::this_thread::sleep_for(kPollInterval);
  }
  if (!has_exited) {
    VLOG(1) << "Wall limit of " << options_->limits.wall_millis
            << "ms exceeded by " << options_->executable << ", killing "
            << child_pid_;
    info->timed_out = true;
    KillGroup();
    int ret = 0;
    do {
      ret = wait4(child_pid_, &child_status, 0, &rusage);
    } while (ret == -1 && errno == EINTR);
    if (ret != child_pid_) {
      *error_msg = "wait4: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      return false;
    }
  }
  // Descendants that outlived the main process.
  KillGroup();

  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  info->wall_time_millis = elapsed_millis();
  info->cpu_time_millis =
      (int64_t)rusage.ru_utime.tv_sec * 1000 + rusage.ru_utime.tv_usec / 1000;
  info->sys_time_millis =
      (int64_t)rusage.ru_stime.tv_sec * 1000 + rusage.ru_stime.tv_usec / 1000;
  return true;
}

namespace {
Sandbox::Register<Unix> r;
}  // namespace

}  // namespace sandbox
