#include "executor/runner.hpp"

#include <dirent.h>
#include <signal.h>
#include <sys/stat.h>

#include <chrono>
#include <memory>

#include "absl/memory/memory.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"
#include "util/which.hpp"

namespace {

using ::testing::AnyOf;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Not;

using executor::ExecutorConfig;
using executor::Runner;
using executor::RunOutput;

const std::string test_tmpdir = "/tmp/coderun_testdir";

std::vector<std::string> ListDir(const std::string& path) {
  std::vector<std::string> entries;
  DIR* dir = opendir(path.c_str());
  if (!dir) return entries;
  while (struct dirent* entry = readdir(dir)) {
    std::string name = entry->d_name;
    if (name != "." && name != "..") entries.push_back(name);
  }
  closedir(dir);
  return entries;
}

class RunnerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    util::File::MakeDirs(test_tmpdir);
    tmp_ = absl::make_unique<util::TempDir>(test_tmpdir);
    config_.temp_directory = tmp_->Path();
    config_.execution_timeout_seconds = 5;
  }

  RunOutput Run(proto::Language language, const std::string& code) {
    std::unique_ptr<Runner> runner = Runner::ForLanguage(language, config_);
    EXPECT_TRUE(runner);
    if (!runner) return RunOutput::Error("no runner");
    RunOutput output = runner->Run(code);
    EXPECT_THAT(ListDir(tmp_->Path()), IsEmpty());
    return output;
  }

  ExecutorConfig config_;
  std::unique_ptr<util::TempDir> tmp_;
};

class PythonRunnerTest : public RunnerTest {
 protected:
  void SetUp() override {
    if (util::which(config_.python_interpreter).empty())
      GTEST_SKIP() << config_.python_interpreter << " not found";
    RunnerTest::SetUp();
  }
};

class CRunnerTest : public RunnerTest {
 protected:
  void SetUp() override {
    if (util::which(config_.c_compiler).empty())
      GTEST_SKIP() << config_.c_compiler << " not found";
    RunnerTest::SetUp();
  }
};

// NOLINTNEXTLINE
TEST(Runner, NoRunnerForBrowserLanguages) {
  EXPECT_FALSE(Runner::ForLanguage(proto::HTML, ExecutorConfig()));
  EXPECT_FALSE(Runner::ForLanguage(proto::JAVASCRIPT, ExecutorConfig()));
  EXPECT_FALSE(Runner::ForLanguage(proto::UNKNOWN_LANGUAGE, ExecutorConfig()));
}

// NOLINTNEXTLINE
TEST(RunOutput, Success) {
  RunOutput output;
  EXPECT_TRUE(output.Success());
  output.stderr_text = "";
  EXPECT_TRUE(output.Success());
  output.stderr_text = "warning";
  EXPECT_FALSE(output.Success());
}

// NOLINTNEXTLINE
TEST(RunOutput, ToProto) {
  RunOutput output = RunOutput::TimedOut();
  proto::ExecutionResult result;
  output.ToProto(&result);
  EXPECT_FALSE(result.has_stdout_text());
  EXPECT_EQ(result.stderr_text(), "Execution timed out");
  EXPECT_FALSE(result.success());
  EXPECT_EQ(result.status(), proto::TIMED_OUT);

  proto::ExecutionResult error;
  RunOutput::Error("disk full").ToProto(&error);
  EXPECT_EQ(error.stderr_text(), "Execution error: disk full");
  EXPECT_EQ(error.status(), proto::FAILED);
}

// NOLINTNEXTLINE
TEST_F(PythonRunnerTest, HelloWorld) {
  RunOutput output = Run(proto::PYTHON, "print(\"Hello, World!\")");
  ASSERT_TRUE(output.stdout_text);
  EXPECT_EQ(*output.stdout_text, "Hello, World!\n");
  EXPECT_FALSE(output.stderr_text);
  EXPECT_EQ(output.status, proto::COMPLETED);
  EXPECT_TRUE(output.Success());
}

// NOLINTNEXTLINE
TEST_F(PythonRunnerTest, EmptyOutput) {
  RunOutput output = Run(proto::PYTHON, "x = 1");
  ASSERT_TRUE(output.stdout_text);
  EXPECT_EQ(*output.stdout_text, "");
  EXPECT_FALSE(output.stderr_text);
}

// NOLINTNEXTLINE
TEST_F(PythonRunnerTest, Exception) {
  RunOutput output =
      Run(proto::PYTHON, "print(\"before\")\nraise ValueError(\"boom\")");
  ASSERT_TRUE(output.stdout_text);
  EXPECT_EQ(*output.stdout_text, "before\n");
  ASSERT_TRUE(output.stderr_text);
  EXPECT_THAT(*output.stderr_text, HasSubstr("ValueError: boom"));
  EXPECT_FALSE(output.Success());
  EXPECT_EQ(output.status, proto::COMPLETED);
}

// NOLINTNEXTLINE
TEST_F(PythonRunnerTest, Timeout) {
  config_.execution_timeout_seconds = 1;
  auto start = std::chrono::steady_clock::now();
  RunOutput output = Run(proto::PYTHON, "while True:\n    pass\n");
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_FALSE(output.stdout_text);
  ASSERT_TRUE(output.stderr_text);
  EXPECT_EQ(*output.stderr_text, "Execution timed out");
  EXPECT_EQ(output.status, proto::TIMED_OUT);
  EXPECT_GE(elapsed, std::chrono::seconds(1));
  EXPECT_LT(elapsed, std::chrono::seconds(5));
}

// NOLINTNEXTLINE
TEST_F(PythonRunnerTest, CpuLimit) {
  config_.cpu_limit_seconds = 1;
  config_.execution_timeout_seconds = 10;
  auto start = std::chrono::steady_clock::now();
  RunOutput output = Run(proto::PYTHON, "while True:\n    pass\n");
  auto elapsed = std::chrono::steady_clock::now() - start;
  ASSERT_TRUE(output.stderr_text);
  // The kernel sends SIGXCPU or SIGKILL when soft and hard limits coincide.
  EXPECT_THAT(*output.stderr_text,
              AnyOf(HasSubstr("Program terminated by signal " +
                              std::to_string(SIGXCPU)),
                    HasSubstr("Program terminated by signal " +
                              std::to_string(SIGKILL))));
  EXPECT_EQ(output.status, proto::COMPLETED);
  EXPECT_FALSE(output.Success());
  EXPECT_LT(elapsed, std::chrono::seconds(5));
}

// NOLINTNEXTLINE
TEST_F(PythonRunnerTest, ExplicitEnvironment) {
  setenv("CODERUN_SECRET", "42", 1);
  RunOutput output = Run(proto::PYTHON,
                         "from os import environ\n"
                         "print(sorted(environ.keys()))");
  ASSERT_TRUE(output.stdout_text) << output.stderr_text.value_or("");
  EXPECT_THAT(*output.stdout_text, HasSubstr("'PATH'"));
  EXPECT_THAT(*output.stdout_text, HasSubstr("'PYTHONPATH'"));
  EXPECT_THAT(*output.stdout_text, Not(HasSubstr("CODERUN_SECRET")));
}

// NOLINTNEXTLINE
TEST_F(PythonRunnerTest, RunsInWorkDirectory) {
  util::TempDir work(test_tmpdir);
  config_.work_directory = work.Path();
  RunOutput output = Run(proto::PYTHON,
                         "from os import getcwd\n"
                         "print(getcwd())");
  ASSERT_TRUE(output.stdout_text);
  EXPECT_EQ(*output.stdout_text, util::File::Absolute(work.Path()) + "\n");
}

// NOLINTNEXTLINE
TEST_F(PythonRunnerTest, StderrIsNotUtf8) {
  RunOutput output = Run(proto::PYTHON,
                         "from sys import stderr\n"
                         "stderr.buffer.write(b\"caf\\xe9\\n\")");
  EXPECT_FALSE(output.stdout_text);
  ASSERT_TRUE(output.stderr_text);
  EXPECT_EQ(*output.stderr_text,
            "Execution error: program output is not valid UTF-8 text");
}

// NOLINTNEXTLINE
TEST_F(PythonRunnerTest, InterpreterNotFound) {
  config_.python_interpreter = "coderun-no-such-python";
  RunOutput output = Run(proto::PYTHON, "print(1)");
  EXPECT_FALSE(output.stdout_text);
  ASSERT_TRUE(output.stderr_text);
  EXPECT_EQ(*output.stderr_text,
            "Execution error: interpreter coderun-no-such-python not found");
  EXPECT_EQ(output.status, proto::FAILED);
}

// NOLINTNEXTLINE
TEST_F(PythonRunnerTest, MissingTempDirectory) {
  config_.temp_directory = tmp_->Path() + "/nope";
  std::unique_ptr<Runner> runner = Runner::ForLanguage(proto::PYTHON, config_);
  RunOutput output = runner->Run("print(1)");
  EXPECT_FALSE(output.stdout_text);
  ASSERT_TRUE(output.stderr_text);
  EXPECT_THAT(*output.stderr_text, HasSubstr("Execution error: "));
  EXPECT_EQ(output.status, proto::FAILED);
}

// NOLINTNEXTLINE
TEST_F(CRunnerTest, Hi) {
  RunOutput output = Run(proto::C,
                         "#include <stdio.h>\n"
                         "int main() { printf(\"Hi\\n\"); return 0; }\n");
  ASSERT_TRUE(output.stdout_text) << output.stderr_text.value_or("");
  EXPECT_THAT(*output.stdout_text, HasSubstr("Hi"));
  EXPECT_FALSE(output.stderr_text);
  EXPECT_EQ(output.status, proto::COMPLETED);
}

// NOLINTNEXTLINE
TEST_F(CRunnerTest, WarningsAreNotReported) {
  RunOutput output = Run(proto::C,
                         "#include <stdio.h>\n"
                         "int main(int argc, char** argv) {\n"
                         "  int unused;\n"
                         "  printf(\"ok\\n\");\n"
                         "  return 0;\n"
                         "}\n");
  ASSERT_TRUE(output.stdout_text);
  EXPECT_EQ(*output.stdout_text, "ok\n");
  EXPECT_FALSE(output.stderr_text);
}

// NOLINTNEXTLINE
TEST_F(CRunnerTest, CompilationError) {
  RunOutput output = Run(proto::C, "int main() { return 0 }\n");
  EXPECT_FALSE(output.stdout_text);
  ASSERT_TRUE(output.stderr_text);
  EXPECT_THAT(*output.stderr_text, Not(IsEmpty()));
  EXPECT_THAT(*output.stderr_text, HasSubstr("error"));
  EXPECT_EQ(output.status, proto::FAILED);
}

// NOLINTNEXTLINE
TEST_F(CRunnerTest, ExitCodeWithoutStderr) {
  RunOutput output = Run(proto::C, "int main() { return 3; }\n");
  ASSERT_TRUE(output.stdout_text);
  EXPECT_FALSE(output.stderr_text);
}

// NOLINTNEXTLINE
TEST_F(CRunnerTest, Segfault) {
  RunOutput output = Run(proto::C,
                         "int main() {\n"
                         "  volatile int* p = 0;\n"
                         "  *p = 1;\n"
                         "  return 0;\n"
                         "}\n");
  ASSERT_TRUE(output.stderr_text);
  EXPECT_THAT(*output.stderr_text,
              HasSubstr("Program terminated by signal 11"));
  EXPECT_FALSE(output.Success());
}

// NOLINTNEXTLINE
TEST_F(CRunnerTest, OutputIsNotUtf8) {
  RunOutput output = Run(proto::C,
                         "#include <stdio.h>\n"
                         "int main() { printf(\"caf\\xe9\\n\"); }\n");
  EXPECT_FALSE(output.stdout_text);
  ASSERT_TRUE(output.stderr_text);
  EXPECT_EQ(*output.stderr_text,
            "Execution error: program output is not valid UTF-8 text");
  EXPECT_FALSE(output.Success());
  EXPECT_EQ(output.status, proto::FAILED);

  proto::ExecutionResult result;
  output.ToProto(&result);
  std::string wire;
  ASSERT_TRUE(result.SerializeToString(&wire));
  proto::ExecutionResult parsed;
  EXPECT_TRUE(parsed.ParseFromString(wire));
}

// NOLINTNEXTLINE
TEST_F(CRunnerTest, Timeout) {
  config_.execution_timeout_seconds = 1;
  RunOutput output = Run(proto::C, "int main() { for (;;) {} }\n");
  EXPECT_FALSE(output.stdout_text);
  ASSERT_TRUE(output.stderr_text);
  EXPECT_EQ(*output.stderr_text, "Execution timed out");
  EXPECT_EQ(output.status, proto::TIMED_OUT);
}

// The compiler is a script that never finishes, so no gcc is needed.
// NOLINTNEXTLINE
TEST_F(RunnerTest, CompilationTimeout) {
  util::TempDir tools(test_tmpdir);
  std::string compiler = util::File::JoinPath(tools.Path(), "slow-cc");
  util::File::Write(compiler, "#!/bin/sh\nsleep 10\n");
  ASSERT_EQ(chmod(compiler.c_str(), S_IRWXU), 0);
  config_.c_compiler = compiler;
  config_.execution_timeout_seconds = 1;

  auto start = std::chrono::steady_clock::now();
  RunOutput output = Run(proto::C, "int main() { return 0; }\n");
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_FALSE(output.stdout_text);
  ASSERT_TRUE(output.stderr_text);
  EXPECT_EQ(*output.stderr_text, "Execution timed out");
  EXPECT_EQ(output.status, proto::TIMED_OUT);
  EXPECT_LT(elapsed, std::chrono::seconds(5));
}

// NOLINTNEXTLINE
TEST_F(CRunnerTest, CompilerNotFound) {
  config_.c_compiler = "coderun-no-such-cc";
  RunOutput output = Run(proto::C, "int main() { return 0; }\n");
  EXPECT_FALSE(output.stdout_text);
  ASSERT_TRUE(output.stderr_text);
  EXPECT_EQ(*output.stderr_text,
            "C compiler not found: coderun-no-such-cc. Please install it to "
            "run C code.");
}

}  // namespace
