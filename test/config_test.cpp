#include <coderun/config.h>
#include <coderun/execution.h>

#include "utils.h"

using namespace std::chrono_literals;

class ConfigTest : public testing::Test {
  int max_parallel_;
  std::chrono::milliseconds admission_wait_, execution_timeout_, cleanup_timeout_;
  long memory_limit_, tmpfs_size_;
  int pids_limit_;
  size_t max_code_length_, max_output_bytes_;
  std::string docker_path_, python_image_, javascript_image_, sandbox_user_;
  fs::path log_file_;
 protected:
  fs::path dir;
  void SetUp() override {
    dir = MakeTempDir("coderun_config_test");
    max_parallel_ = kMaxParallel;
    admission_wait_ = kAdmissionWait;
    execution_timeout_ = kExecutionTimeout;
    cleanup_timeout_ = kCleanupTimeout;
    memory_limit_ = kMemoryLimit;
    tmpfs_size_ = kTmpfsSize;
    pids_limit_ = kPidsLimit;
    max_code_length_ = kMaxCodeLength;
    max_output_bytes_ = kMaxOutputBytes;
    docker_path_ = kDockerPath;
    python_image_ = kPythonImage;
    javascript_image_ = kJavaScriptImage;
    sandbox_user_ = kSandboxUser;
    log_file_ = kLogFile;
  }
  void TearDown() override {
    kMaxParallel = max_parallel_;
    kAdmissionWait = admission_wait_;
    kExecutionTimeout = execution_timeout_;
    kCleanupTimeout = cleanup_timeout_;
    kMemoryLimit = memory_limit_;
    kTmpfsSize = tmpfs_size_;
    kPidsLimit = pids_limit_;
    kMaxCodeLength = max_code_length_;
    kMaxOutputBytes = max_output_bytes_;
    kDockerPath = docker_path_;
    kPythonImage = python_image_;
    kJavaScriptImage = javascript_image_;
    kSandboxUser = sandbox_user_;
    kLogFile = log_file_;
    fs::remove_all(dir);
  }
};

TEST_F(ConfigTest, Overrides) {
  WriteFile(dir / "coderun.conf",
            "parallel = 3\n"
            "admission_wait = 5\n"
            "execution_timeout = 2.5\n"
            "cleanup_timeout = 4\n"
            "memory_limit_mb = 256\n"
            "tmpfs_size_mb = 8\n"
            "pids_limit = 32\n"
            "max_code_length = 1000\n"
            "max_output_bytes = 4096\n"
            "docker = /usr/local/bin/docker\n"
            "python_image = python:3.12-slim\n"
            "javascript_image = node:20-slim\n"
            "sandbox_user = 1000:1000\n"
            "log_file = /var/log/coderun/executions.log\n");
  ASSERT_TRUE(ParseConfig(dir / "coderun.conf"));
  EXPECT_EQ(kMaxParallel, 3);
  EXPECT_EQ(kAdmissionWait, 5s);
  EXPECT_EQ(kExecutionTimeout, 2500ms);
  EXPECT_EQ(kCleanupTimeout, 4s);
  EXPECT_EQ(kMemoryLimit, 256 * 1024);
  EXPECT_EQ(kTmpfsSize, 8 * 1024);
  EXPECT_EQ(kPidsLimit, 32);
  EXPECT_EQ(kMaxCodeLength, 1000u);
  EXPECT_EQ(kMaxOutputBytes, 4096u);
  EXPECT_EQ(kDockerPath, "/usr/local/bin/docker");
  EXPECT_EQ(kPythonImage, "python:3.12-slim");
  EXPECT_EQ(kJavaScriptImage, "node:20-slim");
  EXPECT_EQ(kSandboxUser, "1000:1000");
  EXPECT_EQ(kLogFile.string(), "/var/log/coderun/executions.log");

  Limits limits = DefaultLimits();
  EXPECT_EQ(limits.memory, 256 * 1024);
  EXPECT_EQ(limits.pids, 32);
  EXPECT_EQ(limits.tmpfs, 8 * 1024);
  EXPECT_EQ(limits.timeout, 2500ms);
  EXPECT_EQ(limits.cleanup_timeout, 4s);
}

TEST_F(ConfigTest, MissingKeysKept) {
  WriteFile(dir / "coderun.conf", "parallel = 2\n");
  ASSERT_TRUE(ParseConfig(dir / "coderun.conf"));
  EXPECT_EQ(kMaxParallel, 2);
  EXPECT_EQ(kExecutionTimeout, 10s);
  EXPECT_EQ(kMemoryLimit, 128 * 1024);
  EXPECT_EQ(kMaxCodeLength, 5000u);
  EXPECT_EQ(kPythonImage, "python:3.11-slim");
  EXPECT_EQ(kLogFile.string(), "logs/executions.log");
}

TEST_F(ConfigTest, MissingFile) {
  EXPECT_FALSE(ParseConfig(dir / "nonexistent.conf"));
  EXPECT_EQ(kMaxParallel, 5);
}
