#include <coderun/config.h>

#include <fstream>

#include <tortellini.hh>
#include <coderun/execution.h>

using namespace std::chrono_literals;

namespace {

inline std::chrono::milliseconds Seconds(double sec) {
  return std::chrono::milliseconds(long(sec * 1000));
}

inline double ToSeconds(std::chrono::milliseconds ms) {
  return std::chrono::duration<double>(ms).count();
}

} // namespace

int kMaxParallel = 5;
std::chrono::milliseconds kAdmissionWait = 30s;
std::chrono::milliseconds kExecutionTimeout = 10s;
std::chrono::milliseconds kCleanupTimeout = 12s;
long kMemoryLimit = 128 * 1024; // 128M
long kTmpfsSize = 16 * 1024; // 16M
int kPidsLimit = 64;
size_t kMaxCodeLength = 5000;
size_t kMaxOutputBytes = 200'000;

std::string kDockerPath = "docker";
std::string kPythonImage = "python:3.11-slim";
std::string kJavaScriptImage = "node:18-slim";
std::string kSandboxUser = "65534:65534";

fs::path kLogFile = "logs/executions.log";

Limits DefaultLimits() {
  Limits ret;
  ret.memory = kMemoryLimit;
  ret.pids = kPidsLimit;
  ret.tmpfs = kTmpfsSize;
  ret.timeout = kExecutionTimeout;
  ret.cleanup_timeout = kCleanupTimeout;
  return ret;
}

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  kMaxParallel = ini[""]["parallel"] | kMaxParallel;
  kAdmissionWait = Seconds(ini[""]["admission_wait"] | ToSeconds(kAdmissionWait));
  kExecutionTimeout = Seconds(ini[""]["execution_timeout"] | ToSeconds(kExecutionTimeout));
  kCleanupTimeout = Seconds(ini[""]["cleanup_timeout"] | ToSeconds(kCleanupTimeout));
  kMemoryLimit = (ini[""]["memory_limit_mb"] | (kMemoryLimit / 1024)) * 1024;
  kTmpfsSize = (ini[""]["tmpfs_size_mb"] | (kTmpfsSize / 1024)) * 1024;
  kPidsLimit = ini[""]["pids_limit"] | kPidsLimit;
  kMaxCodeLength = ini[""]["max_code_length"] | kMaxCodeLength;
  kMaxOutputBytes = ini[""]["max_output_bytes"] | kMaxOutputBytes;
  kDockerPath = ini[""]["docker"] | kDockerPath;
  kPythonImage = ini[""]["python_image"] | kPythonImage;
  kJavaScriptImage = ini[""]["javascript_image"] | kJavaScriptImage;
  kSandboxUser = ini[""]["sandbox_user"] | kSandboxUser;
  std::string log_file = ini[""]["log_file"] | "";
  if (log_file.size()) kLogFile = log_file;
  return true;
}
