#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <mutex>
#include <atomic>
#include <chrono>
#include <vector>
#include <filesystem>

#include <gtest/gtest.h>
#include <coderun/runtime.h>
#include <coderun/sandbox.h>
#include <coderun/execution_log.h>

// In-memory runtime; every launched process reports `behavior.result` after
// `behavior.delay`, or times out if the deadline comes first.
class FakeRuntime : public SandboxRuntime {
 public:
  struct Behavior {
    ProcessResult result;
    std::chrono::milliseconds delay{0};
    bool fail_launch = false;
    int launch_errno = 0;
    bool fail_terminate = false;
    bool throw_terminate = false;
    bool throw_unexpected = false; // std::runtime_error from Launch
  };
  Behavior behavior;

  std::atomic_int launches{0};
  std::atomic_int terminations{0};
  std::atomic_int running{0};
  std::atomic_int max_running{0};

  std::unique_ptr<SandboxProcess> Launch(const SandboxSpec&, const std::string& input) override;
  bool ForceTerminate(const std::string& instance_id, Deadline) override;

  SandboxSpec LastSpec();
  std::string LastInput();
  std::vector<std::string> TerminatedIds();

 private:
  std::mutex mtx_;
  SandboxSpec last_spec_;
  std::string last_input_;
  std::vector<std::string> terminated_ids_;
};

class RecordingLog : public ExecutionLog {
  std::mutex mtx_;
  std::vector<ExecutionLogEntry> entries_;
 public:
  void Record(const ExecutionLogEntry& entry) override;
  std::vector<ExecutionLogEntry> Entries();
};

ProcessResult MakeResult(int exit_code, const std::string& output, const std::string& error);

std::filesystem::path MakeTempDir(const char* prefix);
void WriteFile(const std::filesystem::path&, const std::string& content);

#endif // TEST_UTILS_H_
