#include "utils.h"

#include <thread>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace {

class FakeProcess : public SandboxProcess {
  FakeRuntime& runtime_;
  FakeRuntime::Behavior behavior_;
 public:
  FakeProcess(FakeRuntime& runtime, const FakeRuntime::Behavior& behavior) :
      runtime_(runtime), behavior_(behavior) {
    int now = ++runtime_.running;
    int prev = runtime_.max_running;
    while (prev < now && !runtime_.max_running.compare_exchange_weak(prev, now));
  }
  ~FakeProcess() { --runtime_.running; }

  ProcessResult Wait(Deadline deadline) override {
    auto finish = Clock::now() + behavior_.delay;
    if (finish > deadline) {
      std::this_thread::sleep_until(deadline);
      ProcessResult ret;
      ret.timed_out = true;
      return ret;
    }
    std::this_thread::sleep_until(finish);
    return behavior_.result;
  }
};

} // namespace

std::unique_ptr<SandboxProcess> FakeRuntime::Launch(const SandboxSpec& spec, const std::string& input) {
  if (behavior.fail_launch) {
    throw SandboxSystemError("Cannot execute docker: fake failure", behavior.launch_errno);
  }
  if (behavior.throw_unexpected) throw std::runtime_error("unexpected launch fault");
  ++launches;
  {
    std::lock_guard lck(mtx_);
    last_spec_ = spec;
    last_input_ = input;
  }
  return std::make_unique<FakeProcess>(*this, behavior);
}

bool FakeRuntime::ForceTerminate(const std::string& instance_id, Deadline) {
  ++terminations;
  {
    std::lock_guard lck(mtx_);
    terminated_ids_.push_back(instance_id);
  }
  if (behavior.throw_terminate) throw std::runtime_error("fake cleanup failure");
  return !behavior.fail_terminate;
}

SandboxSpec FakeRuntime::LastSpec() {
  std::lock_guard lck(mtx_);
  return last_spec_;
}

std::string FakeRuntime::LastInput() {
  std::lock_guard lck(mtx_);
  return last_input_;
}

std::vector<std::string> FakeRuntime::TerminatedIds() {
  std::lock_guard lck(mtx_);
  return terminated_ids_;
}

void RecordingLog::Record(const ExecutionLogEntry& entry) {
  std::lock_guard lck(mtx_);
  entries_.push_back(entry);
}

std::vector<ExecutionLogEntry> RecordingLog::Entries() {
  std::lock_guard lck(mtx_);
  return entries_;
}

ProcessResult MakeResult(int exit_code, const std::string& output, const std::string& error) {
  ProcessResult ret;
  ret.exit_code = exit_code;
  ret.output = output;
  ret.error = error;
  return ret;
}

std::filesystem::path MakeTempDir(const char* prefix) {
  std::string tmpl = std::string("/tmp/") + prefix + "_XXXXXX";
  if (!mkdtemp(tmpl.data())) throw std::runtime_error("Failed to create");
  return tmpl;
}

void WriteFile(const std::filesystem::path& path, const std::string& content) {
  std::ofstream fout(path);
  fout << content;
}
