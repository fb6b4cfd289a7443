#include "docker_runtime.h"

#include <spdlog/spdlog.h>
#include <coderun/config.h>
#include <coderun/sandbox.h>
#include "subprocess.h"

namespace {

// `docker rm -f` output is short; keep enough to recognize the error message
constexpr size_t kCleanupCaptureLimit = 4096;
// exit status of `docker run` when the error comes from docker itself
constexpr int kDockerRunError = 125;

inline bool IsDockerMessage(const std::string& err) {
  return err.rfind("docker: ", 0) == 0;
}

class DockerProcess : public SandboxProcess {
  Subprocess proc_;
  std::string input_;
  size_t capture_limit_;
  bool waited_;
 public:
  DockerProcess(std::string&& input, size_t capture_limit) :
      input_(std::move(input)), capture_limit_(capture_limit), waited_(false) {}

  void Start(const SandboxSpec& spec, const std::string& docker) {
    proc_.Start(spec.ToRunCommand(docker), spec.interactive);
  }

  ProcessResult Wait(Deadline deadline) override {
    if (waited_) throw SandboxSystemError("Sandbox process already waited");
    waited_ = true;
    ProcessResult ret = proc_.Communicate(input_, deadline, capture_limit_);
    // the container never started (daemon unreachable, image unavailable, ...)
    if (ret.exit_code == kDockerRunError && IsDockerMessage(ret.error)) {
      std::string msg = ret.error.substr(0, ret.error.find_last_not_of("\n") + 1);
      spdlog::warn("docker run failed: {}", msg);
      throw SandboxSystemError(msg);
    }
    return ret;
  }
};

inline bool IsNoSuchContainer(const std::string& err) {
  return err.find("No such container") != std::string::npos;
}

} // namespace

DockerRuntime::DockerRuntime() : DockerRuntime(kDockerPath, kMaxOutputBytes + 1) {}

std::unique_ptr<SandboxProcess> DockerRuntime::Launch(const SandboxSpec& spec, const std::string& input) {
  spdlog::debug("Launching sandbox {} image={}", spec.instance_id, spec.image);
  auto ret = std::make_unique<DockerProcess>(
      spec.interactive ? std::string(input) : std::string(), capture_limit_);
  ret->Start(spec, docker_);
  return ret;
}

bool DockerRuntime::ForceTerminate(const std::string& instance_id, Deadline deadline) {
  spdlog::debug("Force removing sandbox {}", instance_id);
  Subprocess proc;
  ProcessResult res;
  try {
    proc.Start({docker_, "rm", "-f", instance_id}, false);
    res = proc.Communicate("", deadline, kCleanupCaptureLimit);
  } catch (const SandboxSystemError& e) {
    spdlog::warn("Failed to remove sandbox {}: {}", instance_id, e.what());
    return false;
  }
  if (res.timed_out) {
    spdlog::warn("Removing sandbox {} timed out", instance_id);
    return false;
  }
  if (res.exit_code == 0) return true;
  // not registered yet or already gone
  if (IsNoSuchContainer(res.error)) {
    spdlog::debug("Sandbox {} does not exist", instance_id);
    return true;
  }
  spdlog::warn("Failed to remove sandbox {}: exit={} {}", instance_id, res.exit_code.value_or(-1), res.error);
  return false;
}
