#include "supervisor.h"

#include <spdlog/spdlog.h>

ProcessResult ProcessSupervisor::Run(const SandboxSpec& spec, const std::string& input,
                                     Deadline deadline, std::chrono::milliseconds cleanup_timeout) {
  auto proc = runtime_.Launch(spec, input);
  ProcessResult ret = proc->Wait(deadline);
  if (!ret.timed_out) {
    spdlog::debug("Sandbox {} finished: exit={}", spec.instance_id, ret.exit_code.value_or(-1));
    return ret;
  }
  ret.exit_code.reset();
  spdlog::info("Sandbox {} timed out", spec.instance_id);
  try {
    if (!runtime_.ForceTerminate(spec.instance_id, Clock::now() + cleanup_timeout)) {
      spdlog::warn("Cleanup of sandbox {} failed", spec.instance_id);
    }
  } catch (const std::exception& e) {
    spdlog::warn("Cleanup of sandbox {} failed: {}", spec.instance_id, e.what());
  }
  return ret;
}
