#ifndef CODERUN_SUPERVISOR_H_
#define CODERUN_SUPERVISOR_H_

#include <chrono>
#include <string>

#include <coderun/runtime.h>
#include <coderun/sandbox.h>

class ProcessSupervisor {
  SandboxRuntime& runtime_;
 public:
  explicit ProcessSupervisor(SandboxRuntime& runtime) : runtime_(runtime) {}

  // Run one sandbox to completion or until the deadline. On timeout, the instance is
  // force-terminated once with its own cleanup timeout; failures of that are logged only.
  // Non-zero exits & crashes are reported in the result; SandboxSystemError is thrown
  // only if the runtime itself cannot be started.
  ProcessResult Run(const SandboxSpec& spec, const std::string& input, Deadline deadline,
                    std::chrono::milliseconds cleanup_timeout);
};

#endif  // CODERUN_SUPERVISOR_H_
