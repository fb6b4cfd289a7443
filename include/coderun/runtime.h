#ifndef INCLUDE_CODERUN_RUNTIME_H_
#define INCLUDE_CODERUN_RUNTIME_H_

#include <memory>
#include <string>
#include <optional>
#include <stdexcept>

#include "execution.h"

class SandboxSpec;

// The sandbox runtime itself is broken (binary missing, spawn failure).
// Never used for failures of the sandboxed program.
class SandboxSystemError : public std::runtime_error {
  int errno_;
 public:
  explicit SandboxSystemError(const std::string& what, int err = 0) :
      std::runtime_error(what), errno_(err) {}
  // errno of the failed system call; 0 if unknown
  int Errno() const { return errno_; }
};

struct ProcessResult {
  std::string output, error; // raw bytes
  std::optional<int> exit_code; // only if finished before the deadline
  bool timed_out = false;
};

class SandboxProcess {
 public:
  virtual ~SandboxProcess() = default;
  // Blocks until the process exits or the deadline passes; the local process is
  // killed on expiry but the sandbox instance may survive (see ForceTerminate).
  // Can be called only once. Throws SandboxSystemError if the runtime failed to start
  // the sandbox.
  virtual ProcessResult Wait(Deadline) = 0;
};

class SandboxRuntime {
 public:
  virtual ~SandboxRuntime() = default;
  // input is written to stdin & closed if spec.interactive; throws SandboxSystemError
  virtual std::unique_ptr<SandboxProcess> Launch(const SandboxSpec&, const std::string& input) = 0;
  // Remove the instance by name. An instance that does not exist counts as terminated.
  // Returns false if the request failed or did not finish before the deadline.
  virtual bool ForceTerminate(const std::string& instance_id, Deadline) = 0;
};

#endif  // INCLUDE_CODERUN_RUNTIME_H_
