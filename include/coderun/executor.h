#ifndef INCLUDE_CODERUN_EXECUTOR_H_
#define INCLUDE_CODERUN_EXECUTOR_H_

#include <chrono>
#include <string>
#include <filesystem>

#include "runtime.h"
#include "admission.h"
#include "execution.h"
#include "execution_log.h"

class ExecutorOptions {
 public:
  size_t max_code_length; // characters
  size_t max_output_bytes; // per stream
  std::chrono::milliseconds admission_wait;
  Limits limits;
  bool remove_project; // delete archive project directories after execution

  // from the configuration globals
  ExecutorOptions();
};

// Runs requests synchronously; may be used from several threads at once, with
// concurrency bounded by the gate. No exception escapes the Execute functions.
class Executor {
  AdmissionGate& gate_;
  SandboxRuntime& runtime_;
  ExecutionLog& log_;
  ExecutorOptions opt_;

  ExecutionResult Run_(const ExecutionRequest&, const std::string& log_ref);
 public:
  Executor(AdmissionGate& gate, SandboxRuntime& runtime, ExecutionLog& log,
           const ExecutorOptions& opt = ExecutorOptions()) :
      gate_(gate), runtime_(runtime), log_(log), opt_(opt) {}

  // the source is fed through stdin
  ExecutionResult ExecuteInline(const std::string& code, Language lang);
  // an extracted project; the language is chosen by its entry point
  ExecutionResult ExecuteArchive(const std::filesystem::path& project_dir);
  ExecutionResult Execute(const ExecutionRequest&);

  const ExecutorOptions& Options() const { return opt_; }
};

#endif  // INCLUDE_CODERUN_EXECUTOR_H_
