#ifndef INCLUDE_CODERUN_EXECUTION_H_
#define INCLUDE_CODERUN_EXECUTION_H_

#include <chrono>
#include <string>
#include <optional>
#include <filesystem>

using Clock = std::chrono::steady_clock;
using Deadline = Clock::time_point;

// name, text name, interpreter, archive entry file
// the order is the archive entry point priority
#define ENUM_LANGUAGE_ \
  X(PYTHON, "python", "python", "main.py") \
  X(JAVASCRIPT, "javascript", "node", "index.js")
enum class Language {
#define X(name, ...) name,
  ENUM_LANGUAGE_
#undef X
};

#define ENUM_SOURCE_KIND_ \
  X(INLINE) \
  X(ARCHIVE)
enum class SourceKind {
#define X(name) name,
  ENUM_SOURCE_KIND_
#undef X
};

#define ENUM_STATUS_ \
  X(NUL, "", "nil") \
  /* statuses after execution */ \
  X(SUCCESS, "SUCCESS", "Success") \
  X(RUNTIME_ERROR, "RUNTIME ERROR", "Runtime Error (exited with nonzero status)") \
  X(KILLED, "EXECUTION STOPPED", "Execution stopped (killed by the sandbox or the OS)") \
  X(TIMEOUT, "TIMEOUT", "Time Limit Exceeded") \
  /* statuses before execution */ \
  X(BUSY, "BUSY", "Server Busy") \
  X(VALIDATION_ERROR, "VALIDATION ERROR", "Invalid Request") \
  X(SYSTEM_ERROR, "SYSTEM ERROR", "Sandbox Runtime Error")
enum class Status {
#define X(name, abr, desc) name,
  ENUM_STATUS_
#undef X
};

struct Limits {
  long memory; // KiB
  int pids;
  long tmpfs; // KiB
  std::chrono::milliseconds timeout;
  // for out-of-band cleanup calls; slightly longer than timeout
  std::chrono::milliseconds cleanup_timeout;
};

// built from the configuration globals
Limits DefaultLimits();

class ExecutionRequest {
 public:
  SourceKind source_kind;
  Language lang;
  std::string code; // INLINE only
  std::filesystem::path project_dir; // ARCHIVE only
  Limits limits;

  ExecutionRequest() :
      source_kind(SourceKind::INLINE),
      lang(Language::PYTHON),
      limits(DefaultLimits()) {}
};

class ExecutionResult {
 public:
  std::string output, error; // sanitized stdout & stderr
  std::optional<int> exit_code; // empty if timed out or never executed
  bool timed_out;
  Status status;
  std::string message; // user-facing explanation for non-success statuses

  ExecutionResult() : timed_out(false), status(Status::NUL) {}
};

#endif  // INCLUDE_CODERUN_EXECUTION_H_
