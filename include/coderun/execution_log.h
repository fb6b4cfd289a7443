#ifndef INCLUDE_CODERUN_EXECUTION_LOG_H_
#define INCLUDE_CODERUN_EXECUTION_LOG_H_

#include <mutex>
#include <chrono>
#include <string>
#include <optional>
#include <filesystem>

#include "execution.h"

struct ExecutionLogEntry {
  std::chrono::system_clock::time_point time;
  Status status;
  std::string code; // inline source, or a reference to the archive project
  std::optional<int> exit_code;
  std::string output, error;
};

class ExecutionLog {
 public:
  virtual ~ExecutionLog() = default;
  // may be called from any thread; should not throw
  virtual void Record(const ExecutionLogEntry&) {}
};

// Appends one delimited text block per execution.
class FileExecutionLog : public ExecutionLog {
  std::filesystem::path path_;
  std::mutex mtx_;
 public:
  explicit FileExecutionLog(const std::filesystem::path& path) : path_(path) {}

  void Record(const ExecutionLogEntry&) override;
  // whole log content, or a placeholder if it cannot be read
  std::string History();

  static std::string Format(const ExecutionLogEntry&);
};

#endif  // INCLUDE_CODERUN_EXECUTION_LOG_H_
