#include <coderun/execution_log.h>

#include <ctime>
#include <fstream>
#include <sstream>

#include <fmt/chrono.h>
#include <spdlog/spdlog.h>
#include <coderun/utils.h>
#include "utils.h"

namespace {

const char kSeparator[] = "----------------------------";
const char kNoHistory[] = "No history available.";

} // namespace

std::string FileExecutionLog::Format(const ExecutionLogEntry& entry) {
  std::time_t time = std::chrono::system_clock::to_time_t(entry.time);
  return fmt::format(
      "\n{0}\nTIME: {1:%Y-%m-%d %H:%M:%S}\nSTATUS: {2}\nRETURN CODE: {3}\n\n"
      "USER CODE:\n{4}\n\nOUTPUT:\n{5}\n\nERROR:\n{6}\n{0}\n",
      kSeparator, fmt::localtime(time), StatusToAbr(entry.status), entry.exit_code.value_or(-1),
      entry.code, entry.output, entry.error);
}

void FileExecutionLog::Record(const ExecutionLogEntry& entry) {
  std::string block = Format(entry);
  std::lock_guard lck(mtx_);
  if (path_.has_parent_path()) CreateDirs(path_.parent_path());
  std::ofstream fout(path_, std::ios::app);
  fout << block;
  fout.flush();
  if (!fout) spdlog::warn("Failed writing execution log {}", path_.c_str());
}

std::string FileExecutionLog::History() {
  std::lock_guard lck(mtx_);
  std::ifstream fin(path_);
  if (!fin) return kNoHistory;
  std::stringstream ss;
  ss << fin.rdbuf();
  return ss.str();
}
