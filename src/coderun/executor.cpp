#include <coderun/executor.h>

#include <cerrno>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <coderun/config.h>
#include <coderun/sandbox.h>
#include "utils.h"
#include "output.h"
#include "supervisor.h"
#include "entry_point.h"

namespace {

// code points of a UTF-8 string
size_t CountCharacters(const std::string& str) {
  size_t ret = 0;
  for (char c : str) {
    if (((unsigned char)c & 0xC0) != 0x80) ret++;
  }
  return ret;
}

std::string EntryFileList() {
  std::string ret;
#define X(name, ...) \
  if (!ret.empty()) ret += " or "; \
  ret += LanguageEntryFile(Language::name);
  ENUM_LANGUAGE_
#undef X
  return ret;
}

ExecutionResult Reject(Status status, std::string&& message) {
  ExecutionResult ret;
  ret.status = status;
  ret.message = std::move(message);
  spdlog::info("Request rejected: status={} message={}", StatusToAbr(status), ret.message);
  return ret;
}

std::string SystemErrorMessage(const SandboxSystemError& err) {
  if (err.Errno() == ENOENT) {
    return "Docker not found on the server. Ensure docker is installed and on PATH.";
  }
  return err.what();
}

// archive projects are transient; removed on every exit path
class ProjectCleanup {
  const fs::path& path_;
  bool enabled_;
 public:
  ProjectCleanup(const fs::path& path, bool enabled) : path_(path), enabled_(enabled) {}
  ~ProjectCleanup() {
    if (enabled_ && !path_.empty()) RemoveAll(path_);
  }
};

} // namespace

ExecutorOptions::ExecutorOptions() :
    max_code_length(kMaxCodeLength),
    max_output_bytes(kMaxOutputBytes),
    admission_wait(kAdmissionWait),
    limits(DefaultLimits()),
    remove_project(true) {}

ExecutionResult Executor::ExecuteInline(const std::string& code, Language lang) {
  ExecutionRequest req;
  req.source_kind = SourceKind::INLINE;
  req.lang = lang;
  req.code = code;
  req.limits = opt_.limits;
  return Execute(req);
}

ExecutionResult Executor::ExecuteArchive(const fs::path& project_dir) {
  ExecutionRequest req;
  req.source_kind = SourceKind::ARCHIVE;
  req.project_dir = project_dir;
  req.limits = opt_.limits;
  return Execute(req);
}

ExecutionResult Executor::Execute(const ExecutionRequest& req) {
  switch (req.source_kind) {
    case SourceKind::INLINE: {
      if (CountCharacters(req.code) > opt_.max_code_length) {
        return Reject(Status::VALIDATION_ERROR,
                      fmt::format("Code too long. Max {} chars allowed.", opt_.max_code_length));
      }
      return Run_(req, req.code);
    }
    case SourceKind::ARCHIVE: {
      std::error_code ec;
      // never delete a caller's path that is not a project directory
      if (!fs::is_directory(req.project_dir, ec)) {
        return Reject(Status::VALIDATION_ERROR, "Project directory not found");
      }
      ProjectCleanup cleanup(req.project_dir, opt_.remove_project);
      auto entry = ResolveEntryPoint(req.project_dir);
      if (!entry) {
        return Reject(Status::VALIDATION_ERROR,
                      "No recognized entry point; project must contain " + EntryFileList());
      }
      // the sandbox runs as an unprivileged user
      GrantReadAccess(req.project_dir);
      ExecutionRequest resolved = req;
      resolved.lang = entry->lang;
      return Run_(resolved, fmt::format("[archive] {}", entry->file.c_str()));
    }
  }
  __builtin_unreachable();
}

ExecutionResult Executor::Run_(const ExecutionRequest& req, const std::string& log_ref) {
  auto permit = gate_.Acquire(opt_.admission_wait);
  if (!permit) return Reject(Status::BUSY, "Server busy. Try again later.");

  const SandboxSpec spec = BuildSandboxSpec(req.lang, req.source_kind, req.limits, req.project_dir);
  spdlog::info("Executing {} lang={} kind={}", spec.instance_id,
               LanguageName(req.lang), SourceKindName(req.source_kind));
  ExecutionResult ret;
  ProcessResult run;
  ExecutionLogEntry entry;
  entry.code = log_ref;
  auto SystemError = [&](const std::string& message, const char* what) {
    spdlog::error("Sandbox {} system error: {}", spec.instance_id, what);
    ret.status = Status::SYSTEM_ERROR;
    ret.message = message;
    entry.time = std::chrono::system_clock::now();
    entry.status = ret.status;
    entry.error = what;
    log_.Record(entry);
    return ret;
  };
  try {
    ProcessSupervisor supervisor(runtime_);
    const std::string& input = req.source_kind == SourceKind::INLINE ? req.code : std::string();
    run = supervisor.Run(spec, input, Clock::now() + req.limits.timeout, req.limits.cleanup_timeout);
  } catch (const SandboxSystemError& e) {
    return SystemError(SystemErrorMessage(e), e.what());
  } catch (const std::exception& e) {
    return SystemError(fmt::format("Unexpected sandbox failure: {}", e.what()), e.what());
  }

  ret.output = SanitizeOutput(run.output, opt_.max_output_bytes);
  ret.error = SanitizeOutput(run.error, opt_.max_output_bytes);
  ret.exit_code = run.exit_code;
  ret.timed_out = run.timed_out;
  ret.status = Classify(ret.timed_out, ret.exit_code, ret.output, ret.error);
  switch (ret.status) {
    case Status::TIMEOUT: {
      double seconds = std::chrono::duration<double>(req.limits.timeout).count();
      ret.message = fmt::format("Execution timed out after {:g} seconds.", seconds);
      break;
    }
    case Status::KILLED:
      ret.message = "Execution stopped: CPU or memory exceeded or killed.";
      break;
    default: break;
  }
  spdlog::info("Sandbox {} finished: status={} exit={}",
               spec.instance_id, StatusToAbr(ret.status), ret.exit_code.value_or(-1));

  entry.time = std::chrono::system_clock::now();
  entry.status = ret.status;
  entry.exit_code = ret.exit_code;
  entry.output = ret.output;
  entry.error = ret.error.empty() ? ret.message : ret.error;
  log_.Record(entry);
  return ret;
}
