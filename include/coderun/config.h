#ifndef INCLUDE_CODERUN_CONFIG_H_
#define INCLUDE_CODERUN_CONFIG_H_

#include <chrono>
#include <string>
#include <filesystem>

namespace fs = std::filesystem;

// concurrent sandboxes
extern int kMaxParallel;
extern std::chrono::milliseconds kAdmissionWait;
extern std::chrono::milliseconds kExecutionTimeout;
extern std::chrono::milliseconds kCleanupTimeout;
// KiB
extern long kMemoryLimit;
extern long kTmpfsSize;
extern int kPidsLimit;
// characters / bytes
extern size_t kMaxCodeLength;
extern size_t kMaxOutputBytes;

extern std::string kDockerPath;
extern std::string kPythonImage;
extern std::string kJavaScriptImage;
// uid:gid inside the sandbox
extern std::string kSandboxUser;

extern fs::path kLogFile;

// Override the globals by the keys of an INI file (global section); keys not present
// keep their current values. Returns false if the file cannot be opened.
bool ParseConfig(const fs::path&);

#endif  // INCLUDE_CODERUN_CONFIG_H_
