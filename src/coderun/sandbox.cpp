#include <coderun/sandbox.h>

#include <coderun/config.h>
#include "utils.h"

const char kProjectMountPoint[] = "/app";
const char kScratchDir[] = "/tmp";

namespace {

inline std::string InstancePrefix(SourceKind kind) {
  switch (kind) {
    case SourceKind::INLINE: return "coderun_exec_";
    case SourceKind::ARCHIVE: return "coderun_zip_";
  }
  __builtin_unreachable();
}

std::vector<std::string> RunCommand(Language lang, SourceKind kind) {
  std::string interpreter = LanguageInterpreter(lang);
  switch (kind) {
    case SourceKind::INLINE: return {interpreter, "-"}; // read script from stdin
    case SourceKind::ARCHIVE:
      return {interpreter, std::string(kProjectMountPoint) + "/" + LanguageEntryFile(lang)};
  }
  __builtin_unreachable();
}

} // namespace

std::vector<std::string> SandboxSpec::ToRunCommand(const std::string& runtime) const {
  std::vector<std::string> ret = {runtime, "run", "--rm", "--name", instance_id};
  ret.insert(ret.end(), {"--network", network});
  // docker takes memory with a unit suffix
  if (memory > 0) ret.insert(ret.end(), {"--memory", std::to_string(memory) + "k"});
  if (pids > 0) ret.insert(ret.end(), {"--pids-limit", std::to_string(pids)});
  if (read_only_root) ret.push_back("--read-only");
  for (auto& i : cap_drop) ret.insert(ret.end(), {"--cap-drop", i});
  for (auto& i : security_opts) ret.insert(ret.end(), {"--security-opt", i});
  if (!user.empty()) ret.insert(ret.end(), {"--user", user});
  if (!tmpfs_target.empty()) {
    ret.insert(ret.end(), {"--tmpfs", tmpfs_target + ":rw,size=" + std::to_string(tmpfs_size) + "k"});
  }
  for (auto& i : mounts) {
    ret.insert(ret.end(), {"-v", i.source + ":" + i.target + (i.read_only ? ":ro" : "")});
  }
  if (interactive) ret.push_back("-i");
  ret.push_back(image);
  ret.insert(ret.end(), command.begin(), command.end());
  return ret;
}

SandboxSpec BuildSandboxSpec(
    Language lang, SourceKind kind, const Limits& limits, const fs::path& project_dir) {
  SandboxSpec spec;
  spec.instance_id = InstancePrefix(kind) + GenerateInstanceSuffix();
  spec.image = LanguageImage(lang);
  spec.command = RunCommand(lang, kind);
  spec.interactive = kind == SourceKind::INLINE;
  spec.network = "none";
  spec.memory = limits.memory;
  spec.pids = limits.pids;
  spec.read_only_root = true;
  spec.tmpfs_target = kScratchDir;
  spec.tmpfs_size = limits.tmpfs;
  spec.cap_drop = {"ALL"};
  spec.security_opts = {"no-new-privileges"};
  spec.user = kSandboxUser;
  if (kind == SourceKind::ARCHIVE) {
    spec.mounts.push_back({fs::absolute(project_dir).lexically_normal().string(), kProjectMountPoint, true});
  }
  return spec;
}
