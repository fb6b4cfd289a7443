#ifndef INCLUDE_CODERUN_SANDBOX_H_
#define INCLUDE_CODERUN_SANDBOX_H_

#include <string>
#include <vector>
#include <filesystem>

#include "execution.h"

// in-sandbox mount point of archive projects
extern const char kProjectMountPoint[];
// in-sandbox writable scratch directory
extern const char kScratchDir[];

class SandboxSpec {
 public:
  struct Mount {
    std::string source, target;
    bool read_only;
  };

  // container name; the only handle for forced termination
  std::string instance_id;
  std::string image;
  std::vector<std::string> command;
  bool interactive; // attach stdin; the program is fed through it
  std::string network;
  long memory; // KiB
  int pids;
  bool read_only_root;
  std::string tmpfs_target;
  long tmpfs_size; // KiB
  std::vector<std::string> cap_drop;
  std::vector<std::string> security_opts;
  std::string user; // uid:gid, empty to keep the image default
  std::vector<Mount> mounts;

  SandboxSpec() :
      interactive(false),
      network("none"),
      memory(0),
      pids(0),
      read_only_root(true),
      tmpfs_size(0) {}

  // full `docker run` argv; the first element is the runtime binary
  std::vector<std::string> ToRunCommand(const std::string& runtime) const;
};

// Chooses the image & command for the language and attaches the hardening policy.
// Every call generates a fresh instance id.
SandboxSpec BuildSandboxSpec(
    Language lang, SourceKind kind, const Limits& limits,
    const std::filesystem::path& project_dir = {});

#endif  // INCLUDE_CODERUN_SANDBOX_H_
