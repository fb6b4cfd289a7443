#ifndef CODERUN_DOCKER_RUNTIME_H_
#define CODERUN_DOCKER_RUNTIME_H_

#include <string>

#include <coderun/runtime.h>

// Drives containers through the docker CLI.
class DockerRuntime : public SandboxRuntime {
  std::string docker_;
  size_t capture_limit_; // bytes kept per stream
 public:
  DockerRuntime(const std::string& docker, size_t capture_limit) :
      docker_(docker), capture_limit_(capture_limit) {}
  // uses the configured docker binary & output cap
  DockerRuntime();

  std::unique_ptr<SandboxProcess> Launch(const SandboxSpec&, const std::string& input) override;
  bool ForceTerminate(const std::string& instance_id, Deadline) override;
};

#endif  // CODERUN_DOCKER_RUNTIME_H_
