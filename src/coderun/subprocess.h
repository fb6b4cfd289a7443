#ifndef CODERUN_SUBPROCESS_H_
#define CODERUN_SUBPROCESS_H_

#include <string>
#include <vector>
#include <sys/types.h>

#include <coderun/runtime.h>

// A child process with its standard streams connected to pipes.
// The child is killed and reaped on destruction if it is still running.
class Subprocess {
  pid_t pid_;
  int fd_input_, fd_output_, fd_error_;

  void CloseFd_(int& fd);
  std::optional<int> Reap_(Deadline);
 public:
  Subprocess() : pid_(-1), fd_input_(-1), fd_output_(-1), fd_error_(-1) {}
  ~Subprocess();
  Subprocess(const Subprocess&) = delete;
  Subprocess& operator=(const Subprocess&) = delete;

  // argv[0] is searched in PATH; stdin is /dev/null if !pipe_input
  // throws SandboxSystemError if the program cannot be executed
  void Start(const std::vector<std::string>& argv, bool pipe_input);
  // Feed input (then close stdin) and collect stdout & stderr until the child exits or
  // the deadline passes, in which case it is killed. At most capture_limit bytes are
  // kept for each stream; the remaining output is drained and discarded.
  ProcessResult Communicate(const std::string& input, Deadline, size_t capture_limit);
};

#endif  // CODERUN_SUBPROCESS_H_
