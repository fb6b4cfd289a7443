#include "subprocess.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <mutex>
#include <algorithm>
#include <thread>
#include <climits>
#include <cstring>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "utils.h"

namespace {

constexpr size_t kReadChunk = 65536;

std::once_flag sigpipe_flag;

inline int ToExitCode(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status); // same as shells
  return -1;
}

inline int RemainingMs(Deadline deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
  if (left <= 0) return 0;
  if (left >= INT_MAX) return INT_MAX;
  return (int)left + 1;
}

inline void ClosePipe(int fds[2]) {
  for (int i = 0; i < 2; i++) {
    if (fds[i] != -1) close(fds[i]);
    fds[i] = -1;
  }
}

} // namespace

Subprocess::~Subprocess() {
  CloseFd_(fd_input_);
  CloseFd_(fd_output_);
  CloseFd_(fd_error_);
  if (pid_ != -1) {
    kill(pid_, SIGKILL);
    while (waitpid(pid_, nullptr, 0) < 0 && errno == EINTR);
  }
}

void Subprocess::CloseFd_(int& fd) {
  if (fd == -1) return;
  close(fd);
  fd = -1;
}

void Subprocess::Start(const std::vector<std::string>& argv, bool pipe_input) {
  // a sandbox closing its stdin early must not kill the whole service
  std::call_once(sigpipe_flag, []() { signal(SIGPIPE, SIG_IGN); });
  if (argv.empty()) throw SandboxSystemError("Empty command");

  // prepare everything before fork; the child must not allocate
  std::vector<char*> argv_buf;
  for (auto& i : argv) argv_buf.push_back(const_cast<char*>(i.c_str()));
  argv_buf.push_back(nullptr);

  // all descriptors are close-on-exec so concurrent children never inherit each other's pipes
  int inpipe[2] = {-1, -1}, outpipe[2] = {-1, -1}, errpipe[2] = {-1, -1}, execpipe[2] = {-1, -1};
  auto CloseAll = [&]() {
    ClosePipe(inpipe);
    ClosePipe(outpipe);
    ClosePipe(errpipe);
    ClosePipe(execpipe);
  };
  if (pipe_input) {
    if (pipe2(inpipe, O_CLOEXEC) < 0) goto err;
  } else {
    // the read end doubles as the child's stdin
    if ((inpipe[0] = open("/dev/null", O_RDONLY | O_CLOEXEC)) < 0) goto err;
  }
  if (pipe2(outpipe, O_CLOEXEC) < 0 || pipe2(errpipe, O_CLOEXEC) < 0 ||
      pipe2(execpipe, O_CLOEXEC) < 0) {
    goto err;
  }
  {
    pid_t pid = fork();
    if (pid < 0) goto err;
    if (pid == 0) {
      signal(SIGPIPE, SIG_DFL);
      if (dup2(inpipe[0], 0) >= 0 && dup2(outpipe[1], 1) >= 0 && dup2(errpipe[1], 2) >= 0) {
        execvp(argv_buf[0], argv_buf.data());
      }
      // report the exec failure through the close-on-exec pipe
      int exec_errno = errno;
      IGNORE_RETURN(write(execpipe[1], &exec_errno, sizeof(exec_errno)));
      _exit(127);
    }
    close(execpipe[1]);
    execpipe[1] = -1;
    int exec_errno = 0;
    ssize_t n;
    while ((n = read(execpipe[0], &exec_errno, sizeof(exec_errno))) < 0 && errno == EINTR);
    if (n > 0) {
      while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR);
      CloseAll();
      spdlog::warn("Cannot execute {}: {}", argv[0], strerror(exec_errno));
      throw SandboxSystemError(
          fmt::format("Cannot execute {}: {}", argv[0], strerror(exec_errno)), exec_errno);
    }
    pid_ = pid;
  }
  close(inpipe[0]);
  close(outpipe[1]);
  close(errpipe[1]);
  close(execpipe[0]);
  fd_input_ = inpipe[1];
  fd_output_ = outpipe[0];
  fd_error_ = errpipe[0];
  spdlog::debug("Subprocess started pid={} command={}", pid_, fmt::format("{}", argv));
  return;
err:
  int err_no = errno;
  CloseAll();
  spdlog::warn("Subprocess start error: errno={} {}", err_no, strerror(err_no));
  throw SandboxSystemError(fmt::format("Cannot start {}: {}", argv[0], strerror(err_no)), err_no);
}

std::optional<int> Subprocess::Reap_(Deadline deadline) {
  using namespace std::chrono_literals;
  while (true) {
    int status;
    pid_t res = waitpid(pid_, &status, WNOHANG);
    if (res == pid_) {
      pid_ = -1;
      return ToExitCode(status);
    }
    if (res < 0) {
      if (errno == EINTR) continue;
      spdlog::warn("waitpid pid={} error: {}", pid_, strerror(errno));
      pid_ = -1;
      return -1;
    }
    if (Clock::now() >= deadline) return std::nullopt;
    std::this_thread::sleep_for(5ms);
  }
}

ProcessResult Subprocess::Communicate(const std::string& input, Deadline deadline, size_t capture_limit) {
  ProcessResult ret;
  if (pid_ == -1) throw SandboxSystemError("Process not started");
  size_t input_pos = 0;
  if (fd_input_ != -1) {
    if (input.empty()) {
      CloseFd_(fd_input_);
    } else {
      fcntl(fd_input_, F_SETFL, fcntl(fd_input_, F_GETFL) | O_NONBLOCK);
    }
  }

  std::vector<char> buf(kReadChunk);
  auto Drain = [&](int& fd, std::string& dest) {
    ssize_t n = read(fd, buf.data(), buf.size());
    if (n < 0) {
      if (errno != EINTR && errno != EAGAIN) CloseFd_(fd);
      return;
    }
    if (n == 0) {
      CloseFd_(fd);
      return;
    }
    if (dest.size() < capture_limit) {
      dest.append(buf.data(), std::min((size_t)n, capture_limit - dest.size()));
    }
  };

  while (fd_input_ != -1 || fd_output_ != -1 || fd_error_ != -1) {
    if (Clock::now() >= deadline) {
      ret.timed_out = true;
      break;
    }
    struct pollfd fds[3];
    int nfds = 0, idx_in = -1, idx_out = -1, idx_err = -1;
    if (fd_input_ != -1) {
      idx_in = nfds;
      fds[nfds++] = {fd_input_, POLLOUT, 0};
    }
    if (fd_output_ != -1) {
      idx_out = nfds;
      fds[nfds++] = {fd_output_, POLLIN, 0};
    }
    if (fd_error_ != -1) {
      idx_err = nfds;
      fds[nfds++] = {fd_error_, POLLIN, 0};
    }
    int res = poll(fds, nfds, RemainingMs(deadline));
    if (res < 0) {
      if (errno == EINTR) continue;
      throw SandboxSystemError(fmt::format("poll: {}", strerror(errno)), errno);
    }
    if (res == 0) continue;
    if (idx_in != -1 && fds[idx_in].revents) {
      if (fds[idx_in].revents & (POLLERR | POLLHUP)) {
        CloseFd_(fd_input_); // reader is gone
      } else {
        ssize_t n = write(fd_input_, input.data() + input_pos, input.size() - input_pos);
        if (n < 0) {
          if (errno != EINTR && errno != EAGAIN) CloseFd_(fd_input_);
        } else if ((input_pos += n) == input.size()) {
          CloseFd_(fd_input_);
        }
      }
    }
    if (idx_out != -1 && fds[idx_out].revents) Drain(fd_output_, ret.output);
    if (idx_err != -1 && fds[idx_err].revents) Drain(fd_error_, ret.error);
  }
  // the streams can be closed while the process is still running
  if (!ret.timed_out) {
    ret.exit_code = Reap_(deadline);
    if (!ret.exit_code) ret.timed_out = true;
  }
  if (ret.timed_out) {
    spdlog::debug("Deadline passed, killing pid={}", pid_);
    CloseFd_(fd_input_);
    CloseFd_(fd_output_);
    CloseFd_(fd_error_);
    kill(pid_, SIGKILL);
    while (waitpid(pid_, nullptr, 0) < 0 && errno == EINTR);
    pid_ = -1;
  }
  return ret;
}
