#include "process/process_runner.hpp"

#include <cctype>
#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace kbake::process {

namespace {

// Owns one pipe end; closes on scope exit.
class FdGuard {
public:
  FdGuard() = default;
  explicit FdGuard(int fd) : fd_(fd) {}
  ~FdGuard() {
    Reset();
  }

  FdGuard(const FdGuard&) = delete;
  FdGuard& operator=(const FdGuard&) = delete;

  int Get() const {
    return fd_;
  }

  void Reset(int fd = -1) {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

private:
  int fd_ = -1;
};

bool MakePipe(FdGuard& read_end, FdGuard& write_end, std::string& error) {
  int fds[2] = {-1, -1};
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    error = std::string("failed to create pipe: ") + std::strerror(errno);
    return false;
  }
  read_end.Reset(fds[0]);
  write_end.Reset(fds[1]);
  return true;
}

std::string TrimTrailingWhitespace(std::string text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.pop_back();
  }
  return text;
}

// Reads both child streams until each reaches EOF. Interleaving is handled by
// poll() so a child filling its stderr pipe cannot stall on a full stdout.
bool DrainStreams(int stdout_fd, int stderr_fd, ProcessResult& result, std::ostream* echo,
                  std::string& error) {
  pollfd fds[2] = {{stdout_fd, POLLIN, 0}, {stderr_fd, POLLIN, 0}};
  std::string* sinks[2] = {&result.stdout_text, &result.stderr_text};
  int open_streams = 2;
  char buffer[4096];

  while (open_streams > 0) {
    const int ready = ::poll(fds, 2, -1);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      error = std::string("poll on child output failed: ") + std::strerror(errno);
      return false;
    }

    for (int i = 0; i < 2; ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0) {
        continue;
      }
      const ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
      if (n < 0 && errno == EINTR) {
        continue;
      }
      if (n <= 0) {
        fds[i].fd = -1;
        --open_streams;
        continue;
      }
      sinks[i]->append(buffer, static_cast<std::size_t>(n));
      if (i == 0 && echo != nullptr) {
        echo->write(buffer, n);
        echo->flush();
      }
    }
  }
  return true;
}

bool WaitForChild(pid_t pid, int& exit_code, std::string& error) {
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      error = std::string("waitpid failed: ") + std::strerror(errno);
      return false;
    }
  }

  if (WIFEXITED(status)) {
    exit_code = WEXITSTATUS(status);
    return true;
  }
  if (WIFSIGNALED(status)) {
    exit_code = 128 + WTERMSIG(status);
    error = "terminated by signal " + std::to_string(WTERMSIG(status));
    return false;
  }
  exit_code = -1;
  error = "exited with unknown status";
  return false;
}

} // namespace

std::string FormatCommandLine(const std::string& executable, const std::vector<std::string>& args) {
  auto quote = [](const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos) {
      return arg;
    }
    return "\"" + arg + "\"";
  };

  std::string line = quote(executable);
  for (const std::string& arg : args) {
    line.push_back(' ');
    line += quote(arg);
  }
  return line;
}

bool PosixProcessRunner::Run(const std::string& executable, const std::vector<std::string>& args,
                             const ProcessOptions& options, ProcessResult& result,
                             std::string& error) {
  result = ProcessResult{};
  error.clear();

  if (executable.empty()) {
    error = "executable path cannot be empty";
    return false;
  }

  if (!options.silent) {
    (*echo_) << "[command]" << FormatCommandLine(executable, args) << '\n';
    echo_->flush();
  }

  FdGuard stdout_read;
  FdGuard stdout_write;
  FdGuard stderr_read;
  FdGuard stderr_write;
  // Closed by a successful exec; carries errno back when exec fails.
  FdGuard exec_status_read;
  FdGuard exec_status_write;
  if (!MakePipe(stdout_read, stdout_write, error) ||
      !MakePipe(stderr_read, stderr_write, error) ||
      !MakePipe(exec_status_read, exec_status_write, error)) {
    return false;
  }

  std::vector<char*> argv;
  argv.reserve(args.size() + 2U);
  argv.push_back(const_cast<char*>(executable.c_str()));
  for (const std::string& arg : args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    error = std::string("fork failed: ") + std::strerror(errno);
    return false;
  }

  if (pid == 0) {
    ::dup2(stdout_write.Get(), STDOUT_FILENO);
    ::dup2(stderr_write.Get(), STDERR_FILENO);
    ::execvp(executable.c_str(), argv.data());
    const int exec_errno = errno;
    ssize_t ignored = ::write(exec_status_write.Get(), &exec_errno, sizeof(exec_errno));
    (void)ignored;
    ::_exit(127);
  }

  stdout_write.Reset();
  stderr_write.Reset();
  exec_status_write.Reset();

  int exec_errno = 0;
  ssize_t status_bytes = 0;
  do {
    status_bytes = ::read(exec_status_read.Get(), &exec_errno, sizeof(exec_errno));
  } while (status_bytes < 0 && errno == EINTR);

  std::string drain_error;
  const bool drained = DrainStreams(stdout_read.Get(), stderr_read.Get(), result,
                                    options.silent ? nullptr : echo_, drain_error);

  std::string wait_error;
  const bool exited = WaitForChild(pid, result.exit_code, wait_error);

  if (status_bytes == static_cast<ssize_t>(sizeof(exec_errno))) {
    error = "unable to execute '" + executable + "': " + std::strerror(exec_errno);
    return false;
  }
  if (!drained) {
    error = "'" + executable + "' output capture failed: " + drain_error;
    return false;
  }
  if (!exited) {
    error = "'" + executable + "' " + wait_error;
    return false;
  }
  if (result.exit_code != 0) {
    error = "'" + FormatCommandLine(executable, args) + "' failed with exit code " +
            std::to_string(result.exit_code);
    const std::string stderr_tail = TrimTrailingWhitespace(result.stderr_text);
    if (!stderr_tail.empty()) {
      error += ": " + stderr_tail;
    }
    return false;
  }
  return true;
}

} // namespace kbake::process
