#include "process_runner.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace toolbridge {
namespace {

static void CloseFd(int* fd) {
  if (*fd >= 0) {
    close(*fd);
    *fd = -1;
  }
}

static void ClosePipe(int p[2]) {
  CloseFd(&p[0]);
  CloseFd(&p[1]);
}

// Drains both pipes until the child closes them.
static void ReadAll(int out_fd, int err_fd, std::string* out, std::string* err_text) {
  std::array<char, 4096> buf{};
  int fds[2] = {out_fd, err_fd};
  std::string* sinks[2] = {out, err_text};
  while (fds[0] >= 0 || fds[1] >= 0) {
    struct pollfd pfds[2]{};
    nfds_t n = 0;
    int index[2] = {-1, -1};
    for (int i = 0; i < 2; i++) {
      if (fds[i] < 0) continue;
      pfds[n].fd = fds[i];
      pfds[n].events = POLLIN;
      index[n] = i;
      n++;
    }
    const int rc = poll(pfds, n, -1);
    if (rc < 0) {
      if (errno == EINTR) continue;
      break;
    }
    for (nfds_t k = 0; k < n; k++) {
      if ((pfds[k].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;
      const int i = index[k];
      const ssize_t bytes = read(fds[i], buf.data(), buf.size());
      if (bytes > 0) {
        sinks[i]->append(buf.data(), static_cast<size_t>(bytes));
      } else if (bytes == 0 || errno != EINTR) {
        CloseFd(&fds[i]);
      }
    }
  }
  CloseFd(&fds[0]);
  CloseFd(&fds[1]);
}

}  // namespace

std::optional<ProcessResult> PosixProcessRunner::Run(const std::vector<std::string>& argv, std::string* err) {
  if (argv.empty()) {
    if (err) *err = "empty argv";
    return std::nullopt;
  }

  std::vector<char*> c_args;
  c_args.reserve(argv.size() + 1);
  for (const auto& a : argv) c_args.push_back(const_cast<char*>(a.c_str()));
  c_args.push_back(nullptr);

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};
  if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0 || pipe2(exec_pipe, O_CLOEXEC) != 0) {
    if (err) *err = "failed to create pipes: " + std::string(strerror(errno));
    ClosePipe(out_pipe);
    ClosePipe(err_pipe);
    ClosePipe(exec_pipe);
    return std::nullopt;
  }

  const pid_t pid = fork();
  if (pid < 0) {
    if (err) *err = "failed to fork: " + std::string(strerror(errno));
    ClosePipe(out_pipe);
    ClosePipe(err_pipe);
    ClosePipe(exec_pipe);
    return std::nullopt;
  }

  if (pid == 0) {
    const int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) dup2(devnull, STDIN_FILENO);
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    execvp(c_args[0], c_args.data());
    const int code = errno;
    (void)!write(exec_pipe[1], &code, sizeof(code));
    _exit(127);
  }

  CloseFd(&out_pipe[1]);
  CloseFd(&err_pipe[1]);
  CloseFd(&exec_pipe[1]);

  // The exec pipe is close-on-exec: EOF means execvp succeeded.
  int exec_errno = 0;
  ssize_t n = 0;
  do {
    n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  CloseFd(&exec_pipe[0]);

  ProcessResult result;
  ReadAll(out_pipe[0], err_pipe[0], &result.stdout_text, &result.stderr_text);

  int status = 0;
  pid_t waited = 0;
  do {
    waited = waitpid(pid, &status, 0);
  } while (waited < 0 && errno == EINTR);
  if (waited < 0) {
    if (err) *err = "failed to wait for " + argv[0] + ": " + std::string(strerror(errno));
    return std::nullopt;
  }

  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    if (err) *err = "failed to execute " + argv[0] + ": " + std::string(strerror(exec_errno));
    return std::nullopt;
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

}  // namespace toolbridge
