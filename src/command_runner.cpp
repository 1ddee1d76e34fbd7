/**
 * @file command_runner.cpp
 * @brief fork/execvp process runner with output capture
 */

#include "clip_mix/command_runner.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#include "clip_mix/logging.hpp"

namespace clip_mix {

std::string CommandResult::tail(size_t max_chars) const {
  if (output.size() <= max_chars)
    return output;
  return output.substr(output.size() - max_chars);
}

std::string join_command(const std::vector<std::string> &args) {
  std::string line;
  for (size_t i = 0; i < args.size(); ++i) {
    if (i > 0)
      line += ' ';
    if (args[i].find_first_of(" '\"") != std::string::npos) {
      line += fmt::format("\"{}\"", args[i]);
    } else {
      line += args[i];
    }
  }
  return line;
}

CommandResult ProcessCommandRunner::run(const std::vector<std::string> &args) {
  CommandResult result;
  if (args.empty()) {
    return result;
  }

  /// argv must be built before fork; the child may only call
  /// async-signal-safe functions
  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (const auto &a : args) {
    argv.push_back(const_cast<char *>(a.c_str()));
  }
  argv.push_back(nullptr);

  int out_pipe[2];
  int err_pipe[2];
  if (pipe2(out_pipe, O_CLOEXEC) == -1) {
    LOG_ERROR("pipe2 failed: {}", std::strerror(errno));
    return result;
  }
  if (pipe2(err_pipe, O_CLOEXEC) == -1) {
    LOG_ERROR("pipe2 failed: {}", std::strerror(errno));
    close(out_pipe[0]);
    close(out_pipe[1]);
    return result;
  }

  pid_t pid = fork();
  if (pid == -1) {
    LOG_ERROR("fork failed: {}", std::strerror(errno));
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[0]);
    close(err_pipe[1]);
    return result;
  }

  if (pid == 0) {
    /// Child: stdout and stderr both feed the capture pipe
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(out_pipe[1], STDERR_FILENO);
    int devnull = open("/dev/null", O_RDONLY);
    if (devnull != -1) {
      dup2(devnull, STDIN_FILENO);
    }
    execvp(argv[0], argv.data());

    /// Only reached if exec failed: report errno to the parent
    int exec_errno = errno;
    ssize_t ignored = write(err_pipe[1], &exec_errno, sizeof(exec_errno));
    (void)ignored;
    _exit(127);
  }

  close(out_pipe[1]);
  close(err_pipe[1]);

  char buf[4096];
  for (;;) {
    ssize_t n = read(out_pipe[0], buf, sizeof(buf));
    if (n > 0) {
      result.output.append(buf, static_cast<size_t>(n));
    } else if (n == -1 && errno == EINTR) {
      continue;
    } else {
      break;
    }
  }
  close(out_pipe[0]);

  int exec_errno = 0;
  ssize_t got;
  do {
    got = read(err_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (got == -1 && errno == EINTR);
  close(err_pipe[0]);

  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      LOG_ERROR("waitpid failed: {}", std::strerror(errno));
      return result;
    }
  }

  if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
    result.launched = false;
    result.exit_code = 127;
    result.output = fmt::format("cannot execute {}: {}", args[0],
                                std::strerror(exec_errno));
    return result;
  }

  result.launched = true;
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

} // namespace clip_mix
