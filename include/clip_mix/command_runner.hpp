/**
 * @file command_runner.hpp
 * @brief External process execution seam
 *
 * @details Every ffmpeg invocation (encoder probe, clip transcode, concat,
 *          audio mux) goes through a CommandRunner. Production code uses
 *          ProcessCommandRunner (fork/execvp with captured output); tests
 *          substitute a fake that records argument lists.
 *
 * @note The call blocks the calling worker until the child exits. This is
 *       the only blocking point of a job.
 */

#ifndef CLIP_MIX_COMMAND_RUNNER_HPP
#define CLIP_MIX_COMMAND_RUNNER_HPP

#include <string>
#include <vector>

namespace clip_mix {

/**
 * @struct CommandResult
 * @brief Outcome of one external command.
 */
struct CommandResult {
  bool launched = false; //< false when the executable could not be started
  int exit_code = -1;    //< Exit status, or 128 + signal number
  std::string output;    //< Captured stdout and stderr, interleaved

  bool ok() const { return launched && exit_code == 0; }

  /// Last `max_chars` characters of the captured output, for error messages
  std::string tail(size_t max_chars = 800) const;
};

/**
 * @class CommandRunner
 * @brief Runs an argument list as a child process.
 * @note Implementations must be safe to call from several workers at once.
 */
class CommandRunner {
public:
  virtual ~CommandRunner() = default;

  /**
   * @brief Run args[0] with the remaining arguments.
   * @param args Executable followed by its arguments (no shell involved)
   * @return Launch flag, exit status and captured output
   */
  virtual CommandResult run(const std::vector<std::string> &args) = 0;
};

/**
 * @class ProcessCommandRunner
 * @brief fork/execvp implementation of CommandRunner.
 *
 * @attention
 *   - Arguments are passed verbatim, so paths with spaces or quotes need
 *     no escaping
 *
 *   - A failed execvp is reported through a close-on-exec pipe and yields
 *     launched == false rather than a generic exit code
 */
class ProcessCommandRunner : public CommandRunner {
public:
  CommandResult run(const std::vector<std::string> &args) override;
};

/// Render an argument list as a single line for logs
std::string join_command(const std::vector<std::string> &args);

} // namespace clip_mix

#endif // CLIP_MIX_COMMAND_RUNNER_HPP
