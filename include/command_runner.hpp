/**
 * @file command_runner.hpp
 * @brief Process execution used to talk to git.
 */
#ifndef GIT_PRUNE_MERGED_COMMAND_RUNNER_HPP
#define GIT_PRUNE_MERGED_COMMAND_RUNNER_HPP

#include <string>
#include <vector>

namespace gpm {

/**
 * Captured outcome of a finished command.
 */
struct CommandResult {
  int exit_code = 0; ///< Process exit status (128 + signal when killed)
  std::string out;   ///< Captured standard output
  std::string err;   ///< Captured standard error
};

/** Interface for running external commands. */
class CommandRunner {
public:
  virtual ~CommandRunner() = default;

  /**
   * Run a command to completion.
   *
   * @param argv Program name followed by its arguments. No shell is
   *        involved, so arguments are passed through verbatim.
   * @return Exit status and captured output.
   * @throws ExternalError When the process cannot be started.
   */
  virtual CommandResult run(const std::vector<std::string> &argv) = 0;
};

/**
 * CommandRunner implementation based on posix_spawnp and pipes.
 *
 * @note Not thread-safe; one instance per thread.
 */
class PosixCommandRunner : public CommandRunner {
public:
  CommandResult run(const std::vector<std::string> &argv) override;
};

} // namespace gpm

#endif // GIT_PRUNE_MERGED_COMMAND_RUNNER_HPP
