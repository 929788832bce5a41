/**
 * @file app.hpp
 * @brief Main application entry point and orchestrator for git-prune-merged.
 *
 * Declares the App class, which parses the command line, loads the
 * configuration, builds a deletion plan and hands it to the executor.
 */

#ifndef GIT_PRUNE_MERGED_APP_HPP
#define GIT_PRUNE_MERGED_APP_HPP

#include "cli.hpp"
#include "command_runner.hpp"
#include "config.hpp"
#include "executor.hpp"

#include <iostream>
#include <memory>
#include <ostream>

namespace gpm {

/// Process exit statuses reported by App::run().
enum ExitCode : int {
  kExitOk = 0,            ///< Dry run listed, or every deletion succeeded
  kExitConfigError = 1,   ///< Invalid flags, patterns or config file
  kExitNothingToDo = 2,   ///< No merged branch survived the filters
  kExitExternalError = 3, ///< git failed, or a deletion was rejected
  kExitInterrupted = 130  ///< Interrupted during the safety delay
};

/**
 * Main application entry point responsible for orchestrating high level
 * application flow, configuration loading, and CLI parsing.
 */
class App {
public:
  /**
   * Construct the application.
   *
   * @param runner Command runner used for git; a PosixCommandRunner is
   *        created when null.
   * @param out Stream receiving the plan and per-branch status.
   * @param token Cancellation token shared with the interrupt handler; a
   *        private token is used when null.
   */
  explicit App(std::unique_ptr<CommandRunner> runner = nullptr,
               std::ostream &out = std::cout,
               CancellationToken *token = nullptr);

  /**
   * Run the application with the given command line arguments.
   *
   * @param argc Number of CLI arguments supplied to the executable.
   * @param argv Null-terminated array containing the raw CLI arguments.
   * @return One of the ExitCode values.
   */
  int run(int argc, char **argv);

  /// Replace the function used to wait during the safety delay.
  void set_sleeper(PlanExecutor::Sleeper sleeper) {
    sleeper_ = std::move(sleeper);
  }

  /// Parsed command line options.
  const CliOptions &options() const { return options_; }

  /// Loaded configuration.
  const Config &config() const { return config_; }

private:
  int execute();
  void init_logging() const;

  std::unique_ptr<CommandRunner> runner_;
  std::ostream &out_;
  CancellationToken own_token_;
  CancellationToken *token_;
  PlanExecutor::Sleeper sleeper_;
  CliOptions options_;
  Config config_;
};

} // namespace gpm

#endif // GIT_PRUNE_MERGED_APP_HPP
