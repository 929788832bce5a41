/**
 * @file executor.hpp
 * @brief Reporting and execution of deletion plans.
 *
 * Declares the cancellation token used by the SIGINT handler and the
 * PlanExecutor that prints a plan and, in apply mode, deletes its branches
 * after a safety delay.
 */
#ifndef GIT_PRUNE_MERGED_EXECUTOR_HPP
#define GIT_PRUNE_MERGED_EXECUTOR_HPP

#include "git_client.hpp"
#include "plan.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <ostream>
#include <vector>

namespace gpm {

/**
 * @brief Flag raised when the user interrupts a run.
 *
 * Setting the flag is async-signal-safe.
 */
class CancellationToken {
public:
  void cancel() noexcept { cancelled_.store(true); }
  bool cancelled() const noexcept { return cancelled_.load(); }
  void reset() noexcept { cancelled_.store(false); }

private:
  std::atomic<bool> cancelled_{false};
};

/**
 * Route SIGINT and SIGTERM to @p token for the lifetime of the process.
 *
 * @param token Token to cancel; must outlive every signal delivery.
 */
void install_interrupt_handler(CancellationToken &token);

/** \brief Executor settings. */
struct ExecutorOptions {
  std::chrono::milliseconds delay{5000}; ///< Pause before apply-mode deletes
  bool color{false};                     ///< Emit ANSI colour codes
};

/** \brief Outcome of executing one plan. */
struct ExecutionReport {
  bool cancelled{false};               ///< Interrupted before deleting
  std::vector<DeletionResult> results; ///< One entry per attempted deletion

  /// Number of deletions git rejected.
  std::size_t failures() const;
};

/**
 * @brief Consumes a Plan: prints it and, in apply mode, deletes it.
 */
class PlanExecutor {
public:
  /// Blocks for the given slice of the safety delay.
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  /**
   * @param git Client used to issue deletions.
   * @param out Stream receiving the user-facing report.
   * @param options Delay and colour settings.
   * @param token Cancellation flag checked throughout the delay.
   * @param sleeper Sleep function; defaults to std::this_thread::sleep_for.
   */
  PlanExecutor(const GitClient &git, std::ostream &out,
               ExecutorOptions options, const CancellationToken &token,
               Sleeper sleeper = Sleeper{});

  /// Print the scope, target, protection set and selected branches.
  void report(const Plan &plan);

  /**
   * Report @p plan and, in apply mode, delete its branches once the safety
   * delay has elapsed. A cancellation observed before the delay ends means
   * no deletion is issued.
   */
  ExecutionReport execute(const Plan &plan);

private:
  bool wait_safety_delay();
  std::string paint(const std::string &text, const char *code) const;

  const GitClient &git_;
  std::ostream &out_;
  ExecutorOptions options_;
  const CancellationToken &token_;
  Sleeper sleeper_;
};

} // namespace gpm

#endif // GIT_PRUNE_MERGED_EXECUTOR_HPP
