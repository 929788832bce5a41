#ifndef GIT_PRUNE_MERGED_GIT_CLIENT_HPP
#define GIT_PRUNE_MERGED_GIT_CLIENT_HPP

#include "command_runner.hpp"
#include "scope.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gpm {

/**
 * Outcome of a single branch deletion.
 */
struct DeletionResult {
  std::string branch;  ///< Branch name as it appears in the plan
  bool deleted{false}; ///< True when git reported success
  std::string message; ///< git's output, trimmed
};

/**
 * Thin wrapper over the git executable.
 *
 * Lists merged branches for a scope with the scope noise already removed,
 * deletes branches and reads `git config`. All calls go through the injected
 * CommandRunner so tests can supply canned git output.
 */
class GitClient {
public:
  /**
   * Construct a client.
   *
   * @param runner Process runner used for every git invocation.
   * @param git_executable Name or path of the git binary.
   */
  explicit GitClient(std::unique_ptr<CommandRunner> runner,
                     std::string git_executable = "git");

  /**
   * Short name of the checked-out branch.
   *
   * @return Branch name, or an empty string for a detached HEAD.
   */
  std::string current_branch() const;

  /**
   * Upstream of the checked-out branch in "remote/branch" form.
   *
   * @return Upstream name, or an empty string when none is configured.
   */
  std::string upstream_branch() const;

  /// Names of the configured remotes.
  std::vector<std::string> remotes() const;

  /**
   * List branches merged into @p target within @p scope.
   *
   * Local results exclude the current branch and the target. Remote results
   * are stripped of the "<remote>/" prefix and exclude the HEAD alias, the
   * upstream of the current branch and the target.
   *
   * @param target Merge target passed to `git branch --merged`.
   * @param scope Local branches or one remote.
   * @return Branch names in the order git listed them.
   * @throws ExternalError When git fails or the remote does not exist.
   */
  std::vector<std::string> list_merged(const std::string &target,
                                       const Scope &scope) const;

  /**
   * Delete one branch. Local branches use `git branch -d`, which refuses
   * branches that are not fully merged; remote branches use
   * `git push <remote> --delete`.
   *
   * @return Per-branch outcome; git failures are reported, not thrown.
   * @throws ExternalError When git cannot be started at all.
   */
  DeletionResult delete_branch(const Scope &scope,
                               const std::string &branch) const;

  /**
   * Read a value with `git config --get`.
   *
   * @param key Configuration key, e.g. "prune-merged.skip".
   * @return Value, or std::nullopt when the key is unset.
   * @throws ExternalError For failures other than a missing key.
   */
  std::optional<std::string> config_get(const std::string &key) const;

private:
  CommandResult git(const std::vector<std::string> &args) const;

  std::unique_ptr<CommandRunner> runner_;
  std::string git_executable_;
};

} // namespace gpm

#endif // GIT_PRUNE_MERGED_GIT_CLIENT_HPP
