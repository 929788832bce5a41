/**
 * @file scope.hpp
 * @brief Scope and run mode selection for git-prune-merged.
 *
 * A scope is either the local branch namespace or the branches of one named
 * remote. It is modelled as a sum type so that "both" and "neither" cannot be
 * represented once the command line has been resolved.
 */
#ifndef GIT_PRUNE_MERGED_SCOPE_HPP
#define GIT_PRUNE_MERGED_SCOPE_HPP

#include <optional>
#include <string>
#include <variant>

namespace gpm {

/** \brief Operate on local branches (refs/heads). */
struct LocalScope {};

/** \brief Operate on the branches of one remote (refs/remotes/<name>). */
struct RemoteScope {
  std::string name; ///< Remote name, e.g. "origin"
};

inline bool operator==(const LocalScope &, const LocalScope &) { return true; }
inline bool operator==(const RemoteScope &a, const RemoteScope &b) {
  return a.name == b.name;
}

using Scope = std::variant<LocalScope, RemoteScope>;

/** \brief Whether a plan only reports or actually deletes. */
enum class RunMode {
  DryRun, ///< List the branches that would be deleted
  Apply   ///< Delete the selected branches
};

/**
 * @brief Returns true if the scope targets local branches.
 */
inline bool is_local(const Scope &scope) {
  return std::holds_alternative<LocalScope>(scope);
}

/**
 * @brief Returns the remote name for a remote scope, empty for local.
 */
inline std::string remote_name(const Scope &scope) {
  if (const auto *remote = std::get_if<RemoteScope>(&scope)) {
    return remote->name;
  }
  return {};
}

/**
 * @brief Human readable description ("local" or "remote 'origin'").
 */
std::string to_string(const Scope &scope);

/**
 * @brief Converts a RunMode to "dry-run" or "apply".
 */
inline std::string to_string(RunMode mode) {
  return mode == RunMode::Apply ? "apply" : "dry-run";
}

/**
 * Resolve the two independent scope flags into a Scope.
 *
 * @param local True when local branches were requested.
 * @param remote Remote name when a remote was requested.
 * @return The selected scope.
 * @throws ConfigError When both or neither scope is selected, or when the
 *         remote name is empty.
 */
Scope resolve_scope(bool local, const std::optional<std::string> &remote);

} // namespace gpm

#endif // GIT_PRUNE_MERGED_SCOPE_HPP
