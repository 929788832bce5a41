/**
 * @file resolver.hpp
 * @brief Protection set and merge target resolution.
 *
 * Both resolvers follow the same precedence: an explicit value supplied on
 * the command line, then the persisted value from the config store, then the
 * built-in default.
 */
#ifndef GIT_PRUNE_MERGED_RESOLVER_HPP
#define GIT_PRUNE_MERGED_RESOLVER_HPP

#include "config_store.hpp"

#include <optional>
#include <string>
#include <vector>

namespace gpm {

/// Protected branches used when neither the CLI nor the store names any.
inline constexpr const char *kDefaultProtection = "master,main,develop";
/// Merge target used when neither the CLI nor the store names one.
inline constexpr const char *kDefaultTarget = "origin/master";

/**
 * Ordered list of branch names that must never be deleted.
 *
 * Untagged entries are exact names. Entries tagged "glob:" or "regex:" are
 * patterns; git forbids ':' in branch names so a tagged entry never collides
 * with a literal one.
 */
struct ProtectionSet {
  std::vector<std::string> entries;

  bool empty() const { return entries.empty(); }

  /// Comma separated rendering, as accepted by --skip.
  std::string join() const;
};

inline bool operator==(const ProtectionSet &a, const ProtectionSet &b) {
  return a.entries == b.entries;
}

/**
 * Split a comma separated branch list, trimming whitespace and discarding
 * empty entries.
 */
std::vector<std::string> split_branch_list(const std::string &list);

/**
 * Compute the protection set.
 *
 * A present @p explicit_override replaces the persisted and default sets
 * entirely, even when it is blank.
 *
 * @param explicit_override Value of --skip, if given.
 * @param store Persisted configuration consulted for kSkipKey.
 * @return Resolved protection set in declaration order.
 */
ProtectionSet resolve_protection(const std::optional<std::string> &explicit_override,
                                 const ConfigStore &store);

/**
 * Compute the merge target.
 *
 * @param explicit_into Value of --into, if given.
 * @param store Persisted configuration consulted for kIntoKey.
 * @return Branch used as the "already merged" baseline.
 * @throws ConfigError When the explicit or persisted value is blank.
 */
std::string resolve_target(const std::optional<std::string> &explicit_into,
                           const ConfigStore &store);

} // namespace gpm

#endif // GIT_PRUNE_MERGED_RESOLVER_HPP
