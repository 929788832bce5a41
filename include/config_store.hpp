/**
 * @file config_store.hpp
 * @brief Read-only key/value lookups for persisted settings.
 *
 * The resolvers read persisted overrides through this interface instead of
 * touching git or the filesystem directly, which keeps them pure and easy to
 * exercise with in-memory stores.
 */
#ifndef GIT_PRUNE_MERGED_CONFIG_STORE_HPP
#define GIT_PRUNE_MERGED_CONFIG_STORE_HPP

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace gpm {

class GitClient;

/// Persisted key holding the comma separated list of protected branches.
inline constexpr const char *kSkipKey = "prune-merged.skip";
/// Persisted key holding the merge target override.
inline constexpr const char *kIntoKey = "prune-merged.into";

/** Interface for persisted configuration lookups. */
class ConfigStore {
public:
  virtual ~ConfigStore() = default;

  /**
   * Look up a persisted value.
   *
   * @param key Dotted configuration key such as "prune-merged.skip".
   * @return The stored value, or std::nullopt when the key is absent.
   */
  virtual std::optional<std::string> get(const std::string &key) const = 0;
};

/** In-memory store, used for values loaded from a config file. */
class StaticConfigStore : public ConfigStore {
public:
  StaticConfigStore() = default;
  explicit StaticConfigStore(
      std::unordered_map<std::string, std::string> values)
      : values_(std::move(values)) {}

  std::optional<std::string> get(const std::string &key) const override;

  /// Set or replace a value.
  void set(const std::string &key, const std::string &value) {
    values_[key] = value;
  }

private:
  std::unordered_map<std::string, std::string> values_;
};

/** Store backed by `git config --get`. */
class GitConfigStore : public ConfigStore {
public:
  explicit GitConfigStore(const GitClient &git) : git_(git) {}

  std::optional<std::string> get(const std::string &key) const override;

private:
  const GitClient &git_;
};

/**
 * Store that consults a list of stores in order and returns the first hit.
 *
 * The stores are borrowed and must outlive the chain.
 */
class ChainedConfigStore : public ConfigStore {
public:
  explicit ChainedConfigStore(std::vector<const ConfigStore *> stores)
      : stores_(std::move(stores)) {}

  std::optional<std::string> get(const std::string &key) const override;

private:
  std::vector<const ConfigStore *> stores_;
};

} // namespace gpm

#endif // GIT_PRUNE_MERGED_CONFIG_STORE_HPP
