#ifndef GIT_PRUNE_MERGED_CONFIG_HPP
#define GIT_PRUNE_MERGED_CONFIG_HPP

#include "config_store.hpp"
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <unordered_map>

namespace gpm {

/// Application configuration loaded from a YAML, TOML, or JSON file.
class Config {
public:
  /// Comma separated protected branches, if configured.
  const std::optional<std::string> &skip() const { return skip_; }

  /// Set the protected branch list.
  void set_skip(const std::string &skip) { skip_ = skip; }

  /// Merge target override, if configured.
  const std::optional<std::string> &into() const { return into_; }

  /// Set the merge target override.
  void set_into(const std::string &into) { into_ = into; }

  /// Default --match pattern.
  const std::optional<std::string> &match() const { return match_; }

  /// Set the default --match pattern.
  void set_match(const std::string &pattern) { match_ = pattern; }

  /// Default --ignore pattern.
  const std::optional<std::string> &ignore() const { return ignore_; }

  /// Set the default --ignore pattern.
  void set_ignore(const std::string &pattern) { ignore_ = pattern; }

  /// Default remote scope.
  const std::optional<std::string> &remote() const { return remote_; }

  /// Set the default remote scope.
  void set_remote(const std::string &remote) { remote_ = remote; }

  /// Whether local scope is selected by default.
  bool local() const { return local_; }

  /// Select local scope by default.
  void set_local(bool local) { local_ = local; }

  /// Whether apply mode is the default.
  bool apply() const { return apply_; }

  /// Enable or disable apply mode by default.
  void set_apply(bool apply) { apply_ = apply; }

  /// Safety delay as a duration string (e.g. "5s"); empty keeps the default.
  const std::string &delay() const { return delay_; }

  /// Set the safety delay.
  void set_delay(const std::string &delay) { delay_ = delay; }

  /// Whether coloured output is allowed.
  bool color() const { return color_; }

  /// Allow or forbid coloured output.
  void set_color(bool color) { color_ = color; }

  /// Get logging verbosity level.
  const std::string &log_level() const { return log_level_; }

  /// Set logging verbosity level.
  void set_log_level(const std::string &level) { log_level_ = level; }

  /// Get logging pattern.
  const std::string &log_pattern() const { return log_pattern_; }

  /// Set logging pattern.
  void set_log_pattern(const std::string &pattern) { log_pattern_ = pattern; }

  /// Path to the log file.
  const std::string &log_file() const { return log_file_; }

  /// Set path for the log file.
  void set_log_file(const std::string &file) { log_file_ = file; }

  /// Number of rotated log files to retain (0 disables rotation).
  int log_rotate() const { return log_rotate_; }

  /// Set number of rotated log files to retain.
  void set_log_rotate(int count) { log_rotate_ = count < 0 ? 0 : count; }

  /// Retrieve configured log category overrides.
  const std::unordered_map<std::string, std::string> &log_categories() const {
    return log_categories_;
  }

  /// Replace configured log category overrides.
  void set_log_categories(std::unordered_map<std::string, std::string> values) {
    log_categories_ = std::move(values);
  }

  /**
   * Expose the persisted skip/into values as a config store.
   *
   * @return Store holding kSkipKey and kIntoKey when configured.
   */
  StaticConfigStore persisted_store() const;

  /**
   * Populate configuration values from a JSON object.
   *
   * Keys may appear at the top level or grouped under the "branches",
   * "filters", "workflow" and "logging" sections.
   *
   * @param j JSON document holding configuration keys.
   * @throws nlohmann::json::exception When a value has the wrong type.
   */
  void load_json(const nlohmann::json &j);

  /// Construct a configuration from a JSON object.
  static Config from_json(const nlohmann::json &j);

  /**
   * Load configuration from a file. The format is chosen by extension:
   * .yaml/.yml, .json, or .toml/.tml.
   *
   * @throws ConfigError When the file cannot be read or parsed, or the
   *         extension is unsupported.
   */
  static Config from_file(const std::string &path);

private:
  std::optional<std::string> skip_;
  std::optional<std::string> into_;
  std::optional<std::string> match_;
  std::optional<std::string> ignore_;
  std::optional<std::string> remote_;
  bool local_{false};
  bool apply_{false};
  std::string delay_;
  bool color_{true};
  std::string log_level_{"warn"};
  std::string log_pattern_;
  std::string log_file_;
  int log_rotate_{0};
  std::unordered_map<std::string, std::string> log_categories_;
};

} // namespace gpm

#endif // GIT_PRUNE_MERGED_CONFIG_HPP
