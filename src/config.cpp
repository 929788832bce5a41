#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace gpm {

namespace {

std::shared_ptr<spdlog::logger> config_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("config");
  }();
  return logger;
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

bool is_text_key(const std::string &key) {
  static const std::array<std::string_view, 7> keys = {
      "skip",   "into",      "match",         "ignore",
      "remote", "log_level", "log_categories"};
  return std::find(keys.begin(), keys.end(), key) != keys.end();
}

/**
 * Convert a YAML node into a structurally equivalent JSON value.
 *
 * Scalars that spell booleans or integers become JSON booleans and numbers;
 * everything else stays a string. Sequences and maps recurse. Values under
 * keys that hold branch names or patterns are always kept as text.
 *
 * @param node YAML node to transform.
 * @param as_text Keep every scalar below @p node as a string.
 * @return JSON value mirroring the YAML content.
 */
nlohmann::json yaml_to_json(const YAML::Node &node, bool as_text = false) {
  using nlohmann::json;
  switch (node.Type()) {
  case YAML::NodeType::Null:
    return nullptr;
  case YAML::NodeType::Scalar: {
    const std::string s = node.Scalar();
    if (as_text || node.Tag() == "!") {
      return s; // explicitly quoted or a name
    }
    const std::string lower = to_lower_copy(s);
    if (lower == "true" || lower == "yes" || lower == "on")
      return true;
    if (lower == "false" || lower == "no" || lower == "off")
      return false;
    if (!s.empty() &&
        std::all_of(s.begin(), s.end(), [](unsigned char c) {
          return std::isdigit(c) != 0;
        }) &&
        s.size() < 10) {
      return std::stoi(s);
    }
    return s;
  }
  case YAML::NodeType::Sequence: {
    json items = json::array();
    for (std::size_t i = 0; i < node.size(); ++i) {
      items.push_back(yaml_to_json(node[i], as_text));
    }
    return items;
  }
  case YAML::NodeType::Map: {
    json fields = json::object();
    for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
      const std::string key = it->first.Scalar();
      fields[key] = yaml_to_json(it->second, as_text || is_text_key(key));
    }
    return fields;
  }
  default:
    return nullptr;
  }
}

/**
 * Translate a TOML node to a JSON representation. Dates and times keep their
 * TOML spelling as strings.
 */
nlohmann::json toml_to_json(const toml::node &node) {
  return node.visit([](const auto &value) -> nlohmann::json {
    using node_type = std::decay_t<decltype(value)>;
    if constexpr (toml::is_table<node_type>) {
      nlohmann::json fields = nlohmann::json::object();
      value.for_each([&fields](const toml::key &key, const auto &child) {
        fields[std::string(key.str())] = toml_to_json(child);
      });
      return fields;
    } else if constexpr (toml::is_array<node_type>) {
      nlohmann::json items = nlohmann::json::array();
      for (const toml::node &child : value) {
        items.push_back(toml_to_json(child));
      }
      return items;
    } else if constexpr (toml::is_date<node_type> ||
                         toml::is_time<node_type> ||
                         toml::is_date_time<node_type>) {
      std::ostringstream text;
      text << value;
      return text.str();
    } else {
      return value.get();
    }
  });
}

/**
 * Merge recognised configuration sections into the root object so grouped
 * files expose the same flat keys that the loader expects.
 */
nlohmann::json normalize_config_sections(const nlohmann::json &source) {
  nlohmann::json normalized = source;
  auto merge_section = [&normalized](std::string_view name) {
    auto it = normalized.find(std::string{name});
    if (it == normalized.end() || !it->is_object()) {
      return;
    }
    const nlohmann::json section = *it;
    for (const auto &[key, value] : section.items()) {
      normalized[key] = value;
    }
  };

  for (std::string_view section : {"branches", "filters", "workflow", "logging"}) {
    merge_section(section);
  }
  return normalized;
}

/**
 * Read a branch list that may be written as a comma separated string or as
 * an array of names.
 */
std::string branch_list_value(const nlohmann::json &value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_array()) {
    std::string joined;
    for (const auto &item : value) {
      if (!joined.empty()) {
        joined += ',';
      }
      joined += item.get<std::string>();
    }
    return joined;
  }
  throw std::runtime_error("'skip' must be a string or a list of strings");
}

/**
 * Read a duration that may be a number of seconds or a duration string.
 */
std::string duration_value(const nlohmann::json &value) {
  if (value.is_number_integer()) {
    return std::to_string(value.get<long long>()) + "s";
  }
  return value.get<std::string>();
}

} // namespace

StaticConfigStore Config::persisted_store() const {
  StaticConfigStore store;
  if (skip_) {
    store.set(kSkipKey, *skip_);
  }
  if (into_) {
    store.set(kIntoKey, *into_);
  }
  return store;
}

void Config::load_json(const nlohmann::json &j) {
  nlohmann::json cfg = normalize_config_sections(j);

  if (cfg.contains("skip")) {
    set_skip(branch_list_value(cfg["skip"]));
  }
  if (cfg.contains("into")) {
    set_into(cfg["into"].get<std::string>());
  }
  if (cfg.contains("match")) {
    set_match(cfg["match"].get<std::string>());
  }
  if (cfg.contains("ignore")) {
    set_ignore(cfg["ignore"].get<std::string>());
  }
  if (cfg.contains("remote")) {
    set_remote(cfg["remote"].get<std::string>());
  }
  if (cfg.contains("local")) {
    set_local(cfg["local"].get<bool>());
  }
  if (cfg.contains("apply")) {
    set_apply(cfg["apply"].get<bool>());
  }
  if (cfg.contains("delay")) {
    set_delay(duration_value(cfg["delay"]));
  }
  if (cfg.contains("color")) {
    set_color(cfg["color"].get<bool>());
  }
  if (cfg.contains("log_level")) {
    set_log_level(cfg["log_level"].get<std::string>());
  }
  if (cfg.contains("log_pattern")) {
    set_log_pattern(cfg["log_pattern"].get<std::string>());
  }
  if (cfg.contains("log_file")) {
    set_log_file(cfg["log_file"].get<std::string>());
  }
  if (cfg.contains("log_rotate")) {
    set_log_rotate(cfg["log_rotate"].get<int>());
  }
  if (cfg.contains("log_categories")) {
    std::unordered_map<std::string, std::string> categories;
    const auto &value = cfg["log_categories"];
    if (value.is_object()) {
      for (const auto &[key, v] : value.items()) {
        categories[key] = v.is_string() ? v.get<std::string>() : "debug";
      }
    } else if (value.is_array()) {
      for (const auto &item : value) {
        auto entry = item.get<std::string>();
        auto pos = entry.find('=');
        if (pos == std::string::npos) {
          categories[entry] = "debug";
        } else {
          categories[entry.substr(0, pos)] = entry.substr(pos + 1);
        }
      }
    }
    set_log_categories(std::move(categories));
  }
}

Config Config::from_json(const nlohmann::json &j) {
  Config cfg;
  cfg.load_json(j);
  return cfg;
}

Config Config::from_file(const std::string &path) {
  config_log()->debug("Loading config from {}", path);
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos) {
    throw ConfigError("Unknown config file extension for " + path);
  }
  const std::string ext = to_lower_copy(path.substr(pos + 1));
  nlohmann::json j;
  try {
    if (ext == "yaml" || ext == "yml") {
      j = yaml_to_json(YAML::LoadFile(path));
    } else if (ext == "json") {
      std::ifstream f(path);
      if (!f) {
        throw std::runtime_error("cannot open file");
      }
      f >> j;
    } else if (ext == "toml" || ext == "tml") {
      toml::table tbl = toml::parse_file(path);
      j = toml_to_json(tbl);
    } else {
      throw ConfigError("Unsupported config format '" + ext + "' for " + path);
    }
  } catch (const ConfigError &) {
    throw;
  } catch (const std::exception &e) {
    config_log()->error("Failed to load config {}: {}", path, e.what());
    throw ConfigError("Failed to load config " + path + ": " + e.what());
  }
  Config cfg;
  try {
    cfg.load_json(j);
  } catch (const std::exception &e) {
    throw ConfigError("Invalid config " + path + ": " + e.what());
  }
  config_log()->info("Config loaded from {}", path);
  return cfg;
}

} // namespace gpm
