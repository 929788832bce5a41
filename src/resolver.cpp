#include "resolver.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <sstream>

#include <spdlog/spdlog.h>

namespace gpm {

namespace {

std::shared_ptr<spdlog::logger> engine_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("engine");
  }();
  return logger;
}

std::string trim(const std::string &s) {
  auto first = std::find_if_not(
      s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
  if (first == s.end())
    return {};
  auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
                return std::isspace(c);
              }).base();
  return std::string(first, last);
}

} // namespace

std::string ProtectionSet::join() const {
  std::string out;
  for (std::size_t i = 0; i < entries.size(); ++i) {
    if (i != 0) {
      out += ',';
    }
    out += entries[i];
  }
  return out;
}

std::vector<std::string> split_branch_list(const std::string &list) {
  std::vector<std::string> out;
  std::stringstream ss(list);
  std::string item;
  while (std::getline(ss, item, ',')) {
    item = trim(item);
    if (!item.empty()) {
      out.push_back(item);
    }
  }
  return out;
}

ProtectionSet resolve_protection(const std::optional<std::string> &explicit_override,
                                 const ConfigStore &store) {
  ProtectionSet result;
  if (explicit_override) {
    result.entries = split_branch_list(*explicit_override);
    engine_log()->debug("Protection set from --skip: [{}]", result.join());
    return result;
  }
  if (auto persisted = store.get(kSkipKey)) {
    result.entries = split_branch_list(*persisted);
    engine_log()->debug("Protection set from {}: [{}]", kSkipKey,
                        result.join());
    return result;
  }
  result.entries = split_branch_list(kDefaultProtection);
  engine_log()->debug("Protection set defaulted to [{}]", result.join());
  return result;
}

std::string resolve_target(const std::optional<std::string> &explicit_into,
                           const ConfigStore &store) {
  std::optional<std::string> chosen = explicit_into;
  const char *source = "--into";
  if (!chosen) {
    chosen = store.get(kIntoKey);
    source = kIntoKey;
  }
  if (!chosen) {
    engine_log()->debug("Merge target defaulted to {}", kDefaultTarget);
    return kDefaultTarget;
  }
  std::string target = trim(*chosen);
  if (target.empty()) {
    throw ConfigError(std::string("Merge target from ") + source +
                      " must not be empty");
  }
  engine_log()->debug("Merge target from {}: {}", source, target);
  return target;
}

} // namespace gpm
