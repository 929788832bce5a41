#include "config_store.hpp"
#include "git_client.hpp"

namespace gpm {

std::optional<std::string> StaticConfigStore::get(const std::string &key) const {
  auto it = values_.find(key);
  if (it == values_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<std::string> GitConfigStore::get(const std::string &key) const {
  return git_.config_get(key);
}

std::optional<std::string>
ChainedConfigStore::get(const std::string &key) const {
  for (const ConfigStore *store : stores_) {
    if (store == nullptr) {
      continue;
    }
    if (auto value = store->get(key)) {
      return value;
    }
  }
  return std::nullopt;
}

} // namespace gpm
