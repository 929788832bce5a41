#include "scope.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>

namespace gpm {

std::string to_string(const Scope &scope) {
  if (is_local(scope)) {
    return "local";
  }
  return "remote '" + remote_name(scope) + "'";
}

Scope resolve_scope(bool local, const std::optional<std::string> &remote) {
  if (local && remote) {
    throw ConfigError("--local and --remote are mutually exclusive");
  }
  if (!local && !remote) {
    throw ConfigError("Select exactly one of --local or --remote NAME");
  }
  if (local) {
    return LocalScope{};
  }
  const std::string &name = *remote;
  bool blank = std::all_of(name.begin(), name.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  if (blank) {
    throw ConfigError("--remote requires a remote name");
  }
  return RemoteScope{name};
}

} // namespace gpm
