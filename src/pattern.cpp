#include "pattern.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>

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

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

/**
 * Translate one protection entry into an expression body.
 *
 * @param entry Protection entry, optionally tagged "glob:" or "regex:".
 * @return Expression body matching the entry.
 */
std::string protection_entry_to_regex(const std::string &entry) {
  auto colon = entry.find(':');
  if (colon != std::string::npos) {
    std::string tag = to_lower_copy(entry.substr(0, colon));
    std::string value = entry.substr(colon + 1);
    if (tag == "glob") {
      return glob_to_regex(value);
    }
    if (tag == "regex") {
      try {
        std::regex probe(value);
      } catch (const std::regex_error &e) {
        throw ConfigError("Invalid protected branch pattern '" + entry +
                          "': " + e.what());
      }
      return value;
    }
  }
  return escape_regex(entry);
}

BranchPredicate compile_search(const std::optional<std::string> &pattern,
                               BranchPredicate fallback, const char *label) {
  if (!pattern || pattern->empty()) {
    return fallback;
  }
  try {
    return BranchPredicate::regex(*pattern, false);
  } catch (const std::regex_error &e) {
    throw ConfigError(std::string("Invalid ") + label + " pattern '" +
                      *pattern + "': " + e.what());
  }
}

} // namespace

BranchPredicate BranchPredicate::never() {
  return BranchPredicate(Kind::Never, {}, nullptr, true);
}

BranchPredicate BranchPredicate::always() {
  return BranchPredicate(Kind::Always, {}, nullptr, false);
}

BranchPredicate BranchPredicate::regex(const std::string &source,
                                       bool full_match) {
  auto compiled = std::make_shared<const std::regex>(source);
  return BranchPredicate(Kind::Regex, source, std::move(compiled), full_match);
}

bool BranchPredicate::matches(const std::string &name) const {
  switch (kind_) {
  case Kind::Never:
    return false;
  case Kind::Always:
    return true;
  case Kind::Regex:
    return full_match_ ? std::regex_match(name, *compiled_)
                       : std::regex_search(name, *compiled_);
  }
  return false;
}

std::string escape_regex(const std::string &literal) {
  static const std::string special = R"(\^$.|?*+()[]{})";
  std::string out;
  out.reserve(literal.size() * 2);
  for (char c : literal) {
    if (special.find(c) != std::string::npos) {
      out += '\\';
    }
    out += c;
  }
  return out;
}

std::string glob_to_regex(const std::string &glob) {
  std::string rx;
  rx.reserve(glob.size() * 2);
  for (char c : glob) {
    switch (c) {
    case '*':
      rx += ".*";
      break;
    case '?':
      rx += '.';
      break;
    default:
      rx += escape_regex(std::string(1, c));
    }
  }
  return rx;
}

BranchPredicate compile_protection(const ProtectionSet &protection) {
  if (protection.empty()) {
    return BranchPredicate::never();
  }
  std::string alternation;
  for (const auto &entry : protection.entries) {
    if (!alternation.empty()) {
      alternation += '|';
    }
    alternation += "(?:" + protection_entry_to_regex(entry) + ")";
  }
  engine_log()->trace("Compiled protection set to '{}'", alternation);
  try {
    return BranchPredicate::regex(alternation, true);
  } catch (const std::regex_error &e) {
    throw ConfigError("Invalid protected branch list '" + protection.join() +
                      "': " + e.what());
  }
}

BranchPredicate compile_include(const std::optional<std::string> &pattern) {
  return compile_search(pattern, BranchPredicate::always(), "--match");
}

BranchPredicate compile_exclude(const std::optional<std::string> &pattern) {
  return compile_search(pattern, BranchPredicate::never(), "--ignore");
}

} // namespace gpm
