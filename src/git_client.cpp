/**
 * @file git_client.cpp
 * @brief git command wrappers and output parsing.
 */

#include "git_client.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace gpm {

namespace {

constexpr const char *kHeadsPrefix = "refs/heads/";
constexpr const char *kRemotesPrefix = "refs/remotes/";

std::shared_ptr<spdlog::logger> git_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("git");
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

std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> lines;
  std::stringstream ss(text);
  std::string line;
  while (std::getline(ss, line)) {
    line = trim(line);
    if (!line.empty()) {
      lines.push_back(line);
    }
  }
  return lines;
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.size() >= prefix.size() &&
         value.compare(0, prefix.size(), prefix) == 0;
}

/**
 * Strip "<remote>/" or "refs/remotes/<remote>/" from @p ref.
 *
 * @return The branch part, or an empty string when @p ref belongs to a
 *         different remote.
 */
std::string strip_remote(const std::string &ref, const std::string &remote) {
  const std::string short_prefix = remote + "/";
  const std::string full_prefix = std::string(kRemotesPrefix) + short_prefix;
  if (starts_with(ref, full_prefix)) {
    return ref.substr(full_prefix.size());
  }
  if (starts_with(ref, short_prefix)) {
    return ref.substr(short_prefix.size());
  }
  return {};
}

std::string describe_failure(const std::vector<std::string> &args,
                             const CommandResult &result) {
  std::string message = trim(result.err);
  if (message.empty()) {
    message = trim(result.out);
  }
  std::string command = "git";
  for (const auto &arg : args) {
    command += ' ' + arg;
  }
  return command + " failed (exit " + std::to_string(result.exit_code) +
         ")" + (message.empty() ? "" : ": " + message);
}

} // namespace

GitClient::GitClient(std::unique_ptr<CommandRunner> runner,
                     std::string git_executable)
    : runner_(std::move(runner)), git_executable_(std::move(git_executable)) {
  if (!runner_) {
    throw std::invalid_argument("GitClient requires a command runner");
  }
}

CommandResult GitClient::git(const std::vector<std::string> &args) const {
  std::vector<std::string> argv;
  argv.reserve(args.size() + 1);
  argv.push_back(git_executable_);
  argv.insert(argv.end(), args.begin(), args.end());
  return runner_->run(argv);
}

std::string GitClient::current_branch() const {
  auto result = git({"symbolic-ref", "--quiet", "--short", "HEAD"});
  if (result.exit_code != 0) {
    git_log()->debug("HEAD is detached; no current branch");
    return {};
  }
  return trim(result.out);
}

std::string GitClient::upstream_branch() const {
  auto result = git(
      {"rev-parse", "--abbrev-ref", "--symbolic-full-name", "@{upstream}"});
  if (result.exit_code != 0) {
    git_log()->debug("Current branch has no upstream");
    return {};
  }
  return trim(result.out);
}

std::vector<std::string> GitClient::remotes() const {
  std::vector<std::string> args{"remote"};
  auto result = git(args);
  if (result.exit_code != 0) {
    throw ExternalError(describe_failure(args, result), result.exit_code);
  }
  return split_lines(result.out);
}

std::vector<std::string> GitClient::list_merged(const std::string &target,
                                                const Scope &scope) const {
  std::vector<std::string> branches;
  if (is_local(scope)) {
    std::vector<std::string> args{"branch", "--merged=" + target,
                                  "--format=%(refname)"};
    auto result = git(args);
    if (result.exit_code != 0) {
      throw ExternalError(describe_failure(args, result), result.exit_code);
    }
    const std::string current = current_branch();
    for (const auto &ref : split_lines(result.out)) {
      if (!starts_with(ref, kHeadsPrefix)) {
        continue;
      }
      std::string name = ref.substr(std::char_traits<char>::length(kHeadsPrefix));
      if (name == current || name == target || ref == target) {
        git_log()->debug("Skipping '{}' (current branch or merge target)",
                         name);
        continue;
      }
      branches.push_back(std::move(name));
    }
  } else {
    const std::string remote = remote_name(scope);
    auto known = remotes();
    if (std::find(known.begin(), known.end(), remote) == known.end()) {
      throw ExternalError("No such remote '" + remote + "'");
    }
    std::vector<std::string> args{"branch", "--remotes", "--merged=" + target,
                                  "--format=%(refname)"};
    auto result = git(args);
    if (result.exit_code != 0) {
      throw ExternalError(describe_failure(args, result), result.exit_code);
    }
    const std::string upstream = strip_remote(upstream_branch(), remote);
    const std::string target_branch = strip_remote(target, remote);
    for (const auto &ref : split_lines(result.out)) {
      std::string name = strip_remote(ref, remote);
      if (name.empty() || !starts_with(ref, kRemotesPrefix)) {
        continue;
      }
      if (name == "HEAD" || name == upstream || name == target_branch) {
        git_log()->debug("Skipping '{}/{}' (HEAD alias, upstream or target)",
                         remote, name);
        continue;
      }
      branches.push_back(std::move(name));
    }
  }
  git_log()->info("git reports {} {} branch(es) merged into {}",
                  branches.size(), to_string(scope), target);
  return branches;
}

DeletionResult GitClient::delete_branch(const Scope &scope,
                                        const std::string &branch) const {
  std::vector<std::string> args;
  if (is_local(scope)) {
    args = {"branch", "-d", branch};
  } else {
    args = {"push", remote_name(scope), "--delete", branch};
  }
  auto result = git(args);
  DeletionResult outcome;
  outcome.branch = branch;
  outcome.deleted = result.exit_code == 0;
  if (outcome.deleted) {
    outcome.message = trim(result.out.empty() ? result.err : result.out);
    git_log()->info("Deleted {} branch '{}'", to_string(scope), branch);
  } else {
    outcome.message = describe_failure(args, result);
    git_log()->warn("{}", outcome.message);
  }
  return outcome;
}

std::optional<std::string> GitClient::config_get(const std::string &key) const {
  std::vector<std::string> args{"config", "--get", key};
  auto result = git(args);
  if (result.exit_code == 1) {
    return std::nullopt;
  }
  if (result.exit_code != 0) {
    throw ExternalError(describe_failure(args, result), result.exit_code);
  }
  std::string value = result.out;
  while (!value.empty() && (value.back() == '\n' || value.back() == '\r')) {
    value.pop_back();
  }
  git_log()->debug("git config {} = '{}'", key, value);
  return value;
}

} // namespace gpm
