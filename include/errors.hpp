/**
 * @file errors.hpp
 * @brief Error taxonomy for git-prune-merged.
 *
 * Declares the exceptions raised by the selection engine and its
 * collaborators. All derive from std::runtime_error so callers may catch the
 * base type when the category does not matter.
 */

#ifndef GIT_PRUNE_MERGED_ERRORS_HPP
#define GIT_PRUNE_MERGED_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace gpm {

/**
 * Fatal configuration problem detected before any branch enumeration.
 *
 * Raised for invalid scope selections, patterns that fail to compile and
 * unreadable configuration files.
 */
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * Signals that filtering left nothing to delete.
 *
 * This is an expected outcome rather than a failure; the application reports
 * it and exits with a dedicated status.
 */
class NoCandidatesError : public std::runtime_error {
public:
  NoCandidatesError() : std::runtime_error("No merged branches to delete") {}
  explicit NoCandidatesError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * Failure reported by git or by the process layer running it.
 *
 * The message carries git's diagnostic output verbatim.
 */
class ExternalError : public std::runtime_error {
public:
  explicit ExternalError(const std::string &message, int exit_code = -1)
      : std::runtime_error(message), exit_code_(exit_code) {}

  /// Exit status of the failed command, or -1 when it never ran.
  int exit_code() const noexcept { return exit_code_; }

private:
  int exit_code_;
};

} // namespace gpm

#endif // GIT_PRUNE_MERGED_ERRORS_HPP
