/**
 * @file cli.hpp
 * @brief Command line interface parsing and options for git-prune-merged.
 *
 * Declares CLI parsing helpers, the option structure, and the exception used
 * to request an early exit.
 */

#ifndef GIT_PRUNE_MERGED_CLI_HPP
#define GIT_PRUNE_MERGED_CLI_HPP

#include <exception>
#include <optional>
#include <string>
#include <unordered_map>

namespace gpm {

/**
 * Signals that CLI parsing requested an immediate exit (help, errors, etc.).
 * Used to bubble exit codes from parsing back to the main entry point without
 * treating them as fatal errors.
 */
class CliParseExit : public std::exception {
public:
  /**
   * Construct an exit signal with the desired exit code.
   *
   * @param exit_code Exit code reported by the parser; zero for --help.
   */
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  /// Exit code reported by the parser.
  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/**
 * Parsed command line options.
 *
 * Optional members stay unset when the flag was not given so that the
 * resolvers can tell "not given" apart from "given but empty".
 */
struct CliOptions {
  bool verbose{false};       ///< Enables debug logging
  std::string config_file;   ///< Optional path to configuration file
  std::string log_level;     ///< Logging verbosity level, empty for config
  std::string log_file;      ///< Optional path to log file
  std::unordered_map<std::string, std::string>
      log_categories; ///< Category -> level overrides
  bool local{false};  ///< --local was given
  std::optional<std::string> remote; ///< --remote NAME
  std::optional<std::string> skip;   ///< --skip LIST, replaces persisted list
  std::optional<std::string> match;  ///< --match PATTERN
  std::optional<std::string> ignore; ///< --ignore PATTERN
  std::optional<std::string> into;   ///< --into BRANCH
  bool apply{false};                 ///< Delete instead of listing
  std::optional<std::string> delay;  ///< --delay DURATION
  bool no_color{false};              ///< Disable ANSI colours
};

/**
 * Parse command line arguments into a CliOptions structure.
 *
 * @param argc Argument count.
 * @param argv Argument vector.
 * @return Populated options.
 * @throws CliParseExit When parsing finished early (help or parse error);
 *         the parser has already printed its message.
 */
CliOptions parse_cli(int argc, char **argv);

} // namespace gpm

#endif // GIT_PRUNE_MERGED_CLI_HPP
