#include "cli.hpp"
#include "log.hpp"
#include <CLI/CLI.hpp>
#include <array>
#include <sstream>
#include <optional>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

namespace gpm {

namespace {
std::shared_ptr<spdlog::logger> cli_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("cli");
  }();
  return logger;
}

std::string help_footer() {
  static const std::array<std::string_view, 9> categories = {
      "app", "cli", "config", "engine", "executor", "git", "logging", "main",
      "process"};
  std::ostringstream oss;
  oss << "Protected branches default to git config prune-merged.skip, then "
         "master,main,develop.\n"
      << "The merge target defaults to git config prune-merged.into, then "
         "origin/master.\n"
      << "Exit codes: 0 done, 1 configuration error, 2 nothing to delete, "
         "3 git error, 130 interrupted.\n"
      << "Logging categories: ";
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (i != 0) {
      oss << ", ";
    }
    oss << categories[i];
  }
  return oss.str();
}

/**
 * Register a string option that records whether it was given.
 */
CLI::Option *add_optional(CLI::App &app, const std::string &name,
                          std::optional<std::string> &target,
                          const std::string &description) {
  return app.add_option_function<std::string>(
      name, [&target](const std::string &value) { target = value; },
      description);
}
} // namespace

CliOptions parse_cli(int argc, char **argv) {
  CliOptions options;
  CLI::App app{"Delete branches that are already merged into a target "
               "branch"};
  app.footer(help_footer());

  app.add_flag("-l,--local", options.local, "Operate on local branches")
      ->group("Scope");
  add_optional(app, "-r,--remote", options.remote,
               "Operate on the branches of remote NAME")
      ->type_name("NAME")
      ->group("Scope");

  add_optional(app, "-s,--skip", options.skip,
               "Comma separated branches to keep; replaces the configured "
               "list")
      ->type_name("LIST")
      ->group("Selection");
  add_optional(app, "-m,--match", options.match,
               "Only delete branches matching this regular expression")
      ->type_name("PATTERN")
      ->group("Selection");
  add_optional(app, "-i,--ignore", options.ignore,
               "Never delete branches matching this regular expression")
      ->type_name("PATTERN")
      ->group("Selection");
  add_optional(app, "-t,--into", options.into,
               "Branch that candidates must be merged into")
      ->type_name("BRANCH")
      ->group("Selection");

  app.add_flag("-a,--apply", options.apply,
               "Delete the branches instead of listing them")
      ->group("Execution");
  add_optional(app, "--delay", options.delay,
               "Pause before deleting, e.g. 5s or 500ms (default 5s)")
      ->type_name("DURATION")
      ->group("Execution");
  app.add_flag("--no-color", options.no_color, "Disable coloured output")
      ->group("Execution");

  app.add_option("-C,--config", options.config_file,
                 "Configuration file (YAML, TOML or JSON)")
      ->type_name("FILE")
      ->check(CLI::ExistingFile)
      ->group("General");
  app.add_flag("-v,--verbose", options.verbose, "Enable debug logging")
      ->group("Logging");
  app.add_option("--log-level", options.log_level,
                 "Logging level (trace, debug, info, warn, error, off)")
      ->type_name("LEVEL")
      ->check(CLI::IsMember(
          {"trace", "debug", "info", "warn", "error", "critical", "off"}))
      ->group("Logging");
  app.add_option("--log-file", options.log_file, "Also write logs to FILE")
      ->type_name("FILE")
      ->group("Logging");
  app.add_option_function<std::vector<std::string>>(
         "--log-category",
         [&options](const std::vector<std::string> &values) {
           for (const auto &value : values) {
             auto pos = value.find('=');
             if (pos == std::string::npos || pos == 0 ||
                 pos + 1 == value.size()) {
               throw CLI::ValidationError("--log-category",
                                          "expected NAME=LEVEL, got '" +
                                              value + "'");
             }
             options.log_categories[value.substr(0, pos)] =
                 value.substr(pos + 1);
           }
         },
         "Override the level of one logging category")
      ->type_name("NAME=LEVEL")
      ->group("Logging");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    int exit_code = app.exit(e);
    throw CliParseExit(exit_code);
  }
  cli_log()->debug("Parsed command line: local={}, remote='{}', apply={}",
                   options.local, options.remote.value_or(""), options.apply);
  return options;
}

} // namespace gpm
