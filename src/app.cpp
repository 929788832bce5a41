#include "app.hpp"
#include "branch_filter.hpp"
#include "config_store.hpp"
#include "errors.hpp"
#include "git_client.hpp"
#include "log.hpp"
#include "plan.hpp"
#include "resolver.hpp"
#include "scope.hpp"
#include "util/duration.hpp"

#include <chrono>
#include <exception>
#include <memory>
#include <string>
#include <unistd.h>
#include <unordered_map>
#include <utility>

#include <spdlog/spdlog.h>

namespace gpm {

namespace {
std::shared_ptr<spdlog::logger> app_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}

constexpr std::chrono::milliseconds kDefaultDelay{5000};

/**
 * Map a level name to its spdlog level.
 *
 * @param name Level name such as "debug" or "warn".
 * @param source Where the name came from, for the error message.
 * @throws ConfigError When @p name is not a known level.
 */
spdlog::level::level_enum parse_log_level(const std::string &name,
                                          const std::string &source) {
  if (name == "warn") {
    return spdlog::level::warn;
  }
  for (int i = spdlog::level::trace; i < spdlog::level::n_levels; ++i) {
    auto level = static_cast<spdlog::level::level_enum>(i);
    auto known = spdlog::level::to_string_view(level);
    if (name == std::string(known.data(), known.size())) {
      return level;
    }
  }
  throw ConfigError("Unknown log level '" + name + "' in " + source);
}
} // namespace

App::App(std::unique_ptr<CommandRunner> runner, std::ostream &out,
         CancellationToken *token)
    : runner_(std::move(runner)), out_(out),
      token_(token != nullptr ? token : &own_token_) {}

void App::init_logging() const {
  std::string level_name = options_.log_level;
  if (options_.verbose) {
    level_name = "debug";
  } else if (level_name.empty()) {
    level_name = config_.log_level();
  }
  const std::string &file =
      !options_.log_file.empty() ? options_.log_file : config_.log_file();
  init_logger(parse_log_level(level_name, "log_level"), config_.log_pattern(),
              file,
              static_cast<std::size_t>(config_.log_rotate()));

  // CLI overrides win per category.
  std::unordered_map<std::string, std::string> names = config_.log_categories();
  for (const auto &[category, level] : options_.log_categories) {
    names[category] = level;
  }
  if (!names.empty()) {
    std::unordered_map<std::string, spdlog::level::level_enum> overrides;
    for (const auto &[category, level] : names) {
      overrides[category] =
          parse_log_level(level, "log category '" + category + "'");
    }
    configure_log_categories(overrides);
  }
}

/**
 * Execute the main application flow.
 *
 * Parses the command line, loads the optional config file, initialises
 * logging and then builds and executes the deletion plan. Every failure is
 * reported on the log and mapped to an ExitCode.
 *
 * @param argc Argument count passed from @c main().
 * @param argv Argument vector passed from @c main().
 * @return Process exit status.
 */
int App::run(int argc, char **argv) {
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &exit) {
    return exit.exit_code() == 0 ? kExitOk : kExitConfigError;
  }

  try {
    if (!options_.config_file.empty()) {
      config_ = Config::from_file(options_.config_file);
    }
    init_logging();
  } catch (const ConfigError &e) {
    app_log()->error("{}", e.what());
    return kExitConfigError;
  }

  try {
    return execute();
  } catch (const ConfigError &e) {
    app_log()->error("{}", e.what());
    return kExitConfigError;
  } catch (const NoCandidatesError &e) {
    out_ << e.what() << std::endl;
    app_log()->info("{}", e.what());
    return kExitNothingToDo;
  } catch (const ExternalError &e) {
    app_log()->error("{}", e.what());
    return kExitExternalError;
  }
}

int App::execute() {
  // A scope flag on the command line overrides the configured scope.
  bool cli_scope = options_.local || options_.remote.has_value();
  Scope scope = cli_scope ? resolve_scope(options_.local, options_.remote)
                          : resolve_scope(config_.local(), config_.remote());
  RunMode mode =
      (options_.apply || config_.apply()) ? RunMode::Apply : RunMode::DryRun;

  std::chrono::milliseconds delay = kDefaultDelay;
  std::string delay_text =
      options_.delay ? *options_.delay : config_.delay();
  if (!delay_text.empty()) {
    try {
      delay = parse_duration(delay_text);
    } catch (const std::runtime_error &e) {
      throw ConfigError(std::string("Invalid --delay: ") + e.what());
    }
  }

  if (!runner_) {
    runner_ = std::make_unique<PosixCommandRunner>();
  }
  GitClient git(std::move(runner_));

  StaticConfigStore file_store = config_.persisted_store();
  GitConfigStore git_store(git);
  ChainedConfigStore store({&file_store, &git_store});

  FilterSpec spec;
  spec.protection = resolve_protection(options_.skip, store);
  spec.include = options_.match ? options_.match : config_.match();
  spec.exclude = options_.ignore ? options_.ignore : config_.ignore();
  std::string target = resolve_target(options_.into, store);
  FilterPipeline pipeline = FilterPipeline::compile(spec);

  app_log()->debug("Scope {}, mode {}, target {}", to_string(scope),
                   to_string(mode), target);
  std::vector<std::string> candidates = git.list_merged(target, scope);
  Plan plan =
      build_plan(candidates, pipeline, spec.protection, scope, mode, target);

  ExecutorOptions exec_options;
  exec_options.delay = delay;
  exec_options.color = !options_.no_color && config_.color() &&
                       &out_ == &std::cout && ::isatty(STDOUT_FILENO) != 0;
  PlanExecutor executor(git, out_, exec_options, *token_, sleeper_);
  ExecutionReport report = executor.execute(plan);

  if (report.cancelled) {
    return kExitInterrupted;
  }
  if (report.failures() > 0) {
    app_log()->error("{} of {} deletion(s) failed", report.failures(),
                     report.results.size());
    return kExitExternalError;
  }
  return kExitOk;
}

} // namespace gpm
