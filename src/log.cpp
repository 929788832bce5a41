#include "log.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {
constexpr const char *kRootLogger = "gpm";
constexpr std::size_t kRotateBytes = 1024 * 1024;

std::weak_ptr<spdlog::logger> g_logger;
std::recursive_mutex g_logger_mutex;

/**
 * Build the sink list for the root logger.
 *
 * @param file Optional log file path.
 * @param rotate_files Rotated files to keep, zero for a plain file sink.
 * @return Sinks shared by the root logger and every category logger.
 */
std::vector<spdlog::sink_ptr> make_sinks(const std::string &file,
                                         std::size_t rotate_files) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!file.empty()) {
    if (rotate_files > 0) {
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          file, kRotateBytes, rotate_files));
    } else {
      sinks.push_back(
          std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, false));
    }
  }
  return sinks;
}
} // namespace

namespace gpm {

/**
 * Initialize the root logger and re-point existing category loggers at the
 * new sinks.
 *
 * @param level Logging verbosity level for the default logger.
 * @param pattern Log message pattern; empty string retains the default.
 * @param file Optional log file path.
 * @param rotate_files Number of rotated files to keep.
 */
void init_logger(spdlog::level::level_enum level, const std::string &pattern,
                 const std::string &file, std::size_t rotate_files) {
  std::lock_guard<std::recursive_mutex> lock(g_logger_mutex);
  auto sinks = make_sinks(file, rotate_files);
  spdlog::drop(kRootLogger);
  auto logger =
      std::make_shared<spdlog::logger>(kRootLogger, sinks.begin(), sinks.end());
  logger->set_level(level);
  spdlog::set_default_logger(logger);
  g_logger = logger;
  spdlog::apply_all([&](const std::shared_ptr<spdlog::logger> &existing) {
    if (existing->name().rfind(std::string(kRootLogger) + ".", 0) == 0) {
      existing->sinks() = sinks;
      existing->set_level(level);
    }
  });
  if (!pattern.empty()) {
    spdlog::set_pattern(pattern);
  }
  logger->debug("Logger initialised (level={}, file='{}', rotate={})",
                spdlog::level::to_string_view(level), file, rotate_files);
}

void ensure_default_logger() {
  std::lock_guard<std::recursive_mutex> lock(g_logger_mutex);
  auto locked = g_logger.lock();
  auto current = spdlog::default_logger();
  if (!locked || !current || current.get() != locked.get()) {
    init_logger(spdlog::level::warn);
  }
}

std::shared_ptr<spdlog::logger> category_logger(const std::string &category) {
  std::lock_guard<std::recursive_mutex> lock(g_logger_mutex);
  const std::string name = std::string(kRootLogger) + "." + category;
  auto logger = spdlog::get(name);
  if (logger) {
    return logger;
  }
  ensure_default_logger();
  auto root = spdlog::default_logger();
  const auto &sinks = root->sinks();
  auto created =
      std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
  created->set_level(root->level());
  spdlog::register_logger(created);
  return created;
}

void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides) {
  if (overrides.empty()) {
    return;
  }
  for (const auto &[category, level] : overrides) {
    auto logger = category_logger(category);
    logger->set_level(level);
    logger->debug("Category '{}' set to level {}", category,
                  spdlog::level::to_string_view(level));
  }
  category_logger("logging")->debug("Applied {} log category override(s)",
                                    overrides.size());
}

} // namespace gpm
