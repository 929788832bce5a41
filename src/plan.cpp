#include "plan.hpp"
#include "errors.hpp"
#include "log.hpp"

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
} // namespace

Plan build_plan(const std::vector<std::string> &candidates,
                const FilterPipeline &pipeline, const ProtectionSet &skipped,
                const Scope &scope, RunMode mode, const std::string &target) {
  auto selected = pipeline.apply(candidates);
  if (selected.empty()) {
    engine_log()->info("No {} branches merged into {} remain after filtering",
                       to_string(scope), target);
    throw NoCandidatesError("No " + to_string(scope) +
                            " branches merged into " + target +
                            " to delete");
  }
  engine_log()->info("Planned {} deletion(s) of {} branches ({})",
                     selected.size(), to_string(scope), to_string(mode));
  return Plan(scope, mode, target, std::move(selected), skipped);
}

Plan build_plan(const std::vector<std::string> &candidates,
                const FilterSpec &spec, const Scope &scope, RunMode mode,
                const std::string &target) {
  return build_plan(candidates, FilterPipeline::compile(spec), spec.protection,
                    scope, mode, target);
}

} // namespace gpm
