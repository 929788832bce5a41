#include "branch_filter.hpp"
#include "log.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

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

FilterPipeline FilterPipeline::compile(const FilterSpec &spec) {
  std::vector<FilterStage> stages;
  stages.reserve(3);
  stages.push_back({FilterStage::Action::Exclude, "protected",
                    compile_protection(spec.protection)});
  stages.push_back({FilterStage::Action::Require, "match",
                    compile_include(spec.include)});
  stages.push_back({FilterStage::Action::Exclude, "ignore",
                    compile_exclude(spec.exclude)});
  return FilterPipeline(std::move(stages));
}

std::vector<std::string>
FilterPipeline::apply(const std::vector<std::string> &candidates) const {
  std::vector<std::string> current = candidates;
  for (const auto &stage : stages_) {
    std::vector<std::string> next;
    next.reserve(current.size());
    std::copy_if(current.begin(), current.end(), std::back_inserter(next),
                 [&stage](const std::string &name) {
                   if (stage.keeps(name)) {
                     return true;
                   }
                   engine_log()->debug("Dropping '{}' at stage '{}'", name,
                                       stage.label);
                   return false;
                 });
    current = std::move(next);
  }
  engine_log()->debug("{} of {} candidate(s) selected", current.size(),
                      candidates.size());
  return current;
}

std::vector<std::string>
filter_candidates(const std::vector<std::string> &candidates,
                  const FilterSpec &spec) {
  return FilterPipeline::compile(spec).apply(candidates);
}

} // namespace gpm
