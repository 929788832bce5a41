/**
 * @file plan.hpp
 * @brief Immutable deletion plan and the builder that produces it.
 */
#ifndef GIT_PRUNE_MERGED_PLAN_HPP
#define GIT_PRUNE_MERGED_PLAN_HPP

#include "branch_filter.hpp"
#include "resolver.hpp"
#include "scope.hpp"

#include <string>
#include <vector>

namespace gpm {

/**
 * @brief Final decision of which branches to delete.
 *
 * A plan is built once per invocation and handed to the executor. It never
 * deletes anything itself and cannot be modified after construction.
 */
class Plan {
public:
  Plan(Scope scope, RunMode mode, std::string target,
       std::vector<std::string> selected, ProtectionSet skipped)
      : scope_(std::move(scope)), mode_(mode), target_(std::move(target)),
        selected_(std::move(selected)), skipped_(std::move(skipped)) {}

  const Scope &scope() const { return scope_; }
  RunMode mode() const { return mode_; }

  /// Merge target the candidates were compared against.
  const std::string &target() const { return target_; }

  /// Branches to delete, in the order git reported them.
  const std::vector<std::string> &selected() const { return selected_; }

  /// Protection set that was applied.
  const ProtectionSet &skipped() const { return skipped_; }

private:
  const Scope scope_;
  const RunMode mode_;
  const std::string target_;
  const std::vector<std::string> selected_;
  const ProtectionSet skipped_;
};

/**
 * Filter @p candidates through a compiled pipeline and wrap the result.
 *
 * @param candidates Merged branches reported by git for @p scope.
 * @param pipeline Compiled filter stages.
 * @param skipped Protection set recorded in the plan.
 * @param scope Branch namespace the candidates belong to.
 * @param mode Dry run or apply.
 * @param target Merge target used to compute @p candidates.
 * @return Plan with a non-empty selection.
 * @throws NoCandidatesError When nothing survives filtering.
 */
Plan build_plan(const std::vector<std::string> &candidates,
                const FilterPipeline &pipeline, const ProtectionSet &skipped,
                const Scope &scope, RunMode mode, const std::string &target);

/**
 * Compile @p spec and build a plan from it.
 *
 * @throws ConfigError When a pattern in @p spec fails to compile.
 * @throws NoCandidatesError When nothing survives filtering.
 */
Plan build_plan(const std::vector<std::string> &candidates,
                const FilterSpec &spec, const Scope &scope, RunMode mode,
                const std::string &target);

} // namespace gpm

#endif // GIT_PRUNE_MERGED_PLAN_HPP
