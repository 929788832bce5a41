/**
 * @file branch_filter.hpp
 * @brief Candidate filter pipeline.
 *
 * Turns the merged branches reported by git into the deletion set by running
 * an explicit, ordered list of stages: drop protected names, keep names
 * matching --match, drop names matching --ignore. Protection runs first so
 * that it wins over an inclusion pattern that happens to match a protected
 * name.
 */
#ifndef GIT_PRUNE_MERGED_BRANCH_FILTER_HPP
#define GIT_PRUNE_MERGED_BRANCH_FILTER_HPP

#include "pattern.hpp"
#include "resolver.hpp"

#include <optional>
#include <string>
#include <vector>

namespace gpm {

/** \brief Uncompiled filter settings. */
struct FilterSpec {
  ProtectionSet protection;           ///< Names that are never deleted
  std::optional<std::string> include; ///< --match; unset keeps everything
  std::optional<std::string> exclude; ///< --ignore; unset drops nothing
};

/** \brief One step of the pipeline. */
struct FilterStage {
  /** \brief What a stage does with matching names. */
  enum class Action {
    Exclude, ///< Drop names the predicate matches
    Require  ///< Keep only names the predicate matches
  };

  Action action;
  std::string label; ///< Stage name used in diagnostics
  BranchPredicate predicate;

  /// True when @p name survives this stage.
  bool keeps(const std::string &name) const {
    bool hit = predicate.matches(name);
    return action == Action::Require ? hit : !hit;
  }
};

/**
 * @brief Compiled, ordered filter stages.
 *
 * Applying the pipeline is a pure function of its input: it preserves the
 * relative order of the candidates and has no side effects beyond debug
 * logging.
 */
class FilterPipeline {
public:
  /**
   * Compile the three filter stages from @p spec.
   *
   * @throws ConfigError When any pattern fails to compile.
   */
  static FilterPipeline compile(const FilterSpec &spec);

  /// Stages in evaluation order.
  const std::vector<FilterStage> &stages() const { return stages_; }

  /**
   * Run every stage over @p candidates.
   *
   * @param candidates Merged branch names in the order git reported them.
   * @return Surviving names, in input order.
   */
  std::vector<std::string>
  apply(const std::vector<std::string> &candidates) const;

private:
  explicit FilterPipeline(std::vector<FilterStage> stages)
      : stages_(std::move(stages)) {}

  std::vector<FilterStage> stages_;
};

/**
 * Compile @p spec and apply it to @p candidates.
 *
 * @throws ConfigError When any pattern fails to compile.
 */
std::vector<std::string>
filter_candidates(const std::vector<std::string> &candidates,
                  const FilterSpec &spec);

} // namespace gpm

#endif // GIT_PRUNE_MERGED_BRANCH_FILTER_HPP
