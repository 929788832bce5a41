/**
 * @file pattern.hpp
 * @brief Compilation of protection sets and match/ignore patterns.
 */
#ifndef GIT_PRUNE_MERGED_PATTERN_HPP
#define GIT_PRUNE_MERGED_PATTERN_HPP

#include "resolver.hpp"

#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <utility>

namespace gpm {

/**
 * @brief Compiled predicate over branch names.
 *
 * A predicate either matches nothing, matches everything, or evaluates a
 * compiled regular expression. Copies share the compiled expression.
 */
class BranchPredicate {
public:
  /** \brief How the predicate evaluates names. */
  enum class Kind {
    Never,  ///< Matches no branch name
    Always, ///< Matches every branch name
    Regex   ///< Evaluates the compiled expression
  };

  /// Predicate that matches nothing.
  static BranchPredicate never();

  /// Predicate that matches every name.
  static BranchPredicate always();

  /**
   * Compile a regular expression predicate.
   *
   * @param source ECMAScript expression.
   * @param full_match When true the whole name must match, otherwise a
   *        match anywhere in the name is enough.
   * @throws std::regex_error When @p source is not a valid expression.
   */
  static BranchPredicate regex(const std::string &source, bool full_match);

  /// Evaluate the predicate against a branch name.
  bool matches(const std::string &name) const;

  Kind kind() const { return kind_; }

  /// Expression text for Regex predicates, empty otherwise.
  const std::string &source() const { return source_; }

private:
  BranchPredicate(Kind kind, std::string source,
                  std::shared_ptr<const std::regex> compiled, bool full_match)
      : kind_(kind), source_(std::move(source)),
        compiled_(std::move(compiled)), full_match_(full_match) {}

  Kind kind_;
  std::string source_;
  std::shared_ptr<const std::regex> compiled_;
  bool full_match_;
};

/**
 * Escape every ECMAScript metacharacter in @p literal.
 */
std::string escape_regex(const std::string &literal);

/**
 * Convert a shell-style glob ('*' and '?') to an unanchored expression body
 * with all other characters escaped.
 */
std::string glob_to_regex(const std::string &glob);

/**
 * Compile a protection set into one exact-match predicate.
 *
 * Literal entries are escaped and must equal the whole branch name; "glob:"
 * and "regex:" entries must match the whole name. An empty set matches
 * nothing.
 *
 * @throws ConfigError When a "regex:" entry does not compile.
 */
BranchPredicate compile_protection(const ProtectionSet &protection);

/**
 * Compile the --match pattern. Unset or empty matches every name.
 *
 * @throws ConfigError When the pattern does not compile.
 */
BranchPredicate compile_include(const std::optional<std::string> &pattern);

/**
 * Compile the --ignore pattern. Unset or empty matches nothing.
 *
 * @throws ConfigError When the pattern does not compile.
 */
BranchPredicate compile_exclude(const std::optional<std::string> &pattern);

} // namespace gpm

#endif // GIT_PRUNE_MERGED_PATTERN_HPP
