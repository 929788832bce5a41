#include "errors.hpp"
#include "pattern.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace gpm;

TEST_CASE("escape_regex makes metacharacters literal", "[pattern]") {
  CHECK(escape_regex("fix.1") == "fix\\.1");
  CHECK(escape_regex("a+b(c)") == "a\\+b\\(c\\)");
  CHECK(escape_regex("feature/x-y") == "feature/x-y");
}

TEST_CASE("glob_to_regex translates wildcards", "[pattern]") {
  CHECK(glob_to_regex("release/*") == "release/.*");
  CHECK(glob_to_regex("v?.0") == "v.\\.0");
}

TEST_CASE("protection matches whole names only", "[pattern]") {
  ProtectionSet set{{"foo", "bar", "p1"}};
  auto predicate = compile_protection(set);
  CHECK(predicate.matches("foo"));
  CHECK(predicate.matches("bar"));
  CHECK(predicate.matches("p1"));
  CHECK_FALSE(predicate.matches("foo-bar"));
  CHECK_FALSE(predicate.matches("b1"));
  CHECK_FALSE(predicate.matches("p10"));
}

TEST_CASE("protected names with metacharacters are literal", "[pattern]") {
  auto predicate = compile_protection(ProtectionSet{{"fix.1", "a+"}});
  CHECK(predicate.matches("fix.1"));
  CHECK_FALSE(predicate.matches("fix-1"));
  CHECK(predicate.matches("a+"));
  CHECK_FALSE(predicate.matches("aaa"));
}

TEST_CASE("protection entries accept glob and regex tags", "[pattern]") {
  auto predicate =
      compile_protection(ProtectionSet{{"glob:release/*", "regex:hotfix-\\d+"}});
  CHECK(predicate.matches("release/1.0"));
  CHECK(predicate.matches("hotfix-12"));
  CHECK_FALSE(predicate.matches("hotfix-x"));
  CHECK_FALSE(predicate.matches("old-release/1.0"));
}

TEST_CASE("invalid tagged regex is a configuration error", "[pattern]") {
  CHECK_THROWS_AS(compile_protection(ProtectionSet{{"regex:(unclosed"}}),
                  ConfigError);
}

TEST_CASE("empty protection set matches nothing", "[pattern]") {
  auto predicate = compile_protection(ProtectionSet{});
  CHECK(predicate.kind() == BranchPredicate::Kind::Never);
  CHECK_FALSE(predicate.matches(""));
  CHECK_FALSE(predicate.matches("master"));
}

TEST_CASE("include pattern defaults to match everything", "[pattern]") {
  CHECK(compile_include(std::nullopt).kind() == BranchPredicate::Kind::Always);
  CHECK(compile_include(std::string{}).kind() ==
        BranchPredicate::Kind::Always);
  CHECK(compile_include(std::nullopt).matches("anything"));
}

TEST_CASE("exclude pattern defaults to match nothing", "[pattern]") {
  CHECK(compile_exclude(std::nullopt).kind() == BranchPredicate::Kind::Never);
  CHECK(compile_exclude(std::string{}).kind() == BranchPredicate::Kind::Never);
  CHECK_FALSE(compile_exclude(std::nullopt).matches("anything"));
}

TEST_CASE("include and exclude search anywhere in the name", "[pattern]") {
  auto include = compile_include(std::string{"patch-"});
  CHECK(include.matches("patch-1"));
  CHECK(include.matches("user/patch-2"));
  CHECK_FALSE(include.matches("release"));

  auto anchored = compile_include(std::string{"^patch-"});
  CHECK_FALSE(anchored.matches("user/patch-2"));
}

TEST_CASE("invalid include or exclude is a configuration error",
          "[pattern]") {
  CHECK_THROWS_AS(compile_include(std::string{"[a-"}), ConfigError);
  CHECK_THROWS_AS(compile_exclude(std::string{"(x"}), ConfigError);
}
