#include "config_store.hpp"
#include "errors.hpp"
#include "resolver.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace gpm;

TEST_CASE("split_branch_list trims and drops empty entries", "[resolver]") {
  CHECK(split_branch_list("foo,bar,p1") ==
        std::vector<std::string>{"foo", "bar", "p1"});
  CHECK(split_branch_list(" foo , ,bar,") ==
        std::vector<std::string>{"foo", "bar"});
  CHECK(split_branch_list("").empty());
  CHECK(split_branch_list(" , ").empty());
}

TEST_CASE("protection defaults when nothing is configured", "[resolver]") {
  StaticConfigStore store;
  auto set = resolve_protection(std::nullopt, store);
  CHECK(set.entries == std::vector<std::string>{"master", "main", "develop"});
}

TEST_CASE("persisted protection replaces the default", "[resolver]") {
  StaticConfigStore store;
  store.set(kSkipKey, "trunk, stable");
  auto set = resolve_protection(std::nullopt, store);
  CHECK(set.entries == std::vector<std::string>{"trunk", "stable"});
}

TEST_CASE("explicit protection replaces the persisted list", "[resolver]") {
  StaticConfigStore store;
  store.set(kSkipKey, "trunk");
  auto set = resolve_protection(std::string{"foo,bar"}, store);
  CHECK(set.entries == std::vector<std::string>{"foo", "bar"});
}

TEST_CASE("blank explicit protection yields an empty set", "[resolver]") {
  StaticConfigStore store;
  store.set(kSkipKey, "trunk");
  CHECK(resolve_protection(std::string{""}, store).empty());
  CHECK(resolve_protection(std::string{" , "}, store).empty());
}

TEST_CASE("protection join renders a --skip value", "[resolver]") {
  ProtectionSet set{{"a", "b"}};
  CHECK(set.join() == "a,b");
  CHECK(ProtectionSet{}.join().empty());
}

TEST_CASE("target resolution order", "[resolver]") {
  StaticConfigStore empty;
  CHECK(resolve_target(std::nullopt, empty) == "origin/master");

  StaticConfigStore store;
  store.set(kIntoKey, "upstream/main");
  CHECK(resolve_target(std::nullopt, store) == "upstream/main");
  CHECK(resolve_target(std::string{"origin/develop"}, store) ==
        "origin/develop");
  CHECK(resolve_target(std::string{" main "}, store) == "main");
}

TEST_CASE("blank target is rejected", "[resolver]") {
  StaticConfigStore store;
  CHECK_THROWS_AS(resolve_target(std::string{""}, store), ConfigError);
  CHECK_THROWS_AS(resolve_target(std::string{"  "}, store), ConfigError);

  store.set(kIntoKey, "");
  CHECK_THROWS_AS(resolve_target(std::nullopt, store), ConfigError);
}
