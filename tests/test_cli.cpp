#include "cli.hpp"
#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

namespace {
gpm::CliOptions parse(std::vector<std::string> args) {
  args.insert(args.begin(), "git-prune-merged");
  std::vector<char *> argv;
  argv.reserve(args.size());
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  return gpm::parse_cli(static_cast<int>(argv.size()), argv.data());
}
} // namespace

TEST_CASE("test cli", "[cli]") {
  gpm::CliOptions defaults = parse({});
  CHECK_FALSE(defaults.verbose);
  CHECK_FALSE(defaults.local);
  CHECK_FALSE(defaults.apply);
  CHECK_FALSE(defaults.no_color);
  CHECK_FALSE(defaults.remote.has_value());
  CHECK_FALSE(defaults.skip.has_value());
  CHECK_FALSE(defaults.match.has_value());
  CHECK_FALSE(defaults.ignore.has_value());
  CHECK_FALSE(defaults.into.has_value());
  CHECK_FALSE(defaults.delay.has_value());
  CHECK(defaults.log_level.empty());

  gpm::CliOptions local = parse({"-l", "-a", "--delay", "1s", "--no-color"});
  CHECK(local.local);
  CHECK(local.apply);
  CHECK(local.delay == std::optional<std::string>{"1s"});
  CHECK(local.no_color);

  gpm::CliOptions remote =
      parse({"--remote", "origin", "-s", "foo,bar", "-m", "^patch-", "-i",
             "old", "-t", "origin/main"});
  CHECK(remote.remote == std::optional<std::string>{"origin"});
  CHECK(remote.skip == std::optional<std::string>{"foo,bar"});
  CHECK(remote.match == std::optional<std::string>{"^patch-"});
  CHECK(remote.ignore == std::optional<std::string>{"old"});
  CHECK(remote.into == std::optional<std::string>{"origin/main"});
}

TEST_CASE("empty skip is kept as an explicit value", "[cli]") {
  gpm::CliOptions opts = parse({"--skip", ""});
  REQUIRE(opts.skip.has_value());
  CHECK(opts.skip->empty());
}

TEST_CASE("logging flags", "[cli]") {
  gpm::CliOptions opts =
      parse({"-v", "--log-level", "debug", "--log-file", "gpm.log",
             "--log-category", "git=trace", "--log-category", "engine=info"});
  CHECK(opts.verbose);
  CHECK(opts.log_level == "debug");
  CHECK(opts.log_file == "gpm.log");
  CHECK(opts.log_categories.at("git") == "trace");
  CHECK(opts.log_categories.at("engine") == "info");
}

TEST_CASE("cli parse errors request a non-zero exit", "[cli]") {
  try {
    parse({"--log-category", "git"});
    FAIL("expected CliParseExit");
  } catch (const gpm::CliParseExit &e) {
    CHECK(e.exit_code() != 0);
  }
  CHECK_THROWS_AS(parse({"--log-level", "loud"}), gpm::CliParseExit);
  CHECK_THROWS_AS(parse({"--remote"}), gpm::CliParseExit);
  CHECK_THROWS_AS(parse({"--unknown"}), gpm::CliParseExit);
}

TEST_CASE("help exits with status zero", "[cli]") {
  try {
    parse({"--help"});
    FAIL("expected CliParseExit");
  } catch (const gpm::CliParseExit &e) {
    CHECK(e.exit_code() == 0);
  }
}
