#include "errors.hpp"
#include "fake_command_runner.hpp"
#include "git_client.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace gpm;

namespace {
using Names = std::vector<std::string>;

std::shared_ptr<FakeCommandRunner::State> repo_state() {
  auto state = std::make_shared<FakeCommandRunner::State>();
  respond(*state, "git symbolic-ref --quiet --short HEAD", 0, "work\n");
  respond(*state,
          "git rev-parse --abbrev-ref --symbolic-full-name @{upstream}", 0,
          "origin/work\n");
  respond(*state, "git remote", 0, "origin\nupstream\n");
  return state;
}
} // namespace

TEST_CASE("GitClient requires a runner", "[git]") {
  CHECK_THROWS_AS(GitClient(nullptr), std::invalid_argument);
}

TEST_CASE("local listing drops the current branch and the target", "[git]") {
  auto state = repo_state();
  respond(*state, "git branch --merged=main --format=%(refname)", 0,
          "refs/heads/feature-a\n"
          "refs/heads/main\n"
          "refs/heads/work\n"
          "refs/heads/feature-b\n");
  GitClient git(std::make_unique<FakeCommandRunner>(state));
  CHECK(git.list_merged("main", LocalScope{}) ==
        Names{"feature-a", "feature-b"});
}

TEST_CASE("local listing keeps every branch on a detached HEAD", "[git]") {
  auto state = std::make_shared<FakeCommandRunner::State>();
  respond(*state, "git symbolic-ref --quiet --short HEAD", 1, "");
  respond(*state, "git branch --merged=origin/master --format=%(refname)", 0,
          "refs/heads/a\nrefs/heads/b\n");
  GitClient git(std::make_unique<FakeCommandRunner>(state));
  CHECK(git.list_merged("origin/master", LocalScope{}) == Names{"a", "b"});
  CHECK(git.current_branch().empty());
}

TEST_CASE("remote listing strips the remote prefix", "[git]") {
  auto state = repo_state();
  respond(*state,
          "git branch --remotes --merged=origin/master --format=%(refname)", 0,
          "refs/remotes/origin/HEAD\n"
          "refs/remotes/origin/master\n"
          "refs/remotes/origin/old-1\n"
          "refs/remotes/origin/work\n"
          "refs/remotes/upstream/old-2\n"
          "refs/remotes/origin/team/old-3\n");
  GitClient git(std::make_unique<FakeCommandRunner>(state));
  CHECK(git.list_merged("origin/master", RemoteScope{"origin"}) ==
        Names{"old-1", "team/old-3"});
}

TEST_CASE("remote listing rejects unknown remotes", "[git]") {
  auto state = repo_state();
  GitClient git(std::make_unique<FakeCommandRunner>(state));
  CHECK_THROWS_AS(git.list_merged("origin/master", RemoteScope{"nope"}),
                  ExternalError);
  CHECK(count_calls(*state, "git branch") == 0);
}

TEST_CASE("listing failures carry git's message", "[git]") {
  auto state = repo_state();
  respond(*state, "git branch --merged=nope --format=%(refname)", 129, "",
          "error: malformed object name nope\n");
  GitClient git(std::make_unique<FakeCommandRunner>(state));
  try {
    git.list_merged("nope", LocalScope{});
    FAIL("expected ExternalError");
  } catch (const ExternalError &e) {
    CHECK(e.exit_code() == 129);
    CHECK(std::string(e.what()).find("malformed object name nope") !=
          std::string::npos);
  }
}

TEST_CASE("merge target is never read as a git option", "[git]") {
  auto state = repo_state();
  respond(*state, "git branch --merged=--all --format=%(refname)", 0,
          "refs/heads/x\n");
  GitClient git(std::make_unique<FakeCommandRunner>(state));
  CHECK(git.list_merged("--all", LocalScope{}) == Names{"x"});
  CHECK(count_calls(*state, "git branch --merged=--all ") == 1);
  CHECK(count_calls(*state, "git branch --merged --all") == 0);
}

TEST_CASE("delete_branch uses branch -d or push --delete", "[git]") {
  auto state = repo_state();
  respond(*state, "git branch -d old", 0, "Deleted branch old (was abc123).\n");
  respond(*state, "git push origin --delete gone", 1, "",
          "error: unable to delete 'gone': remote ref does not exist\n");
  GitClient git(std::make_unique<FakeCommandRunner>(state));

  auto local = git.delete_branch(LocalScope{}, "old");
  CHECK(local.deleted);
  CHECK(local.branch == "old");
  CHECK(local.message == "Deleted branch old (was abc123).");

  auto remote = git.delete_branch(RemoteScope{"origin"}, "gone");
  CHECK_FALSE(remote.deleted);
  CHECK(remote.message.find("remote ref does not exist") != std::string::npos);
}

TEST_CASE("config_get distinguishes absent keys from failures", "[git]") {
  auto state = repo_state();
  respond(*state, "git config --get prune-merged.skip", 0, "a, b\n");
  respond(*state, "git config --get prune-merged.into", 1, "");
  respond(*state, "git config --get broken", 3, "", "error: bad config\n");
  GitClient git(std::make_unique<FakeCommandRunner>(state));

  CHECK(git.config_get("prune-merged.skip") == std::optional<std::string>{"a, b"});
  CHECK_FALSE(git.config_get("prune-merged.into").has_value());
  CHECK_THROWS_AS(git.config_get("broken"), ExternalError);
}

TEST_CASE("custom git executable is used", "[git]") {
  auto state = std::make_shared<FakeCommandRunner::State>();
  respond(*state, "/opt/git/bin/git remote", 0, "origin\n");
  GitClient git(std::make_unique<FakeCommandRunner>(state), "/opt/git/bin/git");
  CHECK(git.remotes() == Names{"origin"});
}
