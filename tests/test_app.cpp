#include "app.hpp"
#include "fake_command_runner.hpp"
#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace {

const char *kLocalList = "git branch --merged=origin/master --format=%(refname)";

std::shared_ptr<FakeCommandRunner::State> local_repo() {
  auto state = std::make_shared<FakeCommandRunner::State>();
  respond(*state, "git symbolic-ref --quiet --short HEAD", 0, "work\n");
  respond(*state, kLocalList, 0,
          "refs/heads/master\n"
          "refs/heads/patch-1\n"
          "refs/heads/work\n"
          "refs/heads/release\n"
          "refs/heads/patch-2\n");
  return state;
}

struct Run {
  int exit_code;
  std::string output;
};

Run run_app(const std::shared_ptr<FakeCommandRunner::State> &state,
            std::vector<std::string> args,
            gpm::CancellationToken *token = nullptr) {
  args.insert(args.begin(), "git-prune-merged");
  std::vector<char *> argv;
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  std::ostringstream out;
  gpm::App app(std::make_unique<FakeCommandRunner>(state), out, token);
  app.set_sleeper([](std::chrono::milliseconds) {});
  int code = app.run(static_cast<int>(argv.size()), argv.data());
  return {code, out.str()};
}

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("dry run lists merged branches and deletes nothing", "[app]") {
  auto state = local_repo();
  Run r = run_app(state, {"--local"});
  CHECK(r.exit_code == gpm::kExitOk);
  CHECK(contains(r.output, "patch-1"));
  CHECK(contains(r.output, "release"));
  CHECK_FALSE(contains(r.output, "  master\n"));
  CHECK_FALSE(contains(r.output, "  work\n"));
  CHECK(count_calls(*state, "git branch -d") == 0);
}

TEST_CASE("persisted git config protection is honoured", "[app]") {
  auto state = local_repo();
  respond(*state, "git config --get prune-merged.skip", 0, "master,release\n");
  respond(*state, "git branch -d patch-1", 0, "");
  respond(*state, "git branch -d patch-2", 0, "");
  Run r = run_app(state, {"-l", "-a", "--delay", "0"});
  CHECK(r.exit_code == gpm::kExitOk);
  CHECK(state->calls.back() == "git branch -d patch-2");
  CHECK(count_calls(*state, "git branch -d") == 2);
  CHECK(count_calls(*state, "git branch -d release") == 0);
}

TEST_CASE("explicit skip and match narrow the selection", "[app]") {
  auto state = local_repo();
  respond(*state, "git branch -d patch-2", 0, "");
  Run r = run_app(state, {"-l", "-a", "--delay", "0", "-s", "patch-1", "-m",
                          "^patch-"});
  CHECK(r.exit_code == gpm::kExitOk);
  CHECK(count_calls(*state, "git branch -d") == 1);
  CHECK(count_calls(*state, "git branch -d patch-2") == 1);
}

TEST_CASE("config file values sit between the CLI and git config", "[app]") {
  auto path = (std::filesystem::temp_directory_path() / "gpm_app.yaml").string();
  {
    std::ofstream f(path);
    f << "branches:\n  skip: master,patch-1,patch-2\n";
    f << "workflow:\n  local: true\n";
  }
  auto state = local_repo();
  respond(*state, "git config --get prune-merged.skip", 0, "master\n");
  Run r = run_app(state, {"--config", path});
  CHECK(r.exit_code == gpm::kExitOk);
  CHECK(contains(r.output, "  release\n"));
  CHECK_FALSE(contains(r.output, "  patch-1\n"));
  CHECK(count_calls(*state, "git config --get prune-merged.skip") == 0);
  std::filesystem::remove(path);
}

TEST_CASE("nothing left to delete exits with status 2", "[app]") {
  auto state = local_repo();
  Run r = run_app(state, {"-l", "-m", "^nomatch$"});
  CHECK(r.exit_code == gpm::kExitNothingToDo);
  CHECK(contains(r.output, "No local branches merged into origin/master"));
}

TEST_CASE("scope errors fail before git is invoked", "[app]") {
  auto state = local_repo();
  CHECK(run_app(state, {}).exit_code == gpm::kExitConfigError);
  CHECK(run_app(state, {"-l", "-r", "origin"}).exit_code ==
        gpm::kExitConfigError);
  CHECK(run_app(state, {"-r", ""}).exit_code == gpm::kExitConfigError);
  CHECK(state->calls.empty());
}

TEST_CASE("invalid patterns fail before enumeration", "[app]") {
  auto state = local_repo();
  CHECK(run_app(state, {"-l", "-m", "(broken"}).exit_code ==
        gpm::kExitConfigError);
  CHECK(run_app(state, {"-l", "-i", "[a-"}).exit_code ==
        gpm::kExitConfigError);
  CHECK(count_calls(*state, "git branch") == 0);
}

TEST_CASE("invalid delay and target are configuration errors", "[app]") {
  auto state = local_repo();
  CHECK(run_app(state, {"-l", "--delay", "soon"}).exit_code ==
        gpm::kExitConfigError);
  CHECK(run_app(state, {"-l", "--into", ""}).exit_code ==
        gpm::kExitConfigError);
  CHECK(run_app(state, {"-l", "--delay", "9999999999999h"}).exit_code ==
        gpm::kExitConfigError);
  CHECK(count_calls(*state, "git branch") == 0);
}

TEST_CASE("unknown log levels are configuration errors", "[app]") {
  auto state = local_repo();
  CHECK(run_app(state, {"-l", "--log-category", "git=bogus"}).exit_code ==
        gpm::kExitConfigError);

  auto path =
      (std::filesystem::temp_directory_path() / "gpm_app_level.yaml").string();
  {
    std::ofstream f(path);
    f << "logging:\n  log_level: loud\n";
  }
  CHECK(run_app(state, {"-l", "--config", path}).exit_code ==
        gpm::kExitConfigError);
  CHECK(count_calls(*state, "git branch") == 0);
  std::filesystem::remove(path);

  CHECK(run_app(state, {"-l", "--log-category", "git=warning"}).exit_code ==
        gpm::kExitOk);
}

TEST_CASE("git failures exit with status 3", "[app]") {
  auto state = local_repo();
  respond(*state, kLocalList, 128, "", "fatal: not a git repository\n");
  CHECK(run_app(state, {"-l"}).exit_code == gpm::kExitExternalError);

  auto remote = local_repo();
  respond(*remote, "git remote", 0, "origin\n");
  CHECK(run_app(remote, {"-r", "upstream"}).exit_code ==
        gpm::kExitExternalError);
}

TEST_CASE("a rejected deletion exits with status 3", "[app]") {
  auto state = local_repo();
  respond(*state, "git branch -d patch-1", 0, "");
  respond(*state, "git branch -d release", 1, "", "error: not fully merged\n");
  respond(*state, "git branch -d patch-2", 0, "");
  Run r = run_app(state, {"-l", "-a", "--delay", "0"});
  CHECK(r.exit_code == gpm::kExitExternalError);
  CHECK(count_calls(*state, "git branch -d") == 3);
  CHECK(contains(r.output, "not fully merged"));
}

TEST_CASE("interrupt before deletion exits with status 130", "[app]") {
  auto state = local_repo();
  gpm::CancellationToken token;
  token.cancel();
  Run r = run_app(state, {"-l", "-a"}, &token);
  CHECK(r.exit_code == gpm::kExitInterrupted);
  CHECK(count_calls(*state, "git branch -d") == 0);
}

TEST_CASE("remote scope deletes through git push", "[app]") {
  auto state = std::make_shared<FakeCommandRunner::State>();
  respond(*state, "git remote", 0, "origin\n");
  respond(*state,
          "git rev-parse --abbrev-ref --symbolic-full-name @{upstream}", 0,
          "origin/work\n");
  respond(*state,
          "git branch --remotes --merged=origin/master --format=%(refname)", 0,
          "refs/remotes/origin/HEAD\n"
          "refs/remotes/origin/master\n"
          "refs/remotes/origin/work\n"
          "refs/remotes/origin/old\n");
  respond(*state, "git push origin --delete old", 0, "");
  Run r = run_app(state, {"--remote", "origin", "--apply", "--delay", "0ms"});
  CHECK(r.exit_code == gpm::kExitOk);
  CHECK(count_calls(*state, "git push") == 1);
  CHECK(contains(r.output, "origin/old"));
}
