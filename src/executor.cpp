#include "executor.hpp"
#include "log.hpp"
#include "util/duration.hpp"

#include <algorithm>
#include <csignal>
#include <thread>

#include <spdlog/spdlog.h>

namespace gpm {

namespace {

constexpr std::chrono::milliseconds kDelaySlice{100};

constexpr const char *kBold = "1";
constexpr const char *kRed = "31";
constexpr const char *kGreen = "32";
constexpr const char *kYellow = "33";

std::atomic<CancellationToken *> g_interrupt_token{nullptr};

void handle_interrupt(int) {
  CancellationToken *token = g_interrupt_token.load();
  if (token != nullptr) {
    token->cancel();
  }
}

std::shared_ptr<spdlog::logger> executor_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("executor");
  }();
  return logger;
}

std::string qualified(const Plan &plan, const std::string &branch) {
  if (is_local(plan.scope())) {
    return branch;
  }
  return remote_name(plan.scope()) + "/" + branch;
}

} // namespace

void install_interrupt_handler(CancellationToken &token) {
  g_interrupt_token.store(&token);
  std::signal(SIGINT, handle_interrupt);
  std::signal(SIGTERM, handle_interrupt);
}

std::size_t ExecutionReport::failures() const {
  return static_cast<std::size_t>(
      std::count_if(results.begin(), results.end(),
                    [](const DeletionResult &r) { return !r.deleted; }));
}

PlanExecutor::PlanExecutor(const GitClient &git, std::ostream &out,
                           ExecutorOptions options,
                           const CancellationToken &token, Sleeper sleeper)
    : git_(git), out_(out), options_(options), token_(token),
      sleeper_(std::move(sleeper)) {
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds d) {
      std::this_thread::sleep_for(d);
    };
  }
}

std::string PlanExecutor::paint(const std::string &text,
                                const char *code) const {
  if (!options_.color) {
    return text;
  }
  return std::string("\033[") + code + "m" + text + "\033[0m";
}

void PlanExecutor::report(const Plan &plan) {
  out_ << paint("Scope:", kBold) << ' ' << to_string(plan.scope()) << '\n';
  out_ << paint("Merged into:", kBold) << ' ' << plan.target() << '\n';
  out_ << paint("Protected:", kBold) << ' '
       << (plan.skipped().empty() ? std::string("(none)")
                                  : plan.skipped().join())
       << '\n';
  out_ << paint(plan.mode() == RunMode::Apply ? "Deleting:" : "Would delete:",
                kBold)
       << '\n';
  for (const auto &branch : plan.selected()) {
    out_ << "  " << paint(qualified(plan, branch), kYellow) << '\n';
  }
  out_.flush();
}

bool PlanExecutor::wait_safety_delay() {
  auto remaining = options_.delay;
  if (remaining.count() <= 0) {
    return !token_.cancelled();
  }
  out_ << "Deleting in " << format_duration(remaining)
       << "; press Ctrl-C to abort" << std::endl;
  while (remaining.count() > 0) {
    if (token_.cancelled()) {
      return false;
    }
    auto slice = std::min(remaining, kDelaySlice);
    sleeper_(slice);
    remaining -= slice;
  }
  return !token_.cancelled();
}

ExecutionReport PlanExecutor::execute(const Plan &plan) {
  ExecutionReport report_out;
  report(plan);
  if (plan.mode() == RunMode::DryRun) {
    out_ << "Dry run: nothing deleted. Re-run with --apply to delete "
         << plan.selected().size() << " branch(es)." << std::endl;
    executor_log()->info("Dry run listed {} branch(es)",
                         plan.selected().size());
    return report_out;
  }

  if (!wait_safety_delay()) {
    report_out.cancelled = true;
    out_ << paint("Aborted; no branches were deleted.", kRed) << std::endl;
    executor_log()->warn("Interrupted during safety delay; nothing deleted");
    return report_out;
  }

  report_out.results.reserve(plan.selected().size());
  for (const auto &branch : plan.selected()) {
    if (token_.cancelled()) {
      report_out.cancelled = true;
      out_ << paint("Interrupted; remaining branches kept.", kRed) << '\n';
      break;
    }
    auto result = git_.delete_branch(plan.scope(), branch);
    if (result.deleted) {
      out_ << paint("deleted", kGreen) << "  " << qualified(plan, branch)
           << '\n';
    } else {
      out_ << paint("failed", kRed) << "   " << qualified(plan, branch)
           << ": " << result.message << '\n';
    }
    report_out.results.push_back(std::move(result));
  }
  out_.flush();
  executor_log()->info("Deleted {} of {} branch(es)",
                       report_out.results.size() - report_out.failures(),
                       report_out.results.size());
  return report_out;
}

} // namespace gpm
