#include "app.hpp"
#include "executor.hpp"
#include "log.hpp"

#include <exception>
#include <memory>
#include <spdlog/spdlog.h>

namespace {
std::shared_ptr<spdlog::logger> main_log() {
  static auto logger = [] {
    gpm::ensure_default_logger();
    return gpm::category_logger("main");
  }();
  return logger;
}
} // namespace

/**
 * Program entry point. Installs the interrupt handler and runs the
 * application.
 *
 * @param argc Number of CLI arguments received from the OS.
 * @param argv Null-terminated array containing the raw CLI arguments.
 * @return Process exit code forwarded from the application logic.
 */
int main(int argc, char **argv) {
  gpm::CancellationToken token;
  gpm::install_interrupt_handler(token);
  int ret = gpm::kExitExternalError;
  try {
    gpm::App app(nullptr, std::cout, &token);
    ret = app.run(argc, argv);
  } catch (const std::exception &e) {
    main_log()->critical("Unexpected failure: {}", e.what());
  }
  spdlog::shutdown();
  return ret;
}
