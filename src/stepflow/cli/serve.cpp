#include "stepflow/app/application.hpp"
#include "stepflow/cli/commands.hpp"
#include "stepflow/util/daemon.hpp"
#include "stepflow/util/log.hpp"

#include <print>

namespace stepflow::cli {

auto cmd_serve(const ServeOptions& opts) -> int {
  auto result = load_config(opts.common);
  if (!result) {
    std::println(stderr, "Error: {}", result.error().message());
    return 1;
  }
  auto config = std::move(*result);
  if (opts.workers) {
    config.worker.count = *opts.workers;
  }

  const auto& log_file = config.logging.file;
  if (opts.daemon && log_file.empty()) {
    std::println(stderr, "Error: --daemon requires logging.file in config");
    return 1;
  }
  if (!log_file.empty() && !log::open_file(log_file)) {
    std::println(stderr, "Error: Failed to open log file: {}", log_file);
    return 1;
  }

  if (opts.daemon && !daemonize()) {
    std::println(stderr, "Error: Failed to daemonize");
    return 1;
  }

  log::set_level(config.logging.level);
  log::start();

  Application app(std::move(config));

  if (auto r = app.init(); !r) {
    log::error("Initialization failed: {}", r.error().message());
    log::stop();
    return 1;
  }

  setup_signal_handlers();

  log::info("Stepflow starting with {} worker(s)...", app.config().worker.count);
  if (auto r = app.start(); !r) {
    log::error("Failed to start: {}", r.error().message());
    log::stop();
    return 1;
  }

  wait_for_shutdown();
  log::info("Received shutdown signal, stopping...");
  app.stop();

  log::info("Stepflow stopped.");
  log::stop();
  return 0;
}

}  // namespace stepflow::cli
