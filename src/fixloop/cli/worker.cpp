#include "fixloop/cli/commands.hpp"
#include "fixloop/cli/context.hpp"
#include "fixloop/generation/http_generator.hpp"
#include "fixloop/orchestrator/orchestrator.hpp"
#include "fixloop/sandbox/slot_pool.hpp"
#include "fixloop/storage/recovery.hpp"
#include "fixloop/util/daemon.hpp"
#include "fixloop/util/log.hpp"
#include "fixloop/worker/coordinator.hpp"

#include <print>

namespace fixloop::cli {

auto cmd_worker(const WorkerOptions& opts) -> int {
  auto loaded = load_config(opts.common);
  if (!loaded) {
    std::println(stderr, "Error: {}", loaded.error().message());
    return 1;
  }
  auto config = std::move(*loaded);

  const auto& log_file = config.worker.log_file;
  if (opts.daemon && log_file.empty()) {
    std::println(stderr, "Error: --daemon requires worker.log_file in the config");
    return 1;
  }
  if (!log_file.empty() && !log::set_output(log_file)) {
    std::println(stderr, "Error: Failed to open log file: {}", log_file);
    return 1;
  }

  if (opts.daemon && !daemonize()) {
    std::println(stderr, "Error: Failed to daemonize");
    return 1;
  }

  log::set_level(config.worker.log_level);
  log::start();

  auto storage = open_storage(config);
  if (!storage) {
    log::error("Failed to open database {}: {}", config.storage.db_file,
               storage.error().message());
    log::stop();
    return 1;
  }

  HttpGenerator generator(config.generation);
  if (auto r = generator.check(); !r) {
    log::error("Generation provider is not usable: {}", r.error().message());
    log::stop();
    return 1;
  }

  // Held until this function returns; a second worker with the same id
  // would otherwise sweep this one's live sandboxes.
  auto owner_lock =
      OwnerLock::acquire(config.sandbox.workspace_root, config.worker.id);
  if (!owner_lock) {
    log::error("Cannot claim worker id {}: {}", config.worker.id,
               owner_lock.error().message());
    log::stop();
    return 1;
  }

  auto sandbox = make_sandbox(config);
  if (auto r = sandbox->check(); !r) {
    log::warn("Sandbox runtime {} is not reachable: {}", config.sandbox.runtime,
              r.error().message());
  }

  setup_signal_handlers();
  if (!write_pid_file(config.worker.pid_file)) {
    log::warn("Failed to write pid file {}", config.worker.pid_file);
  }

  Recovery recovery(*storage->store, *storage->queue, *sandbox);
  if (auto r = recovery.recover(*owner_lock); !r) {
    log::warn("Recovery failed: {}", r.error().message());
  }

  SlotPool slots(static_cast<std::size_t>(config.sandbox.slots));
  Orchestrator orchestrator(*storage->store, generator, *sandbox, slots,
                            make_orchestrator_options(config));
  Coordinator coordinator(
      *storage->store, *storage->queue, orchestrator,
      CoordinatorOptions{
          .owner = config.worker.id,
          .concurrency = config.worker.concurrency,
          .poll_interval =
              std::chrono::milliseconds(config.worker.poll_interval_ms),
          .visibility_timeout =
              std::chrono::seconds(config.worker.visibility_timeout_sec),
          .heartbeat_interval =
              std::chrono::milliseconds(config.worker.heartbeat_interval_ms),
          .retention = std::chrono::hours(config.storage.retention_hours),
      });

  log::info("fixloop worker {} starting ({} runtime, {} slots)",
            config.worker.id, config.sandbox.runtime, config.sandbox.slots);
  coordinator.start();

  wait_for_shutdown();
  log::info("Shutdown requested");
  coordinator.stop();

  remove_pid_file(config.worker.pid_file);
  log::info("fixloop worker stopped.");
  log::stop();
  return 0;
}

}  // namespace fixloop::cli
