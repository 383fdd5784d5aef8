#include "fixloop/cli/commands.hpp"
#include "fixloop/cli/context.hpp"
#include "fixloop/util/log.hpp"
#include "fixloop/util/util.hpp"

#include <chrono>
#include <print>

namespace fixloop::cli {

auto cmd_sweep(const SweepOptions& opts) -> int {
  auto config = load_config(opts.common);
  if (!config) {
    std::println(stderr, "Error: {}", config.error().message());
    return 1;
  }
  log::set_level(config->worker.log_level);

  auto lock =
      OwnerLock::acquire(config->sandbox.workspace_root, config->worker.id);
  if (!lock) {
    std::println(stderr, "Error: Cannot sweep {}: {}", config->worker.id,
                 lock.error().message());
    return 1;
  }

  auto sandbox = make_sandbox(*config);
  auto swept = sandbox->sweep_orphans(*lock);
  if (!swept) {
    std::println(stderr, "Error: Sweep failed: {}", swept.error().message());
    return 1;
  }
  std::println("Removed {} sandbox environments owned by {}", *swept,
               config->worker.id);

  if (config->storage.retention_hours <= 0) {
    return 0;
  }
  auto storage = open_storage(*config);
  if (!storage) {
    std::println(stderr, "Error: Failed to open database: {}",
                 storage.error().message());
    return 1;
  }
  auto cutoff =
      Clock::now() - std::chrono::hours(config->storage.retention_hours);
  auto purged = storage->store->purge_terminal(cutoff);
  if (!purged) {
    std::println(stderr, "Error: Retention sweep failed: {}",
                 purged.error().message());
    return 1;
  }
  std::println("Purged {} tasks finished more than {}h ago", *purged,
               config->storage.retention_hours);
  return 0;
}

}  // namespace fixloop::cli
