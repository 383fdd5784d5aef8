#pragma once

#include "fixloop/cli/commands.hpp"
#include "fixloop/config/system_config.hpp"
#include "fixloop/core/error.hpp"
#include "fixloop/queue/sqlite_task_queue.hpp"
#include "fixloop/sandbox/sandbox.hpp"
#include "fixloop/storage/sqlite_task_store.hpp"

#include <memory>

namespace fixloop::cli {

// Config with command-line overrides applied. Without a config file every
// setting keeps its default.
[[nodiscard]] auto load_config(const CommonOptions& opts)
    -> Result<SystemConfig>;

// Store and queue opened on the configured database file.
struct Storage {
  std::unique_ptr<SqliteTaskStore> store;
  std::unique_ptr<SqliteTaskQueue> queue;
};

[[nodiscard]] auto open_storage(const SystemConfig& config) -> Result<Storage>;

[[nodiscard]] auto make_sandbox(const SystemConfig& config)
    -> std::unique_ptr<ISandbox>;

}  // namespace fixloop::cli
