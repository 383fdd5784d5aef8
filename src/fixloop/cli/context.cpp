#include "fixloop/cli/context.hpp"

#include "fixloop/config/config_loader.hpp"
#include "fixloop/sandbox/docker_sandbox.hpp"
#include "fixloop/sandbox/process_sandbox.hpp"

namespace fixloop::cli {

auto load_config(const CommonOptions& opts) -> Result<SystemConfig> {
  auto config = opts.config_file.empty()
                    ? ConfigLoader::load_from_string("")
                    : ConfigLoader::load_from_file(opts.config_file);
  if (!config) {
    return fail(config.error());
  }
  if (opts.db_file) {
    config->storage.db_file = *opts.db_file;
  }
  return config;
}

auto open_storage(const SystemConfig& config) -> Result<Storage> {
  Storage storage{
      .store = std::make_unique<SqliteTaskStore>(config.storage.db_file),
      .queue = std::make_unique<SqliteTaskQueue>(config.storage.db_file),
  };
  if (auto r = storage.store->open(); !r) {
    return fail(r.error());
  }
  if (auto r = storage.queue->open(); !r) {
    return fail(r.error());
  }
  return storage;
}

auto make_sandbox(const SystemConfig& config) -> std::unique_ptr<ISandbox> {
  const auto& s = config.sandbox;
  if (parse_sandbox_runtime(s.runtime) == SandboxRuntime::Process) {
    return std::make_unique<ProcessSandbox>(ProcessSandboxOptions{
        .workspace_root = s.workspace_root,
        .owner = config.worker.id,
        .network_isolation = s.network_isolation,
    });
  }
  return std::make_unique<DockerSandbox>(DockerSandboxOptions{
      .socket_path = s.docker_socket,
      .api_version = s.api_version,
      .workspace_root = s.workspace_root,
      .owner = config.worker.id,
      .images = s.images,
  });
}

}  // namespace fixloop::cli
