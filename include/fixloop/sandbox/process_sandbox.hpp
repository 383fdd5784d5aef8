#pragma once

#include "fixloop/sandbox/sandbox.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace fixloop {

struct ProcessSandboxOptions {
  std::filesystem::path workspace_root{"/tmp/fixloop"};
  // Scopes the orphan sweep to environments created by this worker
  std::string owner;
  bool network_isolation{true};
};

// Runs the test command as a local process tree in a fresh workspace
// directory, with rlimits and (optionally) empty user+network namespaces.
//
// Layout: <workspace_root>/<owner>/<sandbox name>/{work/, pgid}
class ProcessSandbox : public ISandbox {
public:
  explicit ProcessSandbox(ProcessSandboxOptions options);

  [[nodiscard]] auto check() -> Result<void> override;
  [[nodiscard]] auto execute(const ExecutionRequest& request,
                             const ResourceLimits& limits,
                             CancellationToken token)
      -> Result<ExecutionResult> override;
  [[nodiscard]] auto sweep_orphans(const OwnerLock& lock)
      -> Result<std::size_t> override;

  [[nodiscard]] auto owner_root() const -> std::filesystem::path;

private:
  auto destroy(const std::filesystem::path& root) -> void;

  ProcessSandboxOptions options_;
};

}  // namespace fixloop
