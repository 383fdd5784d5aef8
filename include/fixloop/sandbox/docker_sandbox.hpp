#pragma once

#include "fixloop/sandbox/sandbox.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <string>

namespace fixloop {

struct DockerSandboxOptions {
  std::string socket_path{"/var/run/docker.sock"};
  std::string api_version{"v1.43"};
  // Host directory bind-mounted into each container at /workspace
  std::filesystem::path workspace_root{"/tmp/fixloop"};
  std::string owner;
  // language -> image, overriding the built-in map
  std::map<std::string, std::string> images;
};

inline constexpr std::string_view kOwnerLabel = "fixloop.owner";
inline constexpr std::string_view kTaskLabel = "fixloop.task";

// One throwaway container per execution, with networking disabled and
// memory, CPU and pid caps enforced by the Docker daemon.
class DockerSandbox : public ISandbox {
public:
  explicit DockerSandbox(DockerSandboxOptions options);
  ~DockerSandbox() override;

  DockerSandbox(const DockerSandbox&) = delete;
  auto operator=(const DockerSandbox&) -> DockerSandbox& = delete;

  [[nodiscard]] auto check() -> Result<void> override;
  [[nodiscard]] auto execute(const ExecutionRequest& request,
                             const ResourceLimits& limits,
                             CancellationToken token)
      -> Result<ExecutionResult> override;
  [[nodiscard]] auto sweep_orphans(const OwnerLock& lock)
      -> Result<std::size_t> override;

  [[nodiscard]] auto image_for(std::string_view language) const
      -> std::optional<std::string>;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace fixloop
