#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace fixloop {

struct StorageConfig {
  std::string db_file{"fixloop.db"};
  // Terminal tasks older than this are purged; 0 keeps them forever
  int retention_hours{168};
};

struct WorkerConfig {
  // Owner label for sandboxes; defaults to the host name
  std::string id;
  int concurrency{4};
  int poll_interval_ms{500};
  int visibility_timeout_sec{900};
  int heartbeat_interval_ms{1000};
  std::string log_level{"info"};
  std::string log_file;
  std::string pid_file;
};

struct OrchestratorConfig {
  int max_attempts{3};
  int review_retry_limit{2};
  int generation_max_retries{3};
  int backoff_base_ms{60000};
  int backoff_max_ms{300000};
  std::size_t output_tail_bytes{1000};
};

enum class SandboxRuntime : std::uint8_t { Docker, Process };

[[nodiscard]] constexpr auto sandbox_runtime_name(SandboxRuntime r) noexcept
    -> std::string_view {
  switch (r) {
    case SandboxRuntime::Docker: return "docker";
    case SandboxRuntime::Process: return "process";
  }
  return "docker";
}

[[nodiscard]] constexpr auto parse_sandbox_runtime(std::string_view name) noexcept
    -> std::optional<SandboxRuntime> {
  if (name == "docker") return SandboxRuntime::Docker;
  if (name == "process") return SandboxRuntime::Process;
  return std::nullopt;
}

struct SandboxConfig {
  std::string runtime{"docker"};
  int timeout_sec{300};
  std::string memory{"512m"};
  double cpu{0.5};
  int pids_limit{256};
  int slots{4};
  int slot_acquire_timeout_sec{600};
  std::string workspace_root{"/tmp/fixloop"};
  bool network_isolation{true};
  std::string docker_socket{"/var/run/docker.sock"};
  std::string api_version{"v1.43"};
  std::map<std::string, std::string> images;
};

struct GenerationConfig {
  std::string base_url{"https://api.openai.com"};
  std::string path{"/v1/chat/completions"};
  std::string model{"gpt-4o"};
  double temperature{0.1};
  std::string api_key_env{"FIXLOOP_API_KEY"};
  int timeout_sec{120};
};

struct SystemConfig {
  StorageConfig storage;
  WorkerConfig worker;
  OrchestratorConfig orchestrator;
  SandboxConfig sandbox;
  GenerationConfig generation;
};

}  // namespace fixloop
