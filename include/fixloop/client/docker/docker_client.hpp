#pragma once

#include "fixloop/client/http/http_client.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace fixloop::docker {

struct DockerClientConfig {
  std::chrono::milliseconds connect_timeout{30000};
  std::chrono::milliseconds read_timeout{300000};  // image pulls are slow
  std::string api_version{"v1.43"};
};

struct ContainerConfig {
  std::string image;
  std::string command;
  std::string working_dir;
  // uid[:gid]; empty keeps the image default
  std::string user;
  std::map<std::string, std::string> env;
  std::map<std::string, std::string> labels;
  // host:container[:mode]
  std::vector<std::string> binds;
  std::string network_mode;
  std::int64_t memory_bytes{0};
  std::int64_t nano_cpus{0};
  std::int64_t pids_limit{0};
};

struct CreateContainerResponse {
  std::string id;
  std::vector<std::string> warnings;
};

struct WaitContainerResponse {
  int status_code{0};
  std::string error;
};

struct ContainerLogs {
  std::string stdout_output;
  std::string stderr_output;
};

struct ContainerState {
  bool running{false};
  bool oom_killed{false};
  int exit_code{0};
};

struct ContainerSummary {
  std::string id;
  std::string name;
  std::map<std::string, std::string> labels;
};

enum class DockerError {
  ConnectionFailed,
  ApiError,
  ContainerNotFound,
  ImageNotFound,
  Conflict,
  Timeout,
  ParseError,
  InvalidInput,
};

[[nodiscard]] constexpr auto to_string_view(DockerError error) noexcept
    -> std::string_view {
  switch (error) {
    case DockerError::ConnectionFailed:
      return "connection failed";
    case DockerError::ApiError:
      return "API error";
    case DockerError::ContainerNotFound:
      return "container not found";
    case DockerError::ImageNotFound:
      return "image not found";
    case DockerError::Conflict:
      return "conflict";
    case DockerError::Timeout:
      return "timeout";
    case DockerError::ParseError:
      return "parse error";
    case DockerError::InvalidInput:
      return "invalid input";
  }
  return "unknown error";
}

template <typename T>
using DockerResult = std::expected<T, DockerError>;

// Docker Engine API over the daemon's unix socket. Calls block; the ones
// taking a container accept either its id or its name.
class DockerClient {
public:
  explicit DockerClient(std::string_view socket_path = "/var/run/docker.sock",
                        DockerClientConfig config = {});
  ~DockerClient();

  DockerClient(const DockerClient&) = delete;
  auto operator=(const DockerClient&) -> DockerClient& = delete;
  DockerClient(DockerClient&&) noexcept;
  auto operator=(DockerClient&&) noexcept -> DockerClient&;

  [[nodiscard]] auto ping() -> DockerResult<void>;

  [[nodiscard]] auto image_exists(std::string_view image) -> DockerResult<bool>;
  [[nodiscard]] auto pull_image(std::string_view image) -> DockerResult<void>;

  [[nodiscard]] auto create_container(const ContainerConfig& config,
                                      std::string_view name = "")
      -> DockerResult<CreateContainerResponse>;

  [[nodiscard]] auto start_container(std::string_view container)
      -> DockerResult<void>;

  // Blocks until the container exits or `timeout` elapses (Timeout).
  [[nodiscard]] auto wait_container(std::string_view container,
                                    std::chrono::milliseconds timeout)
      -> DockerResult<WaitContainerResponse>;

  [[nodiscard]] auto get_logs(std::string_view container)
      -> DockerResult<ContainerLogs>;

  [[nodiscard]] auto inspect_container(std::string_view container)
      -> DockerResult<ContainerState>;

  [[nodiscard]] auto kill_container(std::string_view container)
      -> DockerResult<void>;

  [[nodiscard]] auto stop_container(std::string_view container,
                                    std::chrono::seconds timeout =
                                        std::chrono::seconds{10})
      -> DockerResult<void>;

  // A container that is already gone counts as removed.
  [[nodiscard]] auto remove_container(std::string_view container,
                                      bool force = false) -> DockerResult<void>;

  // All containers (running or not) carrying every given label.
  [[nodiscard]] auto list_containers(
      const std::map<std::string, std::string>& labels)
      -> DockerResult<std::vector<ContainerSummary>>;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

// Demultiplexes the 8-byte framed log stream of a non-TTY container.
[[nodiscard]] auto parse_log_stream(std::string_view raw_logs) -> ContainerLogs;

[[nodiscard]] auto url_encode(std::string_view input) -> std::string;

}  // namespace fixloop::docker
