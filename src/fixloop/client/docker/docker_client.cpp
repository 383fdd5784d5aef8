#include "fixloop/client/docker/docker_client.hpp"

#include "fixloop/util/log.hpp"

#include <nlohmann/json.hpp>

#include <bit>
#include <cctype>
#include <cstdint>
#include <cstring>
#include <format>
#include <iterator>

namespace fixloop::docker {

using json = nlohmann::json;

namespace {

constexpr std::size_t kDockerLogHeaderSize = 8;
constexpr std::uint8_t kStdoutStream = 1;
constexpr std::uint8_t kStderrStream = 2;
// Extra wait time on top of the caller's timeout for the HTTP round trip
constexpr auto kWaitSlack = std::chrono::milliseconds(2000);

// Container ids are hex; names add [_.-].
auto is_valid_container_ref(std::string_view ref) -> bool {
  if (ref.empty() || ref.size() > 128) {
    return false;
  }
  for (char c : ref) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_' &&
        c != '.') {
      return false;
    }
  }
  return true;
}

auto is_valid_env_key(std::string_view key) -> bool {
  if (key.empty()) {
    return false;
  }
  for (char c : key) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
      return false;
    }
  }
  return true;
}

auto to_docker_error(http::HttpError error) -> DockerError {
  switch (error) {
    case http::HttpError::ConnectFailed: return DockerError::ConnectionFailed;
    case http::HttpError::Timeout: return DockerError::Timeout;
    case http::HttpError::ParseError: return DockerError::ParseError;
    default: return DockerError::ApiError;
  }
}

auto split_image(std::string_view image) -> std::pair<std::string, std::string> {
  std::string image_name{image};
  std::string tag = "latest";
  if (auto pos = image.rfind(':'); pos != std::string_view::npos) {
    if (image.find('/', pos) == std::string_view::npos) {
      image_name = std::string(image.substr(0, pos));
      tag = std::string(image.substr(pos + 1));
    }
  }
  return {std::move(image_name), std::move(tag)};
}

}  // namespace

auto url_encode(std::string_view input) -> std::string {
  std::string result;
  result.reserve(input.size() * 3);  // Worst case: each char becomes %XX
  for (char c : input) {
    if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' ||
        c == '.' || c == '~') {
      result += c;
    } else {
      std::format_to(std::back_inserter(result), "%{:02X}",
                     static_cast<unsigned char>(c));
    }
  }
  return result;
}

auto parse_log_stream(std::string_view raw_logs) -> ContainerLogs {
  ContainerLogs logs;
  std::size_t pos = 0;

  while (pos + kDockerLogHeaderSize <= raw_logs.size()) {
    auto stream_type = static_cast<std::uint8_t>(raw_logs[pos]);

    std::uint32_t size = 0;
    std::memcpy(&size, raw_logs.data() + pos + 4, sizeof(size));
    if constexpr (std::endian::native == std::endian::little) {
      size = std::byteswap(size);
    }

    pos += kDockerLogHeaderSize;
    if (pos + size > raw_logs.size()) {
      break;
    }

    std::string_view payload = raw_logs.substr(pos, size);
    if (stream_type == kStdoutStream) {
      logs.stdout_output.append(payload);
    } else if (stream_type == kStderrStream) {
      logs.stderr_output.append(payload);
    }
    pos += size;
  }

  return logs;
}

struct DockerClient::Impl {
  http::HttpClient http_client;
  DockerClientConfig config;

  Impl(std::string_view socket_path, DockerClientConfig cfg)
      : http_client(http::Endpoint::unix_socket(socket_path),
                    http::HttpClientConfig{
                        .connect_timeout = cfg.connect_timeout,
                        .read_timeout = cfg.read_timeout,
                        .max_response_size = 100 * 1024 * 1024,
                    }),
        config(std::move(cfg)) {
  }

  [[nodiscard]] auto api(std::string_view path) const -> std::string {
    return std::format("/{}{}", config.api_version, path);
  }
};

DockerClient::DockerClient(std::string_view socket_path,
                           DockerClientConfig config)
    : impl_(std::make_unique<Impl>(socket_path, std::move(config))) {
}

DockerClient::~DockerClient() = default;

DockerClient::DockerClient(DockerClient&&) noexcept = default;
auto DockerClient::operator=(DockerClient&&) noexcept
    -> DockerClient& = default;

auto DockerClient::ping() -> DockerResult<void> {
  auto response = impl_->http_client.get("/_ping");
  if (!response) {
    log::error("Docker daemon unreachable: {}",
               http::to_string_view(response.error()));
    return std::unexpected(to_docker_error(response.error()));
  }
  if (response->status != 200) {
    return std::unexpected(DockerError::ApiError);
  }
  return {};
}

auto DockerClient::image_exists(std::string_view image) -> DockerResult<bool> {
  if (image.empty()) {
    return std::unexpected(DockerError::InvalidInput);
  }
  auto response = impl_->http_client.get(
      impl_->api(std::format("/images/{}/json", url_encode(image))));
  if (!response) {
    return std::unexpected(to_docker_error(response.error()));
  }
  if (response->status == 404) {
    return false;
  }
  if (response->status != 200) {
    return std::unexpected(DockerError::ApiError);
  }
  return true;
}

auto DockerClient::pull_image(std::string_view image) -> DockerResult<void> {
  if (image.empty()) {
    log::error("Empty image name");
    return std::unexpected(DockerError::InvalidInput);
  }

  auto [image_name, tag] = split_image(image);
  auto path = impl_->api(std::format("/images/create?fromImage={}&tag={}",
                                     url_encode(image_name), url_encode(tag)));

  log::info("DockerClient: pulling image {}:{}", image_name, tag);
  auto response = impl_->http_client.post(path);
  if (!response) {
    return std::unexpected(to_docker_error(response.error()));
  }
  if (response->status == 404) {
    log::error("Image not found: {}:{}", image_name, tag);
    return std::unexpected(DockerError::ImageNotFound);
  }
  if (response->status != 200) {
    log::error("Failed to pull image {}:{}: status={}", image_name, tag,
               response->status);
    return std::unexpected(DockerError::ApiError);
  }

  // Progress is streamed as JSON lines; a failure arrives as {"error": ...}
  // after the 200 status line.
  std::string_view body = response->body;
  while (!body.empty()) {
    auto eol = body.find('\n');
    auto line = body.substr(0, eol);
    body = eol == std::string_view::npos ? std::string_view{}
                                         : body.substr(eol + 1);
    auto progress = json::parse(line, nullptr, false);
    if (!progress.is_discarded() && progress.is_object() &&
        progress.contains("error")) {
      log::error("Failed to pull image {}:{}: {}", image_name, tag,
                 progress["error"].dump());
      return std::unexpected(DockerError::ImageNotFound);
    }
  }

  log::info("DockerClient: pulled image {}:{}", image_name, tag);
  return {};
}

auto DockerClient::create_container(const ContainerConfig& config,
                                    std::string_view name)
    -> DockerResult<CreateContainerResponse> {
  json body;
  body["Image"] = config.image;
  body["AttachStdout"] = true;
  body["AttachStderr"] = true;
  body["Tty"] = false;

  if (!config.command.empty()) {
    body["Cmd"] = json::array({"sh", "-c", config.command});
  }
  if (!config.working_dir.empty()) {
    body["WorkingDir"] = config.working_dir;
  }
  if (!config.user.empty()) {
    body["User"] = config.user;
  }
  if (!config.env.empty()) {
    json env_array = json::array();
    for (const auto& [key, value] : config.env) {
      if (!is_valid_env_key(key)) {
        log::error("Invalid environment variable key: {}", key);
        return std::unexpected(DockerError::InvalidInput);
      }
      env_array.push_back(std::format("{}={}", key, value));
    }
    body["Env"] = env_array;
  }
  if (!config.labels.empty()) {
    body["Labels"] = config.labels;
  }

  json host_config = json::object();
  if (!config.binds.empty()) {
    host_config["Binds"] = config.binds;
  }
  if (!config.network_mode.empty()) {
    host_config["NetworkMode"] = config.network_mode;
    if (config.network_mode == "none") {
      body["NetworkDisabled"] = true;
    }
  }
  if (config.memory_bytes > 0) {
    host_config["Memory"] = config.memory_bytes;
    // Equal to Memory: no swap on top of the cap
    host_config["MemorySwap"] = config.memory_bytes;
  }
  if (config.nano_cpus > 0) {
    host_config["NanoCpus"] = config.nano_cpus;
  }
  if (config.pids_limit > 0) {
    host_config["PidsLimit"] = config.pids_limit;
  }
  body["HostConfig"] = std::move(host_config);

  std::string path = impl_->api("/containers/create");
  if (!name.empty()) {
    std::format_to(std::back_inserter(path), "?name={}", url_encode(name));
  }

  auto response = impl_->http_client.post_json(path, body.dump());
  if (!response) {
    return std::unexpected(to_docker_error(response.error()));
  }
  if (response->status == 404) {
    log::error("Docker image not found: {}", config.image);
    return std::unexpected(DockerError::ImageNotFound);
  }
  if (response->status == 409) {
    log::error("Container name conflict: {}", name);
    return std::unexpected(DockerError::Conflict);
  }
  if (response->status != 201) {
    log::error("Failed to create container: status={} {}", response->status,
               response->body);
    return std::unexpected(DockerError::ApiError);
  }

  try {
    auto json_body = json::parse(response->body);
    CreateContainerResponse result;
    result.id = json_body.value("Id", "");
    if (json_body.contains("Warnings") && json_body["Warnings"].is_array()) {
      for (const auto& w : json_body["Warnings"]) {
        result.warnings.push_back(w.get<std::string>());
      }
    }
    return result;
  } catch (const json::exception& e) {
    log::error("Failed to parse create container response: {}", e.what());
    return std::unexpected(DockerError::ParseError);
  }
}

auto DockerClient::start_container(std::string_view container)
    -> DockerResult<void> {
  if (!is_valid_container_ref(container)) {
    log::error("Invalid container reference: {}", container);
    return std::unexpected(DockerError::InvalidInput);
  }

  auto response = impl_->http_client.post(
      impl_->api(std::format("/containers/{}/start", container)));
  if (!response) {
    return std::unexpected(to_docker_error(response.error()));
  }
  if (response->status == 404) {
    log::error("Container not found: {}", container);
    return std::unexpected(DockerError::ContainerNotFound);
  }
  if (response->status != 204 && response->status != 304) {
    log::error("Failed to start container {}: status={}", container,
               response->status);
    return std::unexpected(DockerError::ApiError);
  }
  return {};
}

auto DockerClient::wait_container(std::string_view container,
                                  std::chrono::milliseconds timeout)
    -> DockerResult<WaitContainerResponse> {
  if (!is_valid_container_ref(container)) {
    log::error("Invalid container reference: {}", container);
    return std::unexpected(DockerError::InvalidInput);
  }

  http::HttpRequest req{
      .method = http::HttpMethod::POST,
      .path = impl_->api(std::format("/containers/{}/wait", container)),
      .headers = {},
      .body = {},
  };
  auto response = impl_->http_client.request(req, timeout + kWaitSlack);
  if (!response) {
    return std::unexpected(to_docker_error(response.error()));
  }
  if (response->status == 404) {
    log::error("Container not found: {}", container);
    return std::unexpected(DockerError::ContainerNotFound);
  }
  if (response->status != 200) {
    log::error("Failed to wait for container {}: status={}", container,
               response->status);
    return std::unexpected(DockerError::ApiError);
  }

  try {
    auto json_body = json::parse(response->body);
    WaitContainerResponse result;
    result.status_code = json_body.value("StatusCode", 0);
    if (json_body.contains("Error") && !json_body["Error"].is_null()) {
      result.error = json_body["Error"].value("Message", "");
    }
    return result;
  } catch (const json::exception& e) {
    log::error("Failed to parse wait container response: {}", e.what());
    return std::unexpected(DockerError::ParseError);
  }
}

auto DockerClient::get_logs(std::string_view container)
    -> DockerResult<ContainerLogs> {
  if (!is_valid_container_ref(container)) {
    log::error("Invalid container reference: {}", container);
    return std::unexpected(DockerError::InvalidInput);
  }

  auto response = impl_->http_client.get(impl_->api(
      std::format("/containers/{}/logs?stdout=true&stderr=true", container)));
  if (!response) {
    return std::unexpected(to_docker_error(response.error()));
  }
  if (response->status == 404) {
    log::error("Container not found: {}", container);
    return std::unexpected(DockerError::ContainerNotFound);
  }
  if (response->status != 200) {
    log::error("Failed to get logs for container {}: status={}", container,
               response->status);
    return std::unexpected(DockerError::ApiError);
  }
  return parse_log_stream(response->body);
}

auto DockerClient::inspect_container(std::string_view container)
    -> DockerResult<ContainerState> {
  if (!is_valid_container_ref(container)) {
    return std::unexpected(DockerError::InvalidInput);
  }

  auto response = impl_->http_client.get(
      impl_->api(std::format("/containers/{}/json", container)));
  if (!response) {
    return std::unexpected(to_docker_error(response.error()));
  }
  if (response->status == 404) {
    return std::unexpected(DockerError::ContainerNotFound);
  }
  if (response->status != 200) {
    return std::unexpected(DockerError::ApiError);
  }

  try {
    auto json_body = json::parse(response->body);
    const auto& state = json_body.at("State");
    return ContainerState{
        .running = state.value("Running", false),
        .oom_killed = state.value("OOMKilled", false),
        .exit_code = state.value("ExitCode", 0),
    };
  } catch (const json::exception& e) {
    log::error("Failed to parse inspect response for {}: {}", container,
               e.what());
    return std::unexpected(DockerError::ParseError);
  }
}

auto DockerClient::kill_container(std::string_view container)
    -> DockerResult<void> {
  if (!is_valid_container_ref(container)) {
    return std::unexpected(DockerError::InvalidInput);
  }

  auto response = impl_->http_client.post(
      impl_->api(std::format("/containers/{}/kill", container)));
  if (!response) {
    return std::unexpected(to_docker_error(response.error()));
  }
  if (response->status == 404) {
    return std::unexpected(DockerError::ContainerNotFound);
  }
  // 409: not running any more, which is what we wanted
  if (response->status != 204 && response->status != 409) {
    log::error("Failed to kill container {}: status={}", container,
               response->status);
    return std::unexpected(DockerError::ApiError);
  }
  return {};
}

auto DockerClient::stop_container(std::string_view container,
                                  std::chrono::seconds timeout)
    -> DockerResult<void> {
  if (!is_valid_container_ref(container)) {
    log::error("Invalid container reference: {}", container);
    return std::unexpected(DockerError::InvalidInput);
  }

  auto response = impl_->http_client.post(impl_->api(
      std::format("/containers/{}/stop?t={}", container, timeout.count())));
  if (!response) {
    return std::unexpected(to_docker_error(response.error()));
  }
  if (response->status == 404) {
    log::error("Container not found: {}", container);
    return std::unexpected(DockerError::ContainerNotFound);
  }
  if (response->status != 204 && response->status != 304) {
    log::error("Failed to stop container {}: status={}", container,
               response->status);
    return std::unexpected(DockerError::ApiError);
  }
  return {};
}

auto DockerClient::remove_container(std::string_view container, bool force)
    -> DockerResult<void> {
  if (!is_valid_container_ref(container)) {
    log::error("Invalid container reference: {}", container);
    return std::unexpected(DockerError::InvalidInput);
  }

  auto response = impl_->http_client.delete_(
      impl_->api(std::format("/containers/{}?force={}&v=true", container,
                             force ? "true" : "false")));
  if (!response) {
    return std::unexpected(to_docker_error(response.error()));
  }
  if (response->status == 404) {
    return {};
  }
  if (response->status != 204) {
    log::error("Failed to remove container {}: status={}", container,
               response->status);
    return std::unexpected(DockerError::ApiError);
  }
  return {};
}

auto DockerClient::list_containers(
    const std::map<std::string, std::string>& labels)
    -> DockerResult<std::vector<ContainerSummary>> {
  json label_filters = json::array();
  for (const auto& [key, value] : labels) {
    label_filters.push_back(std::format("{}={}", key, value));
  }
  json filters;
  filters["label"] = std::move(label_filters);

  auto response = impl_->http_client.get(impl_->api(std::format(
      "/containers/json?all=true&filters={}", url_encode(filters.dump()))));
  if (!response) {
    return std::unexpected(to_docker_error(response.error()));
  }
  if (response->status != 200) {
    log::error("Failed to list containers: status={}", response->status);
    return std::unexpected(DockerError::ApiError);
  }

  try {
    std::vector<ContainerSummary> result;
    for (const auto& item : json::parse(response->body)) {
      ContainerSummary summary;
      summary.id = item.value("Id", "");
      if (item.contains("Names") && item["Names"].is_array() &&
          !item["Names"].empty()) {
        auto name = item["Names"][0].get<std::string>();
        summary.name = name.starts_with('/') ? name.substr(1) : name;
      }
      if (item.contains("Labels") && item["Labels"].is_object()) {
        summary.labels =
            item["Labels"].get<std::map<std::string, std::string>>();
      }
      result.push_back(std::move(summary));
    }
    return result;
  } catch (const json::exception& e) {
    log::error("Failed to parse container list: {}", e.what());
    return std::unexpected(DockerError::ParseError);
  }
}

}  // namespace fixloop::docker
