#include "fixloop/config/config_loader.hpp"

#include "fixloop/config/yaml_utils.hpp"
#include "fixloop/util/log.hpp"
#include "fixloop/util/util.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<fixloop::StorageConfig> {
  static bool decode(const Node& node, fixloop::StorageConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.db_file = fixloop::yaml_get_or<std::string>(node, "db_file", "fixloop.db");
    s.retention_hours = fixloop::yaml_get_or(node, "retention_hours", 168);
    return true;
  }
};

template <>
struct convert<fixloop::WorkerConfig> {
  static bool decode(const Node& node, fixloop::WorkerConfig& w) {
    if (!node.IsMap()) {
      return false;
    }
    w.id = fixloop::yaml_get_or<std::string>(node, "id", "");
    w.concurrency = fixloop::yaml_get_or(node, "concurrency", 4);
    w.poll_interval_ms = fixloop::yaml_get_or(node, "poll_interval_ms", 500);
    w.visibility_timeout_sec =
        fixloop::yaml_get_or(node, "visibility_timeout_sec", 900);
    w.heartbeat_interval_ms =
        fixloop::yaml_get_or(node, "heartbeat_interval_ms", 1000);
    w.log_level = fixloop::yaml_get_or<std::string>(node, "log_level", "info");
    w.log_file = fixloop::yaml_get_or<std::string>(node, "log_file", "");
    w.pid_file = fixloop::yaml_get_or<std::string>(node, "pid_file", "");
    return true;
  }
};

template <>
struct convert<fixloop::OrchestratorConfig> {
  static bool decode(const Node& node, fixloop::OrchestratorConfig& o) {
    if (!node.IsMap()) {
      return false;
    }
    o.max_attempts = fixloop::yaml_get_or(node, "max_attempts", 3);
    o.review_retry_limit = fixloop::yaml_get_or(node, "review_retry_limit", 2);
    o.generation_max_retries =
        fixloop::yaml_get_or(node, "generation_max_retries", 3);
    o.backoff_base_ms = fixloop::yaml_get_or(node, "backoff_base_ms", 60000);
    o.backoff_max_ms = fixloop::yaml_get_or(node, "backoff_max_ms", 300000);
    o.output_tail_bytes =
        fixloop::yaml_get_or<std::size_t>(node, "output_tail_bytes", 1000);
    return true;
  }
};

template <>
struct convert<fixloop::SandboxConfig> {
  static bool decode(const Node& node, fixloop::SandboxConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.runtime = fixloop::yaml_get_or<std::string>(node, "runtime", "docker");
    s.timeout_sec = fixloop::yaml_get_or(node, "timeout_sec", 300);
    s.memory = fixloop::yaml_get_or<std::string>(node, "memory", "512m");
    s.cpu = fixloop::yaml_get_or(node, "cpu", 0.5);
    s.pids_limit = fixloop::yaml_get_or(node, "pids_limit", 256);
    s.slots = fixloop::yaml_get_or(node, "slots", 4);
    s.slot_acquire_timeout_sec =
        fixloop::yaml_get_or(node, "slot_acquire_timeout_sec", 600);
    s.workspace_root =
        fixloop::yaml_get_or<std::string>(node, "workspace_root", "/tmp/fixloop");
    s.network_isolation = fixloop::yaml_get_or(node, "network_isolation", true);
    s.docker_socket = fixloop::yaml_get_or<std::string>(
        node, "docker_socket", "/var/run/docker.sock");
    s.api_version =
        fixloop::yaml_get_or<std::string>(node, "api_version", "v1.43");
    s.images = fixloop::yaml_get_string_map(node, "images");
    return true;
  }
};

template <>
struct convert<fixloop::GenerationConfig> {
  static bool decode(const Node& node, fixloop::GenerationConfig& g) {
    if (!node.IsMap()) {
      return false;
    }
    g.base_url = fixloop::yaml_get_or<std::string>(node, "base_url",
                                                   "https://api.openai.com");
    g.path = fixloop::yaml_get_or<std::string>(node, "path",
                                               "/v1/chat/completions");
    g.model = fixloop::yaml_get_or<std::string>(node, "model", "gpt-4o");
    g.temperature = fixloop::yaml_get_or(node, "temperature", 0.1);
    g.api_key_env =
        fixloop::yaml_get_or<std::string>(node, "api_key_env", "FIXLOOP_API_KEY");
    g.timeout_sec = fixloop::yaml_get_or(node, "timeout_sec", 120);
    return true;
  }
};

template <>
struct convert<fixloop::SystemConfig> {
  static bool decode(const Node& node, fixloop::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto storage = node["storage"]) {
      c.storage = storage.as<fixloop::StorageConfig>();
    }
    if (auto worker = node["worker"]) {
      c.worker = worker.as<fixloop::WorkerConfig>();
    }
    if (auto orchestrator = node["orchestrator"]) {
      c.orchestrator = orchestrator.as<fixloop::OrchestratorConfig>();
    }
    if (auto sandbox = node["sandbox"]) {
      c.sandbox = sandbox.as<fixloop::SandboxConfig>();
    }
    if (auto generation = node["generation"]) {
      c.generation = generation.as<fixloop::GenerationConfig>();
    }
    return true;
  }
};

}  // namespace YAML

namespace fixloop {

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<SystemConfig> {
  SystemConfig config;
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    // An empty document means all defaults
    if (root.IsDefined() && !root.IsNull()) {
      config = root.as<SystemConfig>();
    }
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }

  if (config.worker.id.empty()) {
    config.worker.id = host_name();
  }
  if (auto valid = validate(config); !valid) {
    return std::unexpected(valid.error());
  }
  return ok(std::move(config));
}

auto ConfigLoader::validate(const SystemConfig& config) -> Result<void> {
  auto reject = [](std::string_view what) {
    log::error("Invalid configuration: {}", what);
    return fail(Error::InvalidArgument);
  };

  if (config.storage.retention_hours < 0) {
    return reject("storage.retention_hours must not be negative");
  }
  if (config.worker.id.find('/') != std::string::npos) {
    return reject("worker.id must not contain '/'");
  }
  if (config.worker.concurrency < 1) {
    return reject("worker.concurrency must be at least 1");
  }
  if (config.worker.poll_interval_ms < 1 ||
      config.worker.heartbeat_interval_ms < 1) {
    return reject("worker intervals must be positive");
  }
  if (config.worker.visibility_timeout_sec < 1) {
    return reject("worker.visibility_timeout_sec must be positive");
  }
  if (config.orchestrator.max_attempts < 1) {
    return reject("orchestrator.max_attempts must be at least 1");
  }
  if (config.orchestrator.review_retry_limit < 0 ||
      config.orchestrator.generation_max_retries < 0) {
    return reject("orchestrator retry limits must not be negative");
  }
  if (config.orchestrator.backoff_base_ms < 0 ||
      config.orchestrator.backoff_max_ms < config.orchestrator.backoff_base_ms) {
    return reject("orchestrator backoff range is invalid");
  }
  if (!parse_sandbox_runtime(config.sandbox.runtime)) {
    return reject(std::format("unknown sandbox.runtime '{}'",
                              config.sandbox.runtime));
  }
  if (config.sandbox.slots < 1) {
    return reject("sandbox.slots must be at least 1");
  }
  if (config.sandbox.timeout_sec < 1) {
    return reject("sandbox.timeout_sec must be positive");
  }
  if (config.sandbox.cpu <= 0.0) {
    return reject("sandbox.cpu must be positive");
  }
  if (!parse_memory_size(config.sandbox.memory)) {
    return reject(std::format("cannot parse sandbox.memory '{}'",
                              config.sandbox.memory));
  }
  if (config.sandbox.pids_limit < 1) {
    return reject("sandbox.pids_limit must be positive");
  }
  if (config.generation.timeout_sec < 1) {
    return reject("generation.timeout_sec must be positive");
  }
  return ok();
}

}  // namespace fixloop
