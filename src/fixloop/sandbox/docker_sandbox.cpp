#include "fixloop/sandbox/docker_sandbox.hpp"

#include "fixloop/client/docker/docker_client.hpp"
#include "fixloop/sandbox/workspace.hpp"
#include "fixloop/util/log.hpp"

#include <atomic>
#include <experimental/scope>
#include <format>

#include <unistd.h>

namespace fixloop {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kContainerWorkspace = "/workspace";

auto remove_quietly(docker::DockerClient& client, std::string_view container)
    -> void {
  if (auto r = client.remove_container(container, true); !r) {
    log::warn("DockerSandbox: failed to remove {}: {}", container,
              docker::to_string_view(r.error()));
  }
}

}  // namespace

struct DockerSandbox::Impl {
  DockerSandboxOptions options;
  docker::DockerClient client;

  explicit Impl(DockerSandboxOptions opts)
      : options(std::move(opts)),
        client(options.socket_path,
               docker::DockerClientConfig{.api_version = options.api_version}) {
  }

  [[nodiscard]] auto owner_root() const -> fs::path {
    return fs::absolute(options.workspace_root) / options.owner;
  }

  auto ensure_image(const std::string& image) -> Result<void> {
    auto exists = client.image_exists(image);
    if (!exists) {
      log::error("DockerSandbox: cannot inspect image {}: {}", image,
                 docker::to_string_view(exists.error()));
      return fail(Error::SandboxInfrastructure);
    }
    if (*exists) {
      return ok();
    }
    if (auto r = client.pull_image(image); !r) {
      log::error("DockerSandbox: cannot pull {}: {}", image,
                 docker::to_string_view(r.error()));
      return fail(Error::SandboxInfrastructure);
    }
    return ok();
  }
};

DockerSandbox::DockerSandbox(DockerSandboxOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {
}

DockerSandbox::~DockerSandbox() = default;

auto DockerSandbox::image_for(std::string_view language) const
    -> std::optional<std::string> {
  if (auto it = impl_->options.images.find(std::string(language));
      it != impl_->options.images.end()) {
    return it->second;
  }
  if (const auto* spec = find_language(language)) {
    return std::string(spec->image);
  }
  return std::nullopt;
}

auto DockerSandbox::check() -> Result<void> {
  if (auto r = impl_->client.ping(); !r) {
    log::error("DockerSandbox: daemon at {} unreachable: {}",
               impl_->options.socket_path, docker::to_string_view(r.error()));
    return fail(Error::SandboxInfrastructure);
  }
  return ok();
}

auto DockerSandbox::execute(const ExecutionRequest& request,
                            const ResourceLimits& limits,
                            CancellationToken token)
    -> Result<ExecutionResult> {
  auto& client = impl_->client;
  const auto& name = request.name.str();
  auto root = impl_->owner_root() / name;
  auto work = root / "work";

  auto image = image_for(request.language);
  if (!image) {
    log::error("DockerSandbox: no image for language '{}'", request.language);
    return fail(Error::InvalidArgument);
  }

  // A rerun after a crash reuses the name; clear whatever is left.
  remove_quietly(client, name);
  remove_workspace(root);
  std::experimental::scope_exit teardown{[&] {
    remove_quietly(client, name);
    remove_workspace(root);
  }};

  if (token.is_cancelled()) {
    return fail(Error::Cancelled);
  }
  if (auto r = impl_->ensure_image(*image); !r) {
    return std::unexpected(r.error());
  }

  auto command = prepare_workspace(request, work, token);
  if (!command) {
    return std::unexpected(command.error());
  }

  docker::ContainerConfig config{
      .image = *image,
      .command = *command,
      .working_dir = std::string(kContainerWorkspace),
      .user = std::format("{}:{}", getuid(), getgid()),
      .env = {{"PYTHONDONTWRITEBYTECODE", "1"},
              {"PYTHONUNBUFFERED", "1"},
              {"HOME", "/tmp"}},
      .labels = {{std::string(kOwnerLabel), impl_->options.owner},
                 {std::string(kTaskLabel), request.task_id.str()}},
      .binds = {std::format("{}:{}", work.string(), kContainerWorkspace)},
      .network_mode = "none",
      .memory_bytes = static_cast<std::int64_t>(limits.memory_bytes),
      .nano_cpus = static_cast<std::int64_t>(limits.cpu * 1e9),
      .pids_limit = limits.pids_limit,
  };

  auto created = client.create_container(config, name);
  if (!created) {
    log::error("DockerSandbox: failed to create {}: {}", name,
               docker::to_string_view(created.error()));
    return fail(Error::SandboxInfrastructure);
  }
  log::info("DockerSandbox: created container {} ({}) for task {}", name,
            created->id.substr(0, 12), request.task_id);

  auto start = std::chrono::steady_clock::now();
  if (auto r = client.start_container(name); !r) {
    log::error("DockerSandbox: failed to start {}: {}", name,
               docker::to_string_view(r.error()));
    return fail(Error::SandboxInfrastructure);
  }

  // The kill goes over its own connection; the blocked wait below then
  // returns with the container's exit status.
  std::atomic<bool> cancelled{false};
  auto registration = token.on_cancel([&client, &cancelled, name] {
    cancelled.store(true);
    log::info("DockerSandbox: cancelling {}", name);
    if (auto r = client.kill_container(name); !r) {
      log::warn("DockerSandbox: kill of {} failed: {}", name,
                docker::to_string_view(r.error()));
    }
  });

  ExecutionResult result;
  auto waited = client.wait_container(
      name, std::chrono::duration_cast<std::chrono::milliseconds>(
                limits.timeout));
  if (!waited && waited.error() == docker::DockerError::Timeout) {
    result.timed_out = true;
    log::warn("DockerSandbox: {} exceeded {}s, killing", name,
              limits.timeout.count());
    if (auto r = client.kill_container(name); !r) {
      log::warn("DockerSandbox: kill of {} failed: {}", name,
                docker::to_string_view(r.error()));
    }
  } else if (!waited) {
    registration.reset();
    if (cancelled.load()) {
      result.cancelled = true;
      return result;
    }
    log::error("DockerSandbox: wait on {} failed: {}", name,
               docker::to_string_view(waited.error()));
    return fail(Error::SandboxInfrastructure);
  }
  registration.reset();
  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  result.cancelled = cancelled.load();

  if (waited) {
    result.exit_code = waited->status_code;
  }
  if (auto state = client.inspect_container(name)) {
    if (!waited) {
      result.exit_code = state->exit_code;
    }
    result.resource_exceeded = state->oom_killed;
  }

  if (auto logs = client.get_logs(name)) {
    result.stdout_output = std::move(logs->stdout_output);
    result.stderr_output = std::move(logs->stderr_output);
  } else {
    log::warn("DockerSandbox: no logs for {}: {}", name,
              docker::to_string_view(logs.error()));
  }

  log::info("DockerSandbox: {} finished exit_code={} timed_out={} "
            "duration={}ms",
            name, result.exit_code, result.timed_out,
            result.duration.count());
  return result;
}

auto DockerSandbox::sweep_orphans(const OwnerLock& lock)
    -> Result<std::size_t> {
  if (!lock.covers(impl_->options.workspace_root, impl_->options.owner)) {
    log::error("DockerSandbox: refusing to sweep owner {} with lock for {}",
               impl_->options.owner, lock.owner());
    return fail(Error::InvalidArgument);
  }
  auto containers = impl_->client.list_containers(
      {{std::string(kOwnerLabel), impl_->options.owner}});
  if (!containers) {
    log::error("DockerSandbox: cannot list containers: {}",
               docker::to_string_view(containers.error()));
    return fail(Error::SandboxInfrastructure);
  }

  std::size_t swept = 0;
  for (const auto& c : *containers) {
    log::info("DockerSandbox: sweeping orphaned container {} (task {})",
              c.name.empty() ? c.id : c.name,
              c.labels.contains(std::string(kTaskLabel))
                  ? c.labels.at(std::string(kTaskLabel))
                  : "?");
    remove_quietly(impl_->client, c.id);
    ++swept;
  }

  std::error_code ec;
  auto base = impl_->owner_root();
  if (fs::exists(base, ec)) {
    for (const auto& entry : fs::directory_iterator(base, ec)) {
      if (entry.path().filename().string().starts_with(kSandboxPrefix)) {
        remove_workspace(entry.path());
      }
    }
  }
  return swept;
}

}  // namespace fixloop
