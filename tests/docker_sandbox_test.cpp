#include "fixloop/sandbox/docker_sandbox.hpp"

#include "test_utils.hpp"

#include <fstream>

#include <nlohmann/json.hpp>

#include "gtest/gtest.h"

using namespace fixloop;
using namespace fixloop::test;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

auto frame(std::uint8_t stream, std::string_view payload) -> std::string {
  std::string out(8, '\0');
  out[0] = static_cast<char>(stream);
  auto size = static_cast<std::uint32_t>(payload.size());
  out[7] = static_cast<char>(size & 0xff);
  out[6] = static_cast<char>((size >> 8) & 0xff);
  out.append(payload);
  return out;
}

// Answers the subset of the Engine API a sandbox run needs.
auto fake_daemon(int exit_code, bool oom = false) -> StubHttpServer::Handler {
  return [exit_code, oom](const StubRequest& req) -> StubResponse {
    const auto& p = req.path;
    if (p == "/_ping") {
      return {.status = 200, .body = "OK", .content_type = "text/plain"};
    }
    if (req.method == "DELETE") {
      return {.status = 204, .body = ""};
    }
    if (p.starts_with("/v1.43/images/")) {
      return {.status = 200, .body = "{}"};
    }
    if (p.starts_with("/v1.43/containers/create")) {
      return {.status = 201, .body = R"({"Id":"0123456789abcdef"})"};
    }
    if (p.ends_with("/start")) {
      return {.status = 204, .body = ""};
    }
    if (p.ends_with("/wait")) {
      return {.status = 200,
              .body = std::format(R"({{"StatusCode":{}}})", exit_code)};
    }
    if (p.find("/logs?") != std::string::npos) {
      return {.status = 200,
              .body = frame(1, "collected 1 item\n") + frame(2, "warn\n"),
              .content_type = "application/vnd.docker.raw-stream"};
    }
    if (p.starts_with("/v1.43/containers/json")) {
      return {.status = 200,
              .body = R"([{"Id":"c1","Names":["/fixloop-old-a0-r0"],)"
                      R"("Labels":{"fixloop.owner":"w1","fixloop.task":"old"}}])"};
    }
    if (p.ends_with("/json")) {
      return {.status = 200,
              .body = std::format(
                  R"({{"State":{{"Running":false,"OOMKilled":{},"ExitCode":{}}}}})",
                  oom ? "true" : "false", exit_code)};
    }
    return {.status = 500, .body = "{}"};
  };
}

}  // namespace

class DockerSandboxTest : public ::testing::Test {
protected:
  void SetUp() override {
    std::ofstream(repo_.path() / "main.py") << "print(1 / 0)\n";
  }

  auto options() const -> DockerSandboxOptions {
    return DockerSandboxOptions{
        .socket_path = (dir_.path() / "docker.sock").string(),
        .api_version = "v1.43",
        .workspace_root = dir_.path() / "ws",
        .owner = "w1",
        .images = {},
    };
  }

  auto request() const -> ExecutionRequest {
    ExecutionRequest r;
    r.name = SandboxName{"fixloop-t-a0-r0"};
    r.task_id = task_id("t");
    r.repo = RepoRef{.url = repo_.path().string(), .branch = "main"};
    r.patch = Patch{.filename = "main.py", .code = "print(1)\n",
                    .explanation = ""};
    r.test_command = "python -m pytest";
    return r;
  }

  TempDir dir_;
  TempDir repo_;
};

TEST_F(DockerSandboxTest, Check_UnreachableDaemon_IsInfrastructureError) {
  DockerSandbox sandbox(options());

  auto r = sandbox.check();

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::SandboxInfrastructure);
}

TEST_F(DockerSandboxTest, ImageFor_PrefersConfiguredOverride) {
  auto opts = options();
  opts.images["python"] = "registry.local/python:3.12";
  DockerSandbox sandbox(opts);

  EXPECT_EQ(sandbox.image_for("python"), "registry.local/python:3.12");
  EXPECT_EQ(sandbox.image_for("ruby"), "ruby:3.1-slim");
  EXPECT_FALSE(sandbox.image_for("cobol").has_value());
}

TEST_F(DockerSandboxTest, Execute_RunsIsolatedContainerAndCleansUp) {
  StubHttpServer daemon(fake_daemon(0), options().socket_path);
  DockerSandbox sandbox(options());
  ASSERT_TRUE(sandbox.check().has_value());

  ResourceLimits limits;
  limits.memory_bytes = 256ULL * 1024 * 1024;
  limits.cpu = 0.5;
  limits.pids_limit = 64;
  auto r = sandbox.execute(request(), limits, CancellationToken::none());

  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(r->success());
  EXPECT_EQ(r->stdout_output, "collected 1 item\n");
  EXPECT_EQ(r->stderr_output, "warn\n");
  EXPECT_FALSE(fs::exists(options().workspace_root / "w1" / "fixloop-t-a0-r0"));

  nlohmann::json create;
  bool removed_after_run = false;
  for (const auto& req : daemon.requests()) {
    if (req.path.starts_with("/v1.43/containers/create")) {
      create = nlohmann::json::parse(req.body);
      removed_after_run = false;
    }
    if (req.method == "DELETE" && !create.is_null()) {
      removed_after_run = true;
    }
  }
  ASSERT_FALSE(create.is_null());
  EXPECT_EQ(create["Image"], "python:3.9-slim");
  EXPECT_EQ(create["HostConfig"]["NetworkMode"], "none");
  EXPECT_EQ(create["HostConfig"]["Memory"], 256LL * 1024 * 1024);
  EXPECT_EQ(create["HostConfig"]["PidsLimit"], 64);
  EXPECT_EQ(create["Labels"]["fixloop.owner"], "w1");
  EXPECT_EQ(create["Labels"]["fixloop.task"], "t");
  EXPECT_TRUE(removed_after_run);
}

TEST_F(DockerSandboxTest, Execute_OomKill_IsResourceExceeded) {
  StubHttpServer daemon(fake_daemon(137, true), options().socket_path);
  DockerSandbox sandbox(options());

  auto r = sandbox.execute(request(), ResourceLimits{}, CancellationToken::none());

  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->exit_code, 137);
  EXPECT_TRUE(r->resource_exceeded);
  EXPECT_FALSE(r->success());
}

TEST_F(DockerSandboxTest, SweepOrphans_RemovesOwnedContainers) {
  StubHttpServer daemon(fake_daemon(0), options().socket_path);
  DockerSandbox sandbox(options());
  fs::create_directories(options().workspace_root / "w1" / "fixloop-old-a0-r0");

  auto lock = OwnerLock::acquire(options().workspace_root, "w1");
  ASSERT_TRUE(lock.has_value());

  auto swept = sandbox.sweep_orphans(*lock);

  ASSERT_TRUE(swept.has_value());
  EXPECT_EQ(*swept, 1u);
  EXPECT_FALSE(fs::exists(options().workspace_root / "w1" / "fixloop-old-a0-r0"));
  bool deleted = false;
  for (const auto& req : daemon.requests()) {
    deleted |= req.method == "DELETE" && req.path.starts_with("/v1.43/containers/c1");
  }
  EXPECT_TRUE(deleted);
}
