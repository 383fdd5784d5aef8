#include "fixloop/client/docker/docker_client.hpp"

#include "test_utils.hpp"

#include <nlohmann/json.hpp>

#include "gtest/gtest.h"

using namespace fixloop;
using namespace fixloop::docker;
using namespace fixloop::test;
using namespace std::chrono_literals;

namespace {

auto frame(std::uint8_t stream, std::string_view payload) -> std::string {
  std::string out(8, '\0');
  out[0] = static_cast<char>(stream);
  auto size = static_cast<std::uint32_t>(payload.size());
  out[4] = static_cast<char>((size >> 24) & 0xff);
  out[5] = static_cast<char>((size >> 16) & 0xff);
  out[6] = static_cast<char>((size >> 8) & 0xff);
  out[7] = static_cast<char>(size & 0xff);
  out.append(payload);
  return out;
}

}  // namespace

TEST(DockerLogStreamTest, DemultiplexesStdoutAndStderr) {
  auto raw = frame(1, "hello ") + frame(2, "oops\n") + frame(1, "world\n");

  auto logs = parse_log_stream(raw);

  EXPECT_EQ(logs.stdout_output, "hello world\n");
  EXPECT_EQ(logs.stderr_output, "oops\n");
}

TEST(DockerLogStreamTest, TruncatedFrame_IsDropped) {
  auto raw = frame(1, "complete");
  raw += frame(2, "cut off").substr(0, 10);

  auto logs = parse_log_stream(raw);

  EXPECT_EQ(logs.stdout_output, "complete");
  EXPECT_TRUE(logs.stderr_output.empty());
}

TEST(DockerUrlEncodeTest, EscapesReservedCharacters) {
  EXPECT_EQ(url_encode("python:3.9-slim"), "python%3A3.9-slim");
  EXPECT_EQ(url_encode(R"({"label":["a=b"]})"),
            "%7B%22label%22%3A%5B%22a%3Db%22%5D%7D");
  EXPECT_EQ(url_encode("plain_name.~"), "plain_name.~");
}

TEST(DockerClientTest, ConnectFailsForNonExistentSocket) {
  DockerClient client("/tmp/fixloop_nonexistent_docker_socket_12345.sock");

  auto r = client.ping();

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), DockerError::ConnectionFailed);
}

TEST(DockerClientTest, InvalidContainerReference_IsRejectedLocally) {
  DockerClient client("/tmp/fixloop_nonexistent_docker_socket_12345.sock");

  EXPECT_EQ(client.start_container("../../etc").error(),
            DockerError::InvalidInput);
  EXPECT_EQ(client.remove_container("").error(), DockerError::InvalidInput);
}

class DockerApiTest : public ::testing::Test {
protected:
  auto socket_path() const -> std::string {
    return (dir_.path() / "docker.sock").string();
  }

  TempDir dir_;
};

TEST_F(DockerApiTest, CreateContainer_SendsLimitsAndLabels) {
  StubHttpServer server(
      [](const StubRequest&) {
        return StubResponse{.status = 201,
                            .body = R"({"Id":"abc123","Warnings":["w"]})"};
      },
      socket_path());
  DockerClient client(socket_path());

  ContainerConfig config;
  config.image = "python:3.9-slim";
  config.command = "python main.py";
  config.working_dir = "/workspace";
  config.labels["fixloop.owner"] = "worker-1";
  config.binds.push_back("/tmp/src:/workspace:rw");
  config.network_mode = "none";
  config.memory_bytes = 512LL * 1024 * 1024;
  config.nano_cpus = 500'000'000;
  config.pids_limit = 256;

  auto r = client.create_container(config, "fixloop-t-a0-r0");

  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->id, "abc123");
  ASSERT_EQ(r->warnings.size(), 1u);

  auto requests = server.requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].path, "/v1.43/containers/create?name=fixloop-t-a0-r0");
  auto body = nlohmann::json::parse(requests[0].body);
  EXPECT_EQ(body["Cmd"], nlohmann::json::array({"sh", "-c", "python main.py"}));
  EXPECT_EQ(body["Labels"]["fixloop.owner"], "worker-1");
  EXPECT_TRUE(body["NetworkDisabled"].get<bool>());
  EXPECT_EQ(body["HostConfig"]["NetworkMode"], "none");
  EXPECT_EQ(body["HostConfig"]["Memory"], 512LL * 1024 * 1024);
  EXPECT_EQ(body["HostConfig"]["MemorySwap"], 512LL * 1024 * 1024);
  EXPECT_EQ(body["HostConfig"]["NanoCpus"], 500'000'000);
  EXPECT_EQ(body["HostConfig"]["PidsLimit"], 256);
}

TEST_F(DockerApiTest, CreateContainer_NameConflict) {
  StubHttpServer server(
      [](const StubRequest&) { return StubResponse{.status = 409, .body = "{}"}; },
      socket_path());
  DockerClient client(socket_path());
  ContainerConfig config;
  config.image = "python:3.9-slim";

  auto r = client.create_container(config, "fixloop-t-a0-r0");

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), DockerError::Conflict);
}

TEST_F(DockerApiTest, WaitContainer_ReturnsStatusCode) {
  StubHttpServer server(
      [](const StubRequest&) {
        return StubResponse{.status = 200,
                            .body = R"({"StatusCode":3,"Error":null})"};
      },
      socket_path());
  DockerClient client(socket_path());

  auto r = client.wait_container("abc123", 5s);

  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->status_code, 3);
  EXPECT_TRUE(r->error.empty());
}

TEST_F(DockerApiTest, RemoveContainer_MissingCountsAsRemoved) {
  StubHttpServer server(
      [](const StubRequest&) { return StubResponse{.status = 404, .body = "{}"}; },
      socket_path());
  DockerClient client(socket_path());

  EXPECT_TRUE(client.remove_container("gone", true).has_value());
  auto requests = server.requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].method, "DELETE");
  EXPECT_EQ(requests[0].path, "/v1.43/containers/gone?force=true&v=true");
}

TEST_F(DockerApiTest, ListContainers_FiltersByLabelAndStripsSlash) {
  StubHttpServer server(
      [](const StubRequest&) {
        return StubResponse{
            .status = 200,
            .body = R"([{"Id":"c1","Names":["/fixloop-a-a0-r0"],)"
                    R"("Labels":{"fixloop.owner":"w1"}}])"};
      },
      socket_path());
  DockerClient client(socket_path());

  auto r = client.list_containers({{"fixloop.owner", "w1"}});

  ASSERT_TRUE(r.has_value());
  ASSERT_EQ(r->size(), 1u);
  EXPECT_EQ((*r)[0].id, "c1");
  EXPECT_EQ((*r)[0].name, "fixloop-a-a0-r0");
  EXPECT_EQ((*r)[0].labels.at("fixloop.owner"), "w1");
  auto path = server.requests()[0].path;
  EXPECT_TRUE(path.starts_with("/v1.43/containers/json?all=true&filters="));
  EXPECT_NE(path.find(url_encode("fixloop.owner=w1")), std::string::npos);
}

TEST_F(DockerApiTest, InspectContainer_ReportsOomKill) {
  StubHttpServer server(
      [](const StubRequest&) {
        return StubResponse{
            .status = 200,
            .body = R"({"State":{"Running":false,"OOMKilled":true,"ExitCode":137}})"};
      },
      socket_path());
  DockerClient client(socket_path());

  auto r = client.inspect_container("abc123");

  ASSERT_TRUE(r.has_value());
  EXPECT_FALSE(r->running);
  EXPECT_TRUE(r->oom_killed);
  EXPECT_EQ(r->exit_code, 137);
}
