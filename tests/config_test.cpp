#include "fixloop/config/config_loader.hpp"
#include "fixloop/util/util.hpp"

#include "test_utils.hpp"

#include <fstream>

#include "gtest/gtest.h"

using namespace fixloop;
using namespace fixloop::test;

TEST(ConfigTest, Defaults) {
  SystemConfig config;

  EXPECT_EQ(config.storage.db_file, "fixloop.db");
  EXPECT_EQ(config.storage.retention_hours, 168);
  EXPECT_EQ(config.worker.concurrency, 4);
  EXPECT_EQ(config.orchestrator.max_attempts, 3);
  EXPECT_EQ(config.orchestrator.review_retry_limit, 2);
  EXPECT_EQ(config.sandbox.runtime, "docker");
  EXPECT_EQ(config.sandbox.memory, "512m");
  EXPECT_TRUE(config.sandbox.network_isolation);
  EXPECT_EQ(config.generation.api_key_env, "FIXLOOP_API_KEY");
}

TEST(ConfigTest, EmptyDocument_YieldsDefaults) {
  auto result = ConfigLoader::load_from_string("");

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->worker.concurrency, 4);
  EXPECT_EQ(result->sandbox.slots, 4);
  // The worker id falls back to the host name
  EXPECT_FALSE(result->worker.id.empty());
}

TEST(ConfigTest, LoadFromString_OverridesSections) {
  auto result = ConfigLoader::load_from_string(R"(
storage:
  db_file: /var/lib/fixloop/tasks.db
  retention_hours: 0
worker:
  id: worker-a
  concurrency: 8
  log_level: debug
orchestrator:
  max_attempts: 5
  review_retry_limit: 1
  backoff_base_ms: 100
  backoff_max_ms: 800
sandbox:
  runtime: process
  timeout_sec: 60
  memory: 1g
  cpu: 1.5
  slots: 2
  network_isolation: false
  images:
    python: python:3.12-slim
generation:
  model: local-model
  base_url: http://127.0.0.1:8080
)");

  ASSERT_TRUE(result.has_value());
  const auto& c = *result;
  EXPECT_EQ(c.storage.db_file, "/var/lib/fixloop/tasks.db");
  EXPECT_EQ(c.storage.retention_hours, 0);
  EXPECT_EQ(c.worker.id, "worker-a");
  EXPECT_EQ(c.worker.concurrency, 8);
  EXPECT_EQ(c.worker.log_level, "debug");
  EXPECT_EQ(c.worker.poll_interval_ms, 500);
  EXPECT_EQ(c.orchestrator.max_attempts, 5);
  EXPECT_EQ(c.orchestrator.review_retry_limit, 1);
  EXPECT_EQ(c.orchestrator.backoff_max_ms, 800);
  EXPECT_EQ(c.sandbox.runtime, "process");
  EXPECT_EQ(c.sandbox.timeout_sec, 60);
  EXPECT_DOUBLE_EQ(c.sandbox.cpu, 1.5);
  EXPECT_EQ(c.sandbox.slots, 2);
  EXPECT_FALSE(c.sandbox.network_isolation);
  ASSERT_EQ(c.sandbox.images.count("python"), 1u);
  EXPECT_EQ(c.sandbox.images.at("python"), "python:3.12-slim");
  EXPECT_EQ(c.generation.model, "local-model");
  EXPECT_EQ(c.generation.path, "/v1/chat/completions");
}

TEST(ConfigTest, MalformedYaml_IsParseError) {
  auto result = ConfigLoader::load_from_string("worker: [unclosed");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::ParseError);
}

TEST(ConfigTest, WrongShape_IsParseError) {
  auto result = ConfigLoader::load_from_string("worker: 3");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::ParseError);
}

TEST(ConfigTest, OutOfRangeValues_AreRejected) {
  for (const char* doc : {
           "storage: {retention_hours: -1}",
           "worker: {id: a/b}",
           "worker: {concurrency: 0}",
           "orchestrator: {max_attempts: 0}",
           "orchestrator: {review_retry_limit: -1}",
           "orchestrator: {backoff_base_ms: 500, backoff_max_ms: 100}",
           "sandbox: {runtime: vm}",
           "sandbox: {slots: 0}",
           "sandbox: {memory: lots}",
           "sandbox: {memory: 99999999999g}",
           "sandbox: {cpu: 0}",
           "generation: {timeout_sec: 0}",
       }) {
    auto result = ConfigLoader::load_from_string(doc);
    ASSERT_FALSE(result.has_value()) << doc;
    EXPECT_EQ(result.error(), Error::InvalidArgument) << doc;
  }
}

TEST(ConfigTest, LoadFromFile) {
  TempDir dir;
  auto path = dir.path() / "fixloop.yaml";
  {
    std::ofstream out(path);
    out << "worker:\n  id: from-file\n  concurrency: 2\n";
  }

  auto result = ConfigLoader::load_from_file(path.string());

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->worker.id, "from-file");
  EXPECT_EQ(result->worker.concurrency, 2);
}

TEST(ConfigTest, LoadFromMissingFile_IsFileNotFound) {
  auto result = ConfigLoader::load_from_file("/nonexistent/fixloop.yaml");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::FileNotFound);
}

TEST(ConfigTest, ParseMemorySize) {
  EXPECT_EQ(parse_memory_size("512m"), 512ULL * 1024 * 1024);
  EXPECT_EQ(parse_memory_size("2G"), 2ULL * 1024 * 1024 * 1024);
  EXPECT_EQ(parse_memory_size("64k"), 64ULL * 1024);
  EXPECT_EQ(parse_memory_size("1000"), 1000ULL);
  EXPECT_FALSE(parse_memory_size("").has_value());
  EXPECT_FALSE(parse_memory_size("m").has_value());
  EXPECT_FALSE(parse_memory_size("0m").has_value());
  EXPECT_FALSE(parse_memory_size("12x").has_value());
}

TEST(ConfigTest, ParseMemorySize_RejectsOverflow) {
  EXPECT_FALSE(parse_memory_size("99999999999g").has_value());
  EXPECT_FALSE(parse_memory_size("18446744073709551616").has_value());
  EXPECT_EQ(parse_memory_size("17179869183g"),
            17179869183ULL * 1024 * 1024 * 1024);
}
