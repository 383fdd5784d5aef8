#pragma once

#include "fixloop/core/cancellation.hpp"
#include "fixloop/core/error.hpp"
#include "fixloop/model/task.hpp"
#include "fixloop/sandbox/owner_lock.hpp"
#include "fixloop/util/id.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace fixloop {

struct ResourceLimits {
  std::chrono::seconds timeout{300};
  std::uint64_t memory_bytes{512ULL * 1024 * 1024};
  // Fraction of one CPU
  double cpu{0.5};
  int pids_limit{256};
};

struct ExecutionRequest {
  SandboxName name;
  TaskId task_id;
  RepoRef repo;
  Patch patch;
  // Empty means the per-language run command
  std::string test_command;
  std::string language{"python"};
};

struct ExecutionResult {
  int exit_code{-1};
  std::string stdout_output;
  std::string stderr_output;
  std::chrono::milliseconds duration{0};
  bool timed_out{false};
  bool resource_exceeded{false};
  // Set when the run was force-terminated by a cancellation request
  bool cancelled{false};

  [[nodiscard]] auto success() const noexcept -> bool {
    return exit_code == 0 && !timed_out && !resource_exceeded && !cancelled;
  }
};

// One isolated execution environment per execute() call. Implementations
// guarantee teardown on every return path; environments orphaned by a
// crashed process are removed by sweep_orphans().
class ISandbox {
public:
  virtual ~ISandbox() = default;

  // Checks that the runtime is reachable before any work is claimed.
  [[nodiscard]] virtual auto check() -> Result<void> = 0;

  // Test failures, timeouts and resource overruns come back as a result;
  // only an unusable runtime is an error (SandboxInfrastructure).
  // A patch that cannot be applied is PatchRejected.
  [[nodiscard]] virtual auto execute(const ExecutionRequest& request,
                                     const ResourceLimits& limits,
                                     CancellationToken token)
      -> Result<ExecutionResult> = 0;

  // Removes environments left behind by this owner. Returns how many.
  // The caller must hold the owner's lock, so no live process can still be
  // using what gets removed; a lock for another owner is InvalidArgument.
  [[nodiscard]] virtual auto sweep_orphans(const OwnerLock& lock)
      -> Result<std::size_t> = 0;
};

struct LanguageSpec {
  std::string_view language;
  std::string_view image;
  std::string_view code_file;
  std::string_view run_command;
};

inline constexpr std::array<LanguageSpec, 8> kLanguages = {{
    {"python", "python:3.9-slim", "main.py", "python {filename}"},
    {"javascript", "node:18-slim", "main.js", "node {filename}"},
    {"typescript", "node:18-slim", "main.ts", "npx ts-node {filename}"},
    {"java", "openjdk:11-slim", "Main.java", "javac {filename} && java Main"},
    {"go", "golang:1.21-alpine", "main.go", "go run {filename}"},
    {"rust", "rust:slim", "main.rs", "rustc {filename} && ./main"},
    {"ruby", "ruby:3.1-slim", "main.rb", "ruby {filename}"},
    {"php", "php:8.1-cli", "main.php", "php {filename}"},
}};

[[nodiscard]] constexpr auto find_language(std::string_view language) noexcept
    -> const LanguageSpec* {
  for (const auto& spec : kLanguages) {
    if (spec.language == language) {
      return &spec;
    }
  }
  return nullptr;
}

[[nodiscard]] constexpr auto is_supported_language(
    std::string_view language) noexcept -> bool {
  return find_language(language) != nullptr;
}

// Expands the per-language run command for `filename`, e.g.
// "python {filename}" -> "python main.py".
[[nodiscard]] auto default_run_command(std::string_view language,
                                       std::string_view filename)
    -> std::optional<std::string>;

}  // namespace fixloop
