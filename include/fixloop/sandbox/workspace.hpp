#pragma once

#include "fixloop/core/cancellation.hpp"
#include "fixloop/core/error.hpp"
#include "fixloop/sandbox/sandbox.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fixloop {

// Relative, non-empty, and free of ".." components.
[[nodiscard]] auto is_safe_relative_path(std::string_view path) -> bool;

// True for git-style or plain unified diffs.
[[nodiscard]] auto is_unified_diff(std::string_view code) -> bool;

// Local directory for a bare path or file:// URL; nullopt for remotes.
[[nodiscard]] auto local_repository_path(std::string_view url)
    -> std::optional<std::filesystem::path>;

// Runs argv (no shell) in `cwd`, discarding output. Returns the exit code,
// or Timeout / Cancelled after killing the process group.
[[nodiscard]] auto run_helper(const std::vector<std::string>& argv,
                              const std::filesystem::path& cwd,
                              std::chrono::seconds timeout,
                              const CancellationToken& token) -> Result<int>;

// Builds a clean checkout of request.repo in `dir` (which must not exist
// yet) and applies the patch. Returns the command to run in it.
//
// Errors: PatchRejected for a patch that cannot be applied, Cancelled,
// SandboxInfrastructure for everything else.
[[nodiscard]] auto prepare_workspace(const ExecutionRequest& request,
                                     const std::filesystem::path& dir,
                                     const CancellationToken& token)
    -> Result<std::string>;

// Best effort; logs instead of failing.
auto remove_workspace(const std::filesystem::path& dir) -> void;

}  // namespace fixloop
