#include "fixloop/sandbox/workspace.hpp"

#include "fixloop/core/constants.hpp"
#include "fixloop/util/log.hpp"

#include <sys/wait.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

namespace fixloop {

namespace fs = std::filesystem;

namespace {

constexpr auto kCloneTimeout = std::chrono::seconds(300);
constexpr auto kApplyTimeout = std::chrono::seconds(60);
constexpr std::string_view kDiffFile = ".fixloop.patch";

auto write_file(const fs::path& path, std::string_view content) -> bool {
  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);
  if (ec) {
    log::error("Cannot create {}: {}", path.parent_path().string(),
               ec.message());
    return false;
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    log::error("Cannot open {} for writing", path.string());
    return false;
  }
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  return static_cast<bool>(out);
}

// A checked-out repository may carry symlinks; `name` must still land
// inside `dir` once they are resolved.
auto resolves_inside(const fs::path& dir, std::string_view name) -> bool {
  std::error_code ec;
  auto base = fs::canonical(dir, ec);
  if (ec) {
    return false;
  }
  auto target = fs::weakly_canonical(dir / name, ec);
  if (ec) {
    return false;
  }
  auto [b, t] =
      std::mismatch(base.begin(), base.end(), target.begin(), target.end());
  return b == base.end() && t != target.end();
}

auto copy_tree(const fs::path& from, const fs::path& to) -> Result<void> {
  std::error_code ec;
  if (!fs::is_directory(from, ec)) {
    log::error("Repository path {} is not a directory", from.string());
    return fail(Error::SandboxInfrastructure);
  }
  fs::create_directories(to, ec);
  if (ec) {
    return fail(Error::SandboxInfrastructure);
  }

  fs::recursive_directory_iterator it(from, ec);
  if (ec) {
    return fail(Error::SandboxInfrastructure);
  }
  for (auto end = fs::recursive_directory_iterator{}; it != end;
       it.increment(ec)) {
    if (ec) {
      log::error("Failed to walk {}: {}", from.string(), ec.message());
      return fail(Error::SandboxInfrastructure);
    }
    const auto& entry = *it;
    if (entry.path().filename() == ".git") {
      if (entry.is_directory()) {
        it.disable_recursion_pending();
      }
      continue;
    }
    auto target = to / fs::relative(entry.path(), from);
    if (entry.is_symlink()) {
      fs::copy_symlink(entry.path(), target, ec);
    } else if (entry.is_directory()) {
      fs::create_directories(target, ec);
    } else if (entry.is_regular_file()) {
      fs::copy_file(entry.path(), target, fs::copy_options::overwrite_existing,
                    ec);
    }
    if (ec) {
      log::error("Failed to copy {}: {}", entry.path().string(), ec.message());
      return fail(Error::SandboxInfrastructure);
    }
  }
  return ok();
}

auto checkout(const RepoRef& repo, const fs::path& dir,
              const CancellationToken& token) -> Result<void> {
  if (auto local = local_repository_path(repo.url)) {
    return copy_tree(*local, dir);
  }

  auto code = run_helper({"git", "clone", "--quiet", "--depth", "1",
                          "--branch", repo.branch, "--", repo.url,
                          dir.string()},
                         dir.parent_path(), kCloneTimeout, token);
  if (!code) {
    return std::unexpected(code.error());
  }
  if (*code != 0) {
    log::error("git clone of {}@{} exited with {}", repo.url, repo.branch,
               *code);
    return fail(Error::SandboxInfrastructure);
  }
  // A fresh environment must not carry repository metadata either.
  std::error_code ec;
  fs::remove_all(dir / ".git", ec);
  return ok();
}

auto apply_patch(const Patch& patch, const fs::path& dir,
                 const CancellationToken& token) -> Result<void> {
  if (is_unified_diff(patch.code)) {
    auto diff_path = dir / kDiffFile;
    if (!write_file(diff_path, patch.code)) {
      return fail(Error::SandboxInfrastructure);
    }
    auto code = run_helper({"git", "apply", "--whitespace=nowarn",
                            std::string{kDiffFile}},
                           dir, kApplyTimeout, token);
    std::error_code ec;
    fs::remove(diff_path, ec);
    if (!code) {
      return std::unexpected(code.error());
    }
    if (*code != 0) {
      log::warn("git apply rejected the patch (exit {})", *code);
      return fail(Error::PatchRejected);
    }
  } else {
    if (!is_safe_relative_path(patch.filename) ||
        !resolves_inside(dir, patch.filename)) {
      log::warn("Rejecting patch with unsafe filename '{}'", patch.filename);
      return fail(Error::PatchRejected);
    }
    if (!write_file(dir / patch.filename, patch.code)) {
      return fail(Error::SandboxInfrastructure);
    }
  }

  for (const auto& [name, content] : patch.dependencies) {
    if (!is_safe_relative_path(name) || !resolves_inside(dir, name)) {
      log::warn("Rejecting dependency file with unsafe name '{}'", name);
      return fail(Error::PatchRejected);
    }
    if (!write_file(dir / name, content)) {
      return fail(Error::SandboxInfrastructure);
    }
  }
  return ok();
}

}  // namespace

auto default_run_command(std::string_view language, std::string_view filename)
    -> std::optional<std::string> {
  const auto* spec = find_language(language);
  if (!spec) {
    return std::nullopt;
  }
  std::string command{spec->run_command};
  constexpr std::string_view placeholder = "{filename}";
  if (auto pos = command.find(placeholder); pos != std::string::npos) {
    command.replace(pos, placeholder.size(), filename);
  }
  return command;
}

auto is_safe_relative_path(std::string_view path) -> bool {
  if (path.empty() || path.front() == '/' || path.find('\0') != path.npos) {
    return false;
  }
  for (const auto& part : fs::path(path)) {
    if (part == "..") {
      return false;
    }
  }
  return true;
}

auto is_unified_diff(std::string_view code) -> bool {
  if (code.starts_with("diff --git ")) {
    return true;
  }
  return code.starts_with("--- ") && code.find("\n+++ ") != code.npos &&
         code.find("\n@@ ") != code.npos;
}

auto local_repository_path(std::string_view url)
    -> std::optional<fs::path> {
  constexpr std::string_view file_scheme = "file://";
  if (url.starts_with(file_scheme)) {
    return fs::path(url.substr(file_scheme.size()));
  }
  if (url.starts_with('/')) {
    return fs::path(url);
  }
  return std::nullopt;
}

auto run_helper(const std::vector<std::string>& argv, const fs::path& cwd,
                std::chrono::seconds timeout, const CancellationToken& token)
    -> Result<int> {
  if (argv.empty()) {
    return fail(Error::InvalidArgument);
  }

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& a : argv) {
    args.push_back(const_cast<char*>(a.c_str()));
  }
  args.push_back(nullptr);
  auto dir = cwd.string();

  pid_t pid = fork();
  if (pid < 0) {
    log::error("fork failed: {}", strerror(errno));
    return fail(Error::SandboxInfrastructure);
  }
  if (pid == 0) {
    setpgid(0, 0);
    int devnull = open("/dev/null", O_RDWR);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      dup2(devnull, STDOUT_FILENO);
      dup2(devnull, STDERR_FILENO);
      close(devnull);
    }
    if (chdir(dir.c_str()) < 0) {
      _exit(127);
    }
    execvp(args[0], args.data());
    _exit(127);
  }
  setpgid(pid, pid);

  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    int status = 0;
    pid_t r = waitpid(pid, &status, WNOHANG);
    if (r == pid) {
      if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
      }
      return 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
    }
    if (r < 0 && errno != EINTR) {
      log::error("waitpid failed for {}: {}", argv[0], strerror(errno));
      return fail(Error::SandboxInfrastructure);
    }

    bool cancelled = token.is_cancelled();
    if (cancelled || std::chrono::steady_clock::now() >= deadline) {
      kill(-pid, SIGKILL);
      waitpid(pid, &status, 0);
      log::warn("{} {}", argv[0], cancelled ? "cancelled" : "timed out");
      return fail(cancelled ? Error::Cancelled : Error::Timeout);
    }
    std::this_thread::sleep_for(timing::kSandboxPollInterval);
  }
}

auto prepare_workspace(const ExecutionRequest& request, const fs::path& dir,
                       const CancellationToken& token) -> Result<std::string> {
  std::string command = request.test_command;
  if (command.empty()) {
    auto fallback = default_run_command(request.language,
                                        request.patch.filename);
    if (!fallback) {
      log::error("No test command and no run command for language '{}'",
                 request.language);
      return fail(Error::InvalidArgument);
    }
    command = std::move(*fallback);
  }

  std::error_code ec;
  fs::create_directories(dir.parent_path(), ec);
  if (ec) {
    log::error("Cannot create {}: {}", dir.parent_path().string(),
               ec.message());
    return fail(Error::SandboxInfrastructure);
  }

  if (auto r = checkout(request.repo, dir, token); !r) {
    if (r.error() == Error::Timeout) {
      return fail(Error::SandboxInfrastructure);
    }
    return std::unexpected(r.error());
  }
  if (auto r = apply_patch(request.patch, dir, token); !r) {
    if (r.error() == Error::Timeout) {
      return fail(Error::SandboxInfrastructure);
    }
    return std::unexpected(r.error());
  }
  return command;
}

auto remove_workspace(const fs::path& dir) -> void {
  std::error_code ec;
  fs::remove_all(dir, ec);
  if (ec) {
    log::warn("Failed to remove workspace {}: {}", dir.string(),
              ec.message());
  }
}

}  // namespace fixloop
