#include "fixloop/sandbox/process_sandbox.hpp"

#include "fixloop/core/constants.hpp"
#include "fixloop/sandbox/workspace.hpp"
#include "fixloop/util/log.hpp"

#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/wait.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <experimental/scope>
#include <fstream>
#include <memory>
#include <mutex>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <unistd.h>

namespace fixloop {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kWorkDir = "work";
constexpr std::string_view kPgidFile = "pgid";

// Steps of child setup, reported back through the error pipe.
enum class ChildStage : int {
  Session = 1,
  Isolate,
  Limits,
  Redirect,
  Chdir,
  Exec,
};

auto stage_name(ChildStage stage) -> std::string_view {
  switch (stage) {
    case ChildStage::Session: return "setsid";
    case ChildStage::Isolate: return "unshare";
    case ChildStage::Limits: return "setrlimit";
    case ChildStage::Redirect: return "dup2";
    case ChildStage::Chdir: return "chdir";
    case ChildStage::Exec: return "execve";
  }
  return "unknown";
}

struct ChildSetup {
  const char* work_dir;
  char* const* argv;
  char* const* envp;
  int stdout_fd;
  int stderr_fd;
  int error_fd;
  bool isolate;
  rlim_t memory_bytes;
  rlim_t cpu_seconds;
};

auto pidfd_open(pid_t pid, unsigned int flags) -> int {
  return static_cast<int>(syscall(SYS_pidfd_open, pid, flags));
}

auto close_fd(int& fd) -> void {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

auto set_nonblocking(int fd) -> void {
  int flags = fcntl(fd, F_GETFL);
  if (flags >= 0) {
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

// Runs in the forked child: async-signal-safe calls only.
[[noreturn]] auto child_fail(int error_fd, ChildStage stage) -> void {
  std::array<int, 2> report{static_cast<int>(stage), errno};
  ssize_t n = write(error_fd, report.data(), sizeof(report));
  (void)n;
  _exit(126);
}

[[noreturn]] auto exec_child(const ChildSetup& s) -> void {
  if (setsid() < 0) {
    child_fail(s.error_fd, ChildStage::Session);
  }
  if (s.isolate && unshare(CLONE_NEWUSER | CLONE_NEWNET) < 0) {
    child_fail(s.error_fd, ChildStage::Isolate);
  }

  rlimit mem{s.memory_bytes, s.memory_bytes};
  rlimit cpu{s.cpu_seconds, s.cpu_seconds + 1};
  rlimit core{0, 0};
  if (setrlimit(RLIMIT_AS, &mem) < 0 || setrlimit(RLIMIT_CPU, &cpu) < 0 ||
      setrlimit(RLIMIT_CORE, &core) < 0) {
    child_fail(s.error_fd, ChildStage::Limits);
  }

  int devnull = open("/dev/null", O_RDONLY);
  if (devnull < 0 || dup2(devnull, STDIN_FILENO) < 0 ||
      dup2(s.stdout_fd, STDOUT_FILENO) < 0 ||
      dup2(s.stderr_fd, STDERR_FILENO) < 0) {
    child_fail(s.error_fd, ChildStage::Redirect);
  }
  close(devnull);

  if (chdir(s.work_dir) < 0) {
    child_fail(s.error_fd, ChildStage::Chdir);
  }
  execve("/bin/sh", s.argv, s.envp);
  child_fail(s.error_fd, ChildStage::Exec);
}

auto get_exit_code(int status) -> int {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

// Kill target shared with the cancellation callback, which runs on another
// thread. Once reaped the pid may be reused, so kills stop there.
struct ProcessGroup {
  explicit ProcessGroup(pid_t id) : pgid(id) {
  }

  auto kill_all() -> void {
    std::lock_guard lock(mutex);
    if (!reaped) {
      ::kill(-pgid, SIGKILL);
    }
  }

  auto mark_reaped() -> void {
    std::lock_guard lock(mutex);
    reaped = true;
  }

  std::mutex mutex;
  pid_t pgid;
  bool reaped{false};
  std::atomic<bool> cancelled{false};
};

struct OutputStream {
  int fd{-1};
  std::string data;

  // Drains what is available; returns false once the writer side closed.
  auto drain() -> bool {
    std::array<char, io::kReadBufferSize> buffer;
    while (true) {
      ssize_t n = read(fd, buffer.data(), buffer.size());
      if (n > 0) {
        auto room = io::kMaxOutputSize - std::min(io::kMaxOutputSize, data.size());
        data.append(buffer.data(),
                    std::min(room, static_cast<std::size_t>(n)));
        continue;
      }
      if (n < 0 && errno == EINTR) {
        continue;
      }
      if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        return true;
      }
      close_fd(fd);
      return false;
    }
  }
};

auto read_pgid(const fs::path& root) -> pid_t {
  std::ifstream in(root / kPgidFile);
  pid_t pgid = 0;
  if (!(in >> pgid)) {
    return 0;
  }
  return pgid;
}

// Kills the group recorded for an environment left behind by a previous
// process, unless the pid now belongs to something unrelated.
auto kill_recorded_group(const fs::path& root) -> void {
  pid_t pgid = read_pgid(root);
  if (pgid <= 1) {
    return;
  }
  auto proc = fs::path("/proc") / std::to_string(pgid);
  std::error_code ec;
  if (fs::exists(proc, ec)) {
    auto cwd = fs::read_symlink(proc / "cwd", ec);
    if (ec || !cwd.string().starts_with(root.string())) {
      return;
    }
  }
  if (::kill(-pgid, SIGKILL) == 0) {
    log::info("Killed leftover process group {} in {}", pgid, root.string());
  }
}

}  // namespace

ProcessSandbox::ProcessSandbox(ProcessSandboxOptions options)
    : options_(std::move(options)) {
}

auto ProcessSandbox::owner_root() const -> fs::path {
  return options_.workspace_root / options_.owner;
}

auto ProcessSandbox::check() -> Result<void> {
  std::error_code ec;
  fs::create_directories(owner_root(), ec);
  if (ec || access(owner_root().c_str(), W_OK) != 0) {
    log::error("Sandbox workspace {} is not writable", owner_root().string());
    return fail(Error::SandboxInfrastructure);
  }
  if (access("/bin/sh", X_OK) != 0) {
    log::error("Sandbox shell /bin/sh is not executable");
    return fail(Error::SandboxInfrastructure);
  }

  if (options_.network_isolation) {
    pid_t pid = fork();
    if (pid < 0) {
      return fail(Error::SandboxInfrastructure);
    }
    if (pid == 0) {
      _exit(unshare(CLONE_NEWUSER | CLONE_NEWNET) == 0 ? 0 : 1);
    }
    int status = 0;
    if (waitpid(pid, &status, 0) != pid || get_exit_code(status) != 0) {
      log::error("Network isolation unavailable: cannot create user and "
                 "network namespaces");
      return fail(Error::SandboxInfrastructure);
    }
  }
  return ok();
}

auto ProcessSandbox::destroy(const fs::path& root) -> void {
  kill_recorded_group(root);
  remove_workspace(root);
}

auto ProcessSandbox::execute(const ExecutionRequest& request,
                             const ResourceLimits& limits,
                             CancellationToken token)
    -> Result<ExecutionResult> {
  auto root = owner_root() / request.name.str();
  auto work = root / kWorkDir;

  std::error_code ec;
  if (fs::exists(root, ec)) {
    log::warn("Removing leftover sandbox {}", request.name);
    destroy(root);
  }
  std::experimental::scope_exit teardown{[this, &root] { destroy(root); }};

  if (token.is_cancelled()) {
    return fail(Error::Cancelled);
  }

  auto command = prepare_workspace(request, work, token);
  if (!command) {
    return std::unexpected(command.error());
  }

  std::array<int, 2> out_pipe{-1, -1};
  std::array<int, 2> err_pipe{-1, -1};
  std::array<int, 2> status_pipe{-1, -1};
  std::experimental::scope_exit close_pipes{[&] {
    for (auto* p : {&out_pipe, &err_pipe, &status_pipe}) {
      close_fd((*p)[0]);
      close_fd((*p)[1]);
    }
  }};
  if (pipe2(out_pipe.data(), O_CLOEXEC) < 0 ||
      pipe2(err_pipe.data(), O_CLOEXEC) < 0 ||
      pipe2(status_pipe.data(), O_CLOEXEC) < 0) {
    log::error("Failed to create pipes: {}", strerror(errno));
    return fail(Error::SandboxInfrastructure);
  }

  // Everything the child touches is prepared before fork().
  auto work_dir = work.string();
  std::vector<std::string> env_strings = {
      "PATH=/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin",
      "HOME=" + work_dir,
      "TMPDIR=" + work_dir,
      "LANG=C.UTF-8",
      "PYTHONDONTWRITEBYTECODE=1",
      "PYTHONUNBUFFERED=1",
  };
  std::vector<char*> envp;
  for (auto& e : env_strings) {
    envp.push_back(e.data());
  }
  envp.push_back(nullptr);
  std::string sh = "sh";
  std::string dash_c = "-c";
  std::array<char*, 4> argv{sh.data(), dash_c.data(), command->data(),
                            nullptr};

  auto cpu_seconds = static_cast<rlim_t>(std::max(
      1.0, std::ceil(static_cast<double>(limits.timeout.count()) * limits.cpu)));
  ChildSetup setup{
      .work_dir = work_dir.c_str(),
      .argv = argv.data(),
      .envp = envp.data(),
      .stdout_fd = out_pipe[1],
      .stderr_fd = err_pipe[1],
      .error_fd = status_pipe[1],
      .isolate = options_.network_isolation,
      .memory_bytes = static_cast<rlim_t>(limits.memory_bytes),
      .cpu_seconds = cpu_seconds,
  };

  auto start = std::chrono::steady_clock::now();
  pid_t pid = fork();
  if (pid < 0) {
    log::error("fork failed: {}", strerror(errno));
    return fail(Error::SandboxInfrastructure);
  }
  if (pid == 0) {
    exec_child(setup);
  }

  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  close_fd(status_pipe[1]);

  auto group = std::make_shared<ProcessGroup>(pid);
  std::experimental::scope_exit reap{[&group, &root, pid] {
    group->kill_all();
    group->mark_reaped();
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    std::error_code ignored;
    fs::remove(root / kPgidFile, ignored);
  }};

  // EOF means execve succeeded; a report means setup failed.
  std::array<int, 2> report{0, 0};
  ssize_t n;
  while ((n = read(status_pipe[0], report.data(), sizeof(report))) < 0 &&
         errno == EINTR) {
  }
  if (n == static_cast<ssize_t>(sizeof(report))) {
    auto stage = static_cast<ChildStage>(report[0]);
    log::error("Sandbox {} setup failed at {}: {}", request.name,
               stage_name(stage), strerror(report[1]));
    return fail(Error::SandboxInfrastructure);
  }

  {
    std::ofstream pgid_file(root / kPgidFile, std::ios::trunc);
    pgid_file << pid;
  }

  auto registration = token.on_cancel([group] {
    group->cancelled.store(true);
    group->kill_all();
  });
  log::debug("Sandbox {} started pid {}", request.name, pid);

  ExecutionResult result;
  OutputStream out{.fd = std::exchange(out_pipe[0], -1), .data = {}};
  OutputStream err{.fd = std::exchange(err_pipe[0], -1), .data = {}};
  out.data.reserve(io::kInitialOutputReserve);
  set_nonblocking(out.fd);
  set_nonblocking(err.fd);

  int pidfd = pidfd_open(pid, 0);
  if (pidfd < 0) {
    log::warn("pidfd_open failed for pid {}", pid);
  }
  std::experimental::scope_exit close_pidfd{[&pidfd] { close_fd(pidfd); }};

  bool exited = pidfd < 0;
  auto deadline = start + limits.timeout;
  while (out.fd >= 0 || err.fd >= 0 || !exited) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      result.timed_out = true;
      group->kill_all();
      break;
    }
    auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);

    std::array<pollfd, 3> fds{};
    nfds_t count = 0;
    for (int fd : {out.fd, err.fd}) {
      if (fd >= 0) {
        fds[count++] = pollfd{fd, POLLIN, 0};
      }
    }
    if (!exited) {
      fds[count++] = pollfd{pidfd, POLLIN, 0};
    }

    int rc = poll(fds.data(), count,
                  static_cast<int>(std::max<std::int64_t>(1, remaining.count())));
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      log::error("poll failed for sandbox {}: {}", request.name,
                 strerror(errno));
      break;
    }

    for (nfds_t i = 0; i < count; ++i) {
      if (fds[i].revents == 0) {
        continue;
      }
      if (fds[i].fd == out.fd) {
        out.drain();
      } else if (fds[i].fd == err.fd) {
        err.drain();
      } else if (fds[i].fd == pidfd) {
        // The shell is gone; anything it left running goes with it.
        exited = true;
        group->kill_all();
      }
    }
  }
  registration.reset();

  close_fd(out.fd);
  close_fd(err.fd);
  group->kill_all();
  group->mark_reaped();
  int status = 0;
  while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
  reap.release();
  // The pid is free for reuse now; the sweep must not find it.
  fs::remove(root / kPgidFile, ec);

  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  result.exit_code = get_exit_code(status);
  result.stdout_output = std::move(out.data);
  result.stderr_output = std::move(err.data);
  result.cancelled = group->cancelled.load();
  result.resource_exceeded = WIFSIGNALED(status) && WTERMSIG(status) == SIGXCPU;

  log::info("Sandbox {} finished exit_code={} timed_out={} duration={}ms",
            request.name, result.exit_code, result.timed_out,
            result.duration.count());
  return result;
}

auto ProcessSandbox::sweep_orphans(const OwnerLock& lock)
    -> Result<std::size_t> {
  if (!lock.covers(options_.workspace_root, options_.owner)) {
    log::error("Refusing to sweep {}: lock is for owner {}",
               owner_root().string(), lock.owner());
    return fail(Error::InvalidArgument);
  }
  auto base = owner_root();
  std::error_code ec;
  if (!fs::exists(base, ec)) {
    return std::size_t{0};
  }

  std::size_t swept = 0;
  for (const auto& entry : fs::directory_iterator(base, ec)) {
    auto name = entry.path().filename().string();
    if (!entry.is_directory() || !name.starts_with(kSandboxPrefix)) {
      continue;
    }
    log::info("Sweeping orphaned sandbox {}", name);
    destroy(entry.path());
    ++swept;
  }
  if (ec) {
    log::error("Failed to scan {}: {}", base.string(), ec.message());
    return fail(Error::SandboxInfrastructure);
  }
  return swept;
}

}  // namespace fixloop
