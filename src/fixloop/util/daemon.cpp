#include "fixloop/util/daemon.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace fixloop {

std::atomic<bool> g_shutdown_requested{false};

namespace {
void signal_handler(int) {
  g_shutdown_requested.store(true, std::memory_order_release);
  g_shutdown_requested.notify_one();
}

auto redirect_to_null(int fd, int flags) -> void {
  int null_fd = ::open("/dev/null", flags);
  if (null_fd < 0) {
    ::close(fd);
    return;
  }
  if (null_fd != fd) {
    ::dup2(null_fd, fd);
    ::close(null_fd);
  }
}
}  // namespace

auto daemonize() -> bool {
  pid_t pid = fork();
  if (pid < 0) return false;
  if (pid > 0) std::exit(0);

  if (setsid() < 0) return false;

  pid = fork();
  if (pid < 0) return false;
  if (pid > 0) std::exit(0);

  // Sandbox children inherit these; keep the descriptors valid
  redirect_to_null(STDIN_FILENO, O_RDONLY);
  redirect_to_null(STDOUT_FILENO, O_WRONLY);
  redirect_to_null(STDERR_FILENO, O_WRONLY);
  return true;
}

void setup_signal_handlers() {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);
  std::signal(SIGPIPE, SIG_IGN);
}

void wait_for_shutdown() {
  g_shutdown_requested.wait(false, std::memory_order_acquire);
}

auto write_pid_file(std::string_view path) -> bool {
  if (path.empty()) {
    return true;
  }
  std::ofstream out{std::string(path), std::ios::trunc};
  if (!out) {
    return false;
  }
  out << ::getpid() << '\n';
  return static_cast<bool>(out);
}

void remove_pid_file(std::string_view path) {
  if (path.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove(std::filesystem::path(path), ec);
}

}  // namespace fixloop
