#pragma once

#include <atomic>
#include <string_view>

namespace fixloop {

extern std::atomic<bool> g_shutdown_requested;

[[nodiscard]] auto daemonize() -> bool;
// SIGINT and SIGTERM request shutdown; SIGPIPE is ignored so a dropped
// socket surfaces as an EPIPE error instead.
void setup_signal_handlers();
void wait_for_shutdown();

[[nodiscard]] auto write_pid_file(std::string_view path) -> bool;
void remove_pid_file(std::string_view path);

}  // namespace fixloop
