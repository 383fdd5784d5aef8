#pragma once

#include <optional>
#include <string>

namespace fixloop::cli {

// Every command reads the config file when given; --db overrides
// storage.db_file.
struct CommonOptions {
  std::string config_file;
  std::optional<std::string> db_file;
};

struct WorkerOptions {
  CommonOptions common;
  bool daemon{false};
};

struct SubmitOptions {
  CommonOptions common;
  std::string repository_url;
  std::string branch{"main"};
  std::string issue;
  std::optional<std::string> test_command;
  std::string language{"python"};
  std::optional<int> max_attempts;
};

struct StatusOptions {
  CommonOptions common;
  std::string task_id;
  bool json{false};
};

struct CancelOptions {
  CommonOptions common;
  std::string task_id;
};

struct ListOptions {
  CommonOptions common;
  std::optional<std::string> status;
  std::size_t limit{20};
  std::size_t offset{0};
};

struct SweepOptions {
  CommonOptions common;
};

[[nodiscard]] auto cmd_worker(const WorkerOptions& opts) -> int;
[[nodiscard]] auto cmd_submit(const SubmitOptions& opts) -> int;
[[nodiscard]] auto cmd_status(const StatusOptions& opts) -> int;
[[nodiscard]] auto cmd_cancel(const CancelOptions& opts) -> int;
[[nodiscard]] auto cmd_list(const ListOptions& opts) -> int;
[[nodiscard]] auto cmd_sweep(const SweepOptions& opts) -> int;

}  // namespace fixloop::cli
