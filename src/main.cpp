#include "fixloop/cli/commands.hpp"

#include <charconv>
#include <cstdlib>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_usage(const char* prog) {
  std::println("fixloop - automated bug-fix validation pipeline");
  std::println("Usage: {} <command> [OPTIONS]", prog);
  std::println("");
  std::println("Commands:");
  std::println("  worker                Claim and process queued tasks");
  std::println("  submit                Submit a bug-fix task");
  std::println("  status <id>           Show a task and its attempts");
  std::println("  cancel <id>           Request cancellation of a task");
  std::println("  list                  List tasks, newest first");
  std::println("  sweep                 Remove leftover sandbox environments and expired tasks");
  std::println("");
  std::println("Common options:");
  std::println("  -c, --config <file>   Config file (YAML)");
  std::println("  --db <file>           Database file (overrides storage.db_file)");
  std::println("  -h, --help            Show this help message");
  std::println("");
  std::println("worker:  -d, --daemon");
  std::println("submit:  --repo <url> --issue <text> [--branch <b>]");
  std::println("         [--test-command <cmd>] [--language <lang>]");
  std::println("         [--max-attempts <n>]");
  std::println("status:  --json");
  std::println("list:    [--status <s>] [--limit <n>] [--offset <n>]");
}

void print_version() {
  std::println("fixloop v0.1.0");
}

// Walks argv after the command name; common() consumes the options every
// command accepts.
class ArgReader {
public:
  ArgReader(int argc, char* argv[], int start) : prog_(argv[0]) {
    for (int i = start; i < argc; ++i) {
      args_.emplace_back(argv[i]);
    }
  }

  [[nodiscard]] auto next() -> std::optional<std::string_view> {
    if (pos_ >= args_.size()) {
      return std::nullopt;
    }
    return args_[pos_++];
  }

  [[nodiscard]] auto value(std::string_view flag) -> std::string {
    if (pos_ >= args_.size()) {
      std::println(stderr, "Error: {} requires an argument", flag);
      std::exit(1);
    }
    return std::string(args_[pos_++]);
  }

  [[nodiscard]] auto number(std::string_view flag) -> int {
    auto text = value(flag);
    int n = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), n);
    if (ec != std::errc{} || ptr != text.data() + text.size() || n < 0) {
      std::println(stderr, "Error: {} expects a non-negative number", flag);
      std::exit(1);
    }
    return n;
  }

  // True if `arg` was a common option.
  auto common(std::string_view arg, fixloop::cli::CommonOptions& opts) -> bool {
    if (arg == "-c" || arg == "--config") {
      opts.config_file = value(arg);
      return true;
    }
    if (arg == "--db") {
      opts.db_file = value(arg);
      return true;
    }
    if (arg == "-h" || arg == "--help") {
      print_usage(prog_);
      std::exit(0);
    }
    return false;
  }

  [[noreturn]] auto unknown(std::string_view arg) -> void {
    std::println(stderr, "Unknown option: {}", arg);
    print_usage(prog_);
    std::exit(1);
  }

private:
  const char* prog_;
  std::vector<std::string_view> args_;
  std::size_t pos_{0};
};

auto run_worker(ArgReader& args) -> int {
  fixloop::cli::WorkerOptions opts;
  while (auto arg = args.next()) {
    if (args.common(*arg, opts.common)) continue;
    if (*arg == "-d" || *arg == "--daemon") {
      opts.daemon = true;
    } else {
      args.unknown(*arg);
    }
  }
  return fixloop::cli::cmd_worker(opts);
}

auto run_submit(ArgReader& args) -> int {
  fixloop::cli::SubmitOptions opts;
  while (auto arg = args.next()) {
    if (args.common(*arg, opts.common)) continue;
    if (*arg == "--repo") {
      opts.repository_url = args.value(*arg);
    } else if (*arg == "--issue") {
      opts.issue = args.value(*arg);
    } else if (*arg == "--branch") {
      opts.branch = args.value(*arg);
    } else if (*arg == "--test-command") {
      opts.test_command = args.value(*arg);
    } else if (*arg == "--language") {
      opts.language = args.value(*arg);
    } else if (*arg == "--max-attempts") {
      opts.max_attempts = args.number(*arg);
    } else {
      args.unknown(*arg);
    }
  }
  if (opts.repository_url.empty() || opts.issue.empty()) {
    std::println(stderr, "Error: submit requires --repo and --issue");
    return 1;
  }
  return fixloop::cli::cmd_submit(opts);
}

auto run_status(ArgReader& args) -> int {
  fixloop::cli::StatusOptions opts;
  while (auto arg = args.next()) {
    if (args.common(*arg, opts.common)) continue;
    if (*arg == "--json") {
      opts.json = true;
    } else if (!arg->starts_with('-') && opts.task_id.empty()) {
      opts.task_id = std::string(*arg);
    } else {
      args.unknown(*arg);
    }
  }
  if (opts.task_id.empty()) {
    std::println(stderr, "Error: status requires a task id");
    return 1;
  }
  return fixloop::cli::cmd_status(opts);
}

auto run_cancel(ArgReader& args) -> int {
  fixloop::cli::CancelOptions opts;
  while (auto arg = args.next()) {
    if (args.common(*arg, opts.common)) continue;
    if (!arg->starts_with('-') && opts.task_id.empty()) {
      opts.task_id = std::string(*arg);
    } else {
      args.unknown(*arg);
    }
  }
  if (opts.task_id.empty()) {
    std::println(stderr, "Error: cancel requires a task id");
    return 1;
  }
  return fixloop::cli::cmd_cancel(opts);
}

auto run_list(ArgReader& args) -> int {
  fixloop::cli::ListOptions opts;
  while (auto arg = args.next()) {
    if (args.common(*arg, opts.common)) continue;
    if (*arg == "--status") {
      opts.status = args.value(*arg);
    } else if (*arg == "--limit") {
      opts.limit = static_cast<std::size_t>(args.number(*arg));
    } else if (*arg == "--offset") {
      opts.offset = static_cast<std::size_t>(args.number(*arg));
    } else {
      args.unknown(*arg);
    }
  }
  return fixloop::cli::cmd_list(opts);
}

auto run_sweep(ArgReader& args) -> int {
  fixloop::cli::SweepOptions opts;
  while (auto arg = args.next()) {
    if (!args.common(*arg, opts.common)) {
      args.unknown(*arg);
    }
  }
  return fixloop::cli::cmd_sweep(opts);
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage(argv[0]);
    return 1;
  }

  std::string_view command = argv[1];
  if (command == "-h" || command == "--help") {
    print_usage(argv[0]);
    return 0;
  }
  if (command == "-v" || command == "--version") {
    print_version();
    return 0;
  }

  ArgReader args(argc, argv, 2);
  if (command == "worker") return run_worker(args);
  if (command == "submit") return run_submit(args);
  if (command == "status") return run_status(args);
  if (command == "cancel") return run_cancel(args);
  if (command == "list") return run_list(args);
  if (command == "sweep") return run_sweep(args);

  std::println(stderr, "Unknown command: {}", command);
  print_usage(argv[0]);
  return 1;
}
