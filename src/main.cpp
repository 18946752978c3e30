#include "stepflow/cli/commands.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <format>
#include <optional>
#include <print>
#include <span>
#include <string>
#include <string_view>

namespace {

using namespace stepflow::cli;

void print_usage(const char* prog) {
  std::println("Stepflow - A durable step-plan task orchestrator");
  std::println("Usage: {} <command> [OPTIONS]", prog);
  std::println("");
  std::println("Commands:");
  std::println("  serve                   Run the worker pool until SIGINT/SIGTERM");
  std::println("  enqueue <kind>          Queue a task");
  std::println("  status [task_id]        Show a task, an owner's tasks or the queue");
  std::println("  events <task_id>        Show a task's audit log, newest first");
  std::println("  approve <task_id>       Approve a task waiting for approval");
  std::println("  reject <task_id>        Reject a task waiting for approval");
  std::println("  resume <task_id>        Requeue a paused task");
  std::println("  cancel <task_id>        Cancel a task");
  std::println("  validate                Check a config file");
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>     Config file (YAML)");
  std::println("  --db <file>             Database file (overrides config)");
  std::println("  -w, --workers <n>       Worker count (serve)");
  std::println("  -d, --daemon            Run as daemon (serve)");
  std::println("  -o, --owner <id>        Owner id (enqueue, status)");
  std::println("  -i, --input <text>      Task input text (enqueue)");
  std::println("  --data <json>           Task input data object (enqueue)");
  std::println("  --max-attempts <n>      Attempt budget (enqueue)");
  std::println("  --skip-limits           Bypass owner quotas (enqueue)");
  std::println("  --content <text>        Edited content (approve)");
  std::println("  --reason <text>         Cancel reason (cancel)");
  std::println("  -n, --limit <n>         Event count (events)");
  std::println("  -v, --version           Show version and exit");
  std::println("  -h, --help              Show this help message");
}

void print_version() {
  std::println("Stepflow v0.1.0");
}

[[noreturn]] void usage_error(std::string_view message) {
  std::println(stderr, "Error: {}", message);
  std::exit(2);
}

template <typename T>
auto parse_number(std::string_view text, std::string_view what) -> T {
  T value{};
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    usage_error(std::format("{} must be a number, got '{}'", what, text));
  }
  return value;
}

struct Args {
  std::string command;
  std::string positional;
  CommonOptions common;
  std::optional<int> workers;
  bool daemon{false};
  std::optional<std::int64_t> owner;
  std::string input;
  std::string data;
  std::optional<int> max_attempts;
  bool skip_limits{false};
  std::optional<std::string> content;
  std::string reason;
  int limit{100};
};

auto parse_args(std::span<char*> argv) -> Args {
  Args args;
  const char* prog = argv[0];

  auto value_of = [&](std::size_t& i, std::string_view flag) -> std::string {
    if (++i >= argv.size()) {
      usage_error(std::format("{} requires an argument", flag));
    }
    return argv[i];
  };

  for (std::size_t i = 1; i < argv.size(); ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(prog);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      args.common.config_file = value_of(i, arg);
    } else if (arg == "--db") {
      args.common.db_file = value_of(i, arg);
    } else if (arg == "-w" || arg == "--workers") {
      args.workers = parse_number<int>(value_of(i, arg), arg);
    } else if (arg == "-d" || arg == "--daemon") {
      args.daemon = true;
    } else if (arg == "-o" || arg == "--owner") {
      args.owner = parse_number<std::int64_t>(value_of(i, arg), arg);
    } else if (arg == "-i" || arg == "--input") {
      args.input = value_of(i, arg);
    } else if (arg == "--data") {
      args.data = value_of(i, arg);
    } else if (arg == "--max-attempts") {
      args.max_attempts = parse_number<int>(value_of(i, arg), arg);
    } else if (arg == "--skip-limits") {
      args.skip_limits = true;
    } else if (arg == "--content") {
      args.content = value_of(i, arg);
    } else if (arg == "--reason") {
      args.reason = value_of(i, arg);
    } else if (arg == "-n" || arg == "--limit") {
      args.limit = parse_number<int>(value_of(i, arg), arg);
    } else if (arg.starts_with("-")) {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(prog);
      std::exit(2);
    } else if (args.command.empty()) {
      args.command = arg;
    } else if (args.positional.empty()) {
      args.positional = arg;
    } else {
      usage_error(std::format("Unexpected argument: {}", arg));
    }
  }

  if (args.command.empty()) {
    print_usage(prog);
    std::exit(2);
  }
  return args;
}

auto require_task_id(const Args& args) -> std::int64_t {
  if (args.positional.empty()) {
    usage_error(std::format("{} requires a task id", args.command));
  }
  return parse_number<std::int64_t>(args.positional, "task id");
}

}  // namespace

int main(int argc, char* argv[]) {
  auto args = parse_args(std::span(argv, static_cast<std::size_t>(argc)));
  const auto& cmd = args.command;

  if (cmd == "serve") {
    return cmd_serve({.common = args.common,
                      .workers = args.workers,
                      .daemon = args.daemon});
  }
  if (cmd == "enqueue") {
    SubmitOptions opts{.common = args.common,
                       .owner = args.owner.value_or(0),
                       .input_text = args.input,
                       .input_json = args.data,
                       .max_attempts = args.max_attempts,
                       .skip_limits = args.skip_limits};
    if (!args.positional.empty()) {
      opts.kind = args.positional;
    }
    return cmd_enqueue(opts);
  }
  if (cmd == "status") {
    StatusOptions opts{.common = args.common, .owner = args.owner};
    if (!args.positional.empty()) {
      opts.task_id = require_task_id(args);
    }
    return cmd_status(opts);
  }
  if (cmd == "events") {
    return cmd_events({.common = args.common,
                       .task_id = require_task_id(args),
                       .limit = args.limit});
  }
  if (cmd == "approve") {
    return cmd_approve({.common = args.common,
                        .task_id = require_task_id(args),
                        .content = args.content});
  }
  if (cmd == "reject") {
    return cmd_reject({.common = args.common, .task_id = require_task_id(args)});
  }
  if (cmd == "resume") {
    return cmd_resume({.common = args.common, .task_id = require_task_id(args)});
  }
  if (cmd == "cancel") {
    return cmd_cancel({.common = args.common,
                       .task_id = require_task_id(args),
                       .reason = args.reason});
  }
  if (cmd == "validate") {
    auto file = args.common.config_file.empty() ? args.positional
                                                : args.common.config_file;
    if (file.empty()) {
      usage_error("validate requires a config file");
    }
    return cmd_validate({.config_file = file});
  }

  std::println(stderr, "Unknown command: {}", cmd);
  print_usage(argv[0]);
  return 2;
}
