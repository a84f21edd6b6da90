#include "upkeep/cli/commands.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <print>
#include <string>
#include <string_view>

namespace {

void print_usage(const char* prog) {
  std::println("upkeep - Resumable maintenance task runner");
  std::println("Usage: {} <command> [OPTIONS]", prog);
  std::println("");
  std::println("Commands:");
  std::println("  serve                 Schedule tasks and run them as they fall due");
  std::println("  schedule              Schedule every enabled task from settings");
  std::println("  reconcile             Bring the schedule in line with settings");
  std::println("  status                Show per-task schedule status");
  std::println("  progress list         List saved checkpoints");
  std::println("  progress clear [task] Remove one or all checkpoints");
  std::println("  progress prune        Remove checkpoints older than --max-age");
  std::println("  validate              Check a config file");
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>   Config file (YAML)");
  std::println("  -d, --daemon          Run as daemon (serve)");
  std::println("  -l, --log-file <file> Log file (serve)");
  std::println("  --max-age <seconds>   Checkpoint age for prune (default: 86400)");
  std::println("  -p, --print           Print the effective config (validate)");
  std::println("  -v, --version         Show version and exit");
  std::println("  -h, --help            Show this help message");
  std::println("");
  std::println("Examples:");
  std::println("  {} serve -c upkeep.yaml", prog);
  std::println("  {} progress clear media_scan -c upkeep.yaml", prog);
}

void print_version() {
  std::println("upkeep v0.1.0");
}

struct Args {
  std::string command;
  std::string subcommand;
  std::string task_id;
  std::string config_file;
  std::optional<std::string> log_file;
  std::int64_t max_age_sec{86400};
  bool daemon{false};
  bool print{false};
};

auto require_value(int& i, int argc, char* argv[], std::string_view flag)
    -> const char* {
  if (++i >= argc) {
    std::println(stderr, "Error: {} requires an argument", flag);
    std::exit(1);
  }
  return argv[i];
}

auto parse_args(int argc, char* argv[]) -> Args {
  Args args;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      args.config_file = require_value(i, argc, argv, arg);
    } else if (arg == "-l" || arg == "--log-file") {
      args.log_file = require_value(i, argc, argv, arg);
    } else if (arg == "-d" || arg == "--daemon") {
      args.daemon = true;
    } else if (arg == "-p" || arg == "--print") {
      args.print = true;
    } else if (arg == "--max-age") {
      std::string_view value = require_value(i, argc, argv, arg);
      auto [ptr, ec] = std::from_chars(value.data(),
                                       value.data() + value.size(),
                                       args.max_age_sec);
      if (ec != std::errc{} || ptr != value.data() + value.size() ||
          args.max_age_sec < 0) {
        std::println(stderr, "Error: invalid --max-age: {}", value);
        std::exit(1);
      }
    } else if (arg.starts_with('-')) {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(argv[0]);
      std::exit(1);
    } else if (args.command.empty()) {
      args.command = arg;
    } else if (args.command == "progress" && args.subcommand.empty()) {
      args.subcommand = arg;
    } else if (args.command == "progress" && args.task_id.empty()) {
      args.task_id = arg;
    } else {
      std::println(stderr, "Unexpected argument: {}", arg);
      std::exit(1);
    }
  }

  return args;
}

auto run_progress(const Args& args) -> int {
  upkeep::cli::ProgressOptions opts;
  opts.config_file = args.config_file;
  opts.task_id = args.task_id;
  opts.max_age_sec = args.max_age_sec;

  if (args.subcommand.empty() || args.subcommand == "list") {
    opts.action = upkeep::cli::ProgressAction::List;
  } else if (args.subcommand == "clear") {
    opts.action = upkeep::cli::ProgressAction::Clear;
  } else if (args.subcommand == "prune") {
    opts.action = upkeep::cli::ProgressAction::Prune;
  } else {
    std::println(stderr, "Unknown progress action: {}", args.subcommand);
    return 1;
  }
  return upkeep::cli::cmd_progress(opts);
}

}  // namespace

int main(int argc, char* argv[]) {
  auto args = parse_args(argc, argv);

  if (args.command.empty()) {
    print_usage(argv[0]);
    return 1;
  }
  if (args.command == "serve") {
    return upkeep::cli::cmd_serve(
        {.config_file = args.config_file,
         .log_file = args.log_file,
         .daemon = args.daemon});
  }
  if (args.command == "schedule") {
    return upkeep::cli::cmd_schedule({.config_file = args.config_file});
  }
  if (args.command == "reconcile") {
    return upkeep::cli::cmd_reconcile({.config_file = args.config_file});
  }
  if (args.command == "status") {
    return upkeep::cli::cmd_status({.config_file = args.config_file});
  }
  if (args.command == "progress") {
    return run_progress(args);
  }
  if (args.command == "validate") {
    return upkeep::cli::cmd_validate(
        {.config_file = args.config_file, .print = args.print});
  }

  std::println(stderr, "Unknown command: {}", args.command);
  print_usage(argv[0]);
  return 1;
}
