#include "cronwork/cli/commands.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <format>
#include <print>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

using namespace cronwork::cli;

void print_usage(const char* prog) {
  std::println("cronwork - distributed cron task scheduler");
  std::println("Usage: {} <command> [OPTIONS]", prog);
  std::println("");
  std::println("Commands:");
  std::println("  worker      Run a worker loop");
  std::println("  queue       Register a task");
  std::println("  status      List tasks or show one task");
  std::println("  stop        Stop a task");
  std::println("  workers     List workers or change their status");
  std::println("  validate    Check a cron expression");
  std::println("");
  std::println("Common options:");
  std::println("  -c, --config <file>   Config file (YAML)");
  std::println("  --db <file>           Database file (default: cronwork.db)");
  std::println("  -h, --help            Show this help message");
  std::println("");
  std::println("worker:   --name <name> --group <group>... -d/--daemon");
  std::println("queue:    --function <name> [--args <json>] [--kwargs <json>]");
  std::println("          [--name <n>] [--group <g>] [--uuid <u>]");
  std::println("          [--cron <expr> | --period <sec>] [--prevent-drift]");
  std::println("          [--start <epoch>] [--stop <epoch>] [--repeats <n>]");
  std::println("          [--timeout <sec>] [--retry <n>] [--immediate]");
  std::println("          [--sync-output <sec>] [--depends-on <id,id,...>]");
  std::println("          [--job <name>] [--overwrite]");
  std::println("status:   [--id <id> | --uuid <u>] [--status <s>] [--group <g>]");
  std::println("          [--output]");
  std::println("stop:     --id <id> | --uuid <u>");
  std::println("workers:  [--disable <name> | --resume <name> |");
  std::println("           --terminate <name>]");
  std::println("validate: <cron expression> [--count <n>]");
  std::println("");
  std::println("Examples:");
  std::println("  {} queue --function shell --args '[\"date\"]' --cron '*/5 * * * *'",
               prog);
  std::println("  {} worker --group main -c cronwork.yaml", prog);
}

[[noreturn]] void usage_error(const char* prog, std::string_view message) {
  std::println(stderr, "Error: {}", message);
  print_usage(prog);
  std::exit(1);
}

class ArgReader {
public:
  ArgReader(int argc, char* argv[]) : argc_(argc), argv_(argv) {
  }

  [[nodiscard]] auto done() const -> bool {
    return i_ >= argc_;
  }
  auto next() -> std::string_view {
    return argv_[i_++];
  }
  auto value(std::string_view flag) -> std::string {
    if (i_ >= argc_) {
      std::println(stderr, "Error: {} requires an argument", flag);
      std::exit(1);
    }
    return argv_[i_++];
  }
  template <typename Int>
  auto number(std::string_view flag) -> Int {
    auto text = value(flag);
    Int out{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
      std::println(stderr, "Error: {} expects a number, got '{}'", flag, text);
      std::exit(1);
    }
    return out;
  }
  [[nodiscard]] auto prog() const -> const char* {
    return argv_[0];
  }

private:
  int argc_;
  char** argv_;
  int i_{2};
};

// Consumes -c/--config and --db. Returns false for any other flag.
auto parse_common(ArgReader& in, std::string_view arg, CommonOptions& common)
    -> bool {
  if (arg == "-c" || arg == "--config") {
    common.config_file = in.value(arg);
    return true;
  }
  if (arg == "--db") {
    common.db_file = in.value(arg);
    return true;
  }
  if (arg == "-h" || arg == "--help") {
    print_usage(in.prog());
    std::exit(0);
  }
  return false;
}

auto parse_id_list(std::string_view text) -> std::vector<cronwork::TaskId> {
  std::vector<cronwork::TaskId> ids;
  while (!text.empty()) {
    auto comma = text.find(',');
    auto item = text.substr(0, comma);
    cronwork::TaskId id{};
    auto [ptr, ec] = std::from_chars(item.data(), item.data() + item.size(), id);
    if (ec != std::errc{} || ptr != item.data() + item.size()) {
      std::println(stderr, "Error: --depends-on expects task ids, got '{}'",
                   item);
      std::exit(1);
    }
    ids.push_back(id);
    if (comma == std::string_view::npos) {
      break;
    }
    text.remove_prefix(comma + 1);
  }
  return ids;
}

auto run_worker(ArgReader& in) -> int {
  WorkerRunOptions opts;
  while (!in.done()) {
    auto arg = in.next();
    if (parse_common(in, arg, opts.common)) {
      continue;
    } else if (arg == "--name") {
      opts.name = in.value(arg);
    } else if (arg == "--group") {
      opts.groups.push_back(in.value(arg));
    } else if (arg == "-d" || arg == "--daemon") {
      opts.daemon = true;
    } else {
      usage_error(in.prog(), std::format("Unknown option: {}", arg));
    }
  }
  return cmd_worker(opts);
}

auto run_queue(ArgReader& in) -> int {
  QueueOptions opts;
  while (!in.done()) {
    auto arg = in.next();
    if (parse_common(in, arg, opts.common)) {
      continue;
    } else if (arg == "--function") {
      opts.function = in.value(arg);
    } else if (arg == "--args") {
      opts.args = in.value(arg);
    } else if (arg == "--kwargs") {
      opts.kwargs = in.value(arg);
    } else if (arg == "--name") {
      opts.name = in.value(arg);
    } else if (arg == "--group") {
      opts.group = in.value(arg);
    } else if (arg == "--uuid") {
      opts.uuid = in.value(arg);
    } else if (arg == "--cron") {
      opts.cron = in.value(arg);
    } else if (arg == "--period") {
      opts.period_sec = in.number<std::int64_t>(arg);
    } else if (arg == "--start") {
      opts.start_epoch = in.number<std::int64_t>(arg);
    } else if (arg == "--stop") {
      opts.stop_epoch = in.number<std::int64_t>(arg);
    } else if (arg == "--repeats") {
      opts.repeats = in.number<int>(arg);
    } else if (arg == "--timeout") {
      opts.timeout_sec = in.number<std::int64_t>(arg);
    } else if (arg == "--retry") {
      opts.retry_failed = in.number<int>(arg);
    } else if (arg == "--prevent-drift") {
      opts.prevent_drift = true;
    } else if (arg == "--immediate") {
      opts.immediate = true;
    } else if (arg == "--sync-output") {
      opts.sync_output_sec = in.number<std::int64_t>(arg);
    } else if (arg == "--depends-on") {
      auto ids = parse_id_list(in.value(arg));
      opts.depends_on.insert(opts.depends_on.end(), ids.begin(), ids.end());
    } else if (arg == "--job") {
      opts.job = in.value(arg);
    } else if (arg == "--overwrite") {
      opts.overwrite = true;
    } else {
      usage_error(in.prog(), std::format("Unknown option: {}", arg));
    }
  }
  if (opts.function.empty()) {
    usage_error(in.prog(), "queue requires --function");
  }
  return cmd_queue(opts);
}

auto run_status(ArgReader& in) -> int {
  StatusOptions opts;
  while (!in.done()) {
    auto arg = in.next();
    if (parse_common(in, arg, opts.common)) {
      continue;
    } else if (arg == "--id") {
      opts.id = in.number<cronwork::TaskId>(arg);
    } else if (arg == "--uuid") {
      opts.uuid = in.value(arg);
    } else if (arg == "--status") {
      opts.status = in.value(arg);
    } else if (arg == "--group") {
      opts.group = in.value(arg);
    } else if (arg == "--output") {
      opts.output = true;
    } else {
      usage_error(in.prog(), std::format("Unknown option: {}", arg));
    }
  }
  return cmd_status(opts);
}

auto run_stop(ArgReader& in) -> int {
  StopOptions opts;
  while (!in.done()) {
    auto arg = in.next();
    if (parse_common(in, arg, opts.common)) {
      continue;
    } else if (arg == "--id") {
      opts.id = in.number<cronwork::TaskId>(arg);
    } else if (arg == "--uuid") {
      opts.uuid = in.value(arg);
    } else {
      usage_error(in.prog(), std::format("Unknown option: {}", arg));
    }
  }
  return cmd_stop(opts);
}

auto run_workers(ArgReader& in) -> int {
  WorkersOptions opts;
  while (!in.done()) {
    auto arg = in.next();
    if (parse_common(in, arg, opts.common)) {
      continue;
    } else if (arg == "--disable") {
      opts.disable = in.value(arg);
    } else if (arg == "--resume") {
      opts.resume = in.value(arg);
    } else if (arg == "--terminate") {
      opts.terminate = in.value(arg);
    } else {
      usage_error(in.prog(), std::format("Unknown option: {}", arg));
    }
  }
  return cmd_workers(opts);
}

auto run_validate(ArgReader& in) -> int {
  ValidateOptions opts;
  while (!in.done()) {
    auto arg = in.next();
    if (arg == "--count") {
      opts.count = in.number<int>(arg);
    } else if (arg == "-h" || arg == "--help") {
      print_usage(in.prog());
      return 0;
    } else if (opts.cron.empty()) {
      opts.cron = arg;
    } else {
      usage_error(in.prog(), std::format("Unexpected argument: {}", arg));
    }
  }
  if (opts.cron.empty()) {
    usage_error(in.prog(), "validate requires a cron expression");
  }
  return cmd_validate(opts);
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage(argv[0]);
    return 1;
  }

  std::string_view command = argv[1];
  ArgReader in(argc, argv);

  if (command == "-h" || command == "--help") {
    print_usage(argv[0]);
    return 0;
  } else if (command == "worker") {
    return run_worker(in);
  } else if (command == "queue") {
    return run_queue(in);
  } else if (command == "status") {
    return run_status(in);
  } else if (command == "stop") {
    return run_stop(in);
  } else if (command == "workers") {
    return run_workers(in);
  } else if (command == "validate") {
    return run_validate(in);
  }

  usage_error(argv[0], std::format("Unknown command: {}", command));
}
