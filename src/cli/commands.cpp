#include "leakguard/cli/commands.hpp"

#include "leakguard/common/fs.hpp"
#include "leakguard/common/hash.hpp"
#include "leakguard/config/config.hpp"
#include "leakguard/leak/report.hpp"
#include "leakguard/observability/global.hpp"
#include "leakguard/records/factory.hpp"
#include "leakguard/records/json_codec.hpp"
#include "leakguard/records/json_source.hpp"
#include "leakguard/records/sqlite_source.hpp"
#include "leakguard/runtime/app.hpp"

#include <charconv>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace leakguard::cli {

namespace {

std::string version_string() {
#ifdef LEAKGUARD_VERSION
  std::string version = LEAKGUARD_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef LEAKGUARD_GIT_COMMIT
  const std::string commit = LEAKGUARD_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "leakguard " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || args[i] == short_name) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

/// Remaining arguments joined as text, or stdin when they are empty or a single "-".
std::string text_argument(const std::vector<std::string> &args) {
  if (args.empty() || (args.size() == 1 && args[0] == "-")) {
    return read_stdin_all();
  }
  return join_tokens(args);
}

common::Result<std::size_t> parse_size(const std::string &value) {
  std::size_t parsed = 0;
  const auto *begin = value.data();
  const auto *end = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (ec != std::errc() || ptr != end) {
    return common::Result<std::size_t>::failure("not a non-negative integer: " + value);
  }
  return common::Result<std::size_t>::success(parsed);
}

common::Result<runtime::RuntimeContext> load_context() {
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    return context;
  }
  auto warnings = config::validate_config(context.value().config());
  if (!warnings.ok()) {
    return common::Result<runtime::RuntimeContext>::failure(warnings.error());
  }
  return context;
}

int run_scan(std::vector<std::string> args) {
  std::string document_path;
  std::string entity;
  std::string records_path;
  const bool as_json = take_flag(args, "--json");
  const bool has_entity = take_option(args, "--entity", "-e", entity);
  const bool has_records = take_option(args, "--records", "-r", records_path);
  if (!take_option(args, "--document", "-d", document_path)) {
    std::cerr << "usage: leakguard scan --document <file|-> [--entity NAME] [--records PATH] "
                 "[--json]\n";
    return 1;
  }

  auto context = load_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto &runtime_context = context.value();
  if (has_records) {
    runtime_context.mutable_config().records.path = common::expand_path(records_path);
    runtime_context.mutable_config().records.backend = records::backend_for_path(records_path);
  }
  const auto engine = runtime_context.create_engine();

  std::string document;
  if (document_path == "-") {
    document = read_stdin_all();
  } else {
    auto read = common::read_file(common::expand_path(document_path));
    if (!read.ok()) {
      observability::record_error("scan", read.error());
      std::cerr << read.error() << "\n";
      return 1;
    }
    document = std::move(read.value());
  }

  auto store = runtime_context.load_records();
  if (!store.ok()) {
    std::cerr << store.error() << "\n";
    return 1;
  }

  leak::LeakReport report;
  if (has_entity) {
    const auto *record = store.value().find(entity);
    if (record == nullptr) {
      std::cerr << "unknown entity: " << entity << "\n";
      return 1;
    }
    report = engine.build_leak_report(document, *record);
  } else {
    report = engine.build_leak_report(document, store.value());
  }

  if (as_json) {
    std::cout << leak::report_to_json(report, common::sha256_hex(document)) << "\n";
  } else {
    std::cout << leak::render_report(report);
  }
  return 0;
}

int run_check_input(std::vector<std::string> args) {
  auto context = load_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  const auto engine = context.value().create_engine();
  const auto match = engine.find_injection(text_argument(args));
  if (!match.has_value()) {
    std::cout << "clean\n";
    return 0;
  }
  std::cout << "injection detected (" << security::injection_pass_label(match->pass) << ": "
            << match->label << ")\n";
  return 2;
}

int run_sanitize(std::vector<std::string> args) {
  auto context = load_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  const auto engine = context.value().create_engine();
  std::cout << engine.sanitize_input(text_argument(args)) << "\n";
  return 0;
}

int run_filter_output(std::vector<std::string> args) {
  auto context = load_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  const auto engine = context.value().create_engine();
  std::cout << engine.filter_output(text_argument(args)) << "\n";
  return 0;
}

int run_records(std::vector<std::string> args) {
  if (!args.empty() && args[0] == "import") {
    if (args.size() < 3) {
      std::cerr << "usage: leakguard records import <json> <sqlite>\n";
      return 1;
    }
    records::JsonRecordSource source(common::expand_path(args[1]));
    auto store = source.load();
    if (!store.ok()) {
      std::cerr << store.error() << "\n";
      return 1;
    }
    records::SqliteRecordSource target(common::expand_path(args[2]));
    auto status = target.put_all(store.value());
    if (!status.ok()) {
      std::cerr << status.error() << "\n";
      return 1;
    }
    std::cout << "Imported " << store.value().size() << " records\n";
    return 0;
  }

  auto context = load_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto store = context.value().load_records();
  if (!store.ok()) {
    std::cerr << store.error() << "\n";
    return 1;
  }

  if (args.empty() || args[0] == "list") {
    for (const auto &name : store.value().names()) {
      std::cout << name << "\n";
    }
    return 0;
  }

  if (args[0] == "show") {
    if (args.size() < 2) {
      std::cerr << "usage: leakguard records show <name>\n";
      return 1;
    }
    const std::string name = join_tokens(args, 1);
    const auto *record = store.value().find(name);
    if (record == nullptr) {
      std::cerr << "unknown entity: " << name << "\n";
      return 1;
    }
    std::cout << records::record_to_json(*record) << "\n";
    return 0;
  }

  std::cerr << "unknown records command\n";
  return 1;
}

int run_config_show() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  auto cp = config::config_path();
  if (cp.ok()) {
    std::cout << "Config: " << cp.value().string() << "\n";
  }
  std::cout << "Records: " << cfg.value().records.backend << " " << cfg.value().records.path
            << "\n";
  std::cout << "Input limit: " << cfg.value().guard.max_input_chars << "\n";
  std::cout << "Output limit: " << cfg.value().guard.max_output_chars << "\n";
  std::cout << "Observability: " << cfg.value().observability.backend << "\n";

  auto warnings = config::validate_config(cfg.value());
  if (!warnings.ok()) {
    std::cerr << "invalid: " << warnings.error() << "\n";
    return 1;
  }
  for (const auto &warning : warnings.value()) {
    std::cerr << "warning: " << warning << "\n";
  }
  return 0;
}

int run_config(std::vector<std::string> args) {
  if (args.empty() || args[0] == "show") {
    return run_config_show();
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  if (args[0] == "get") {
    if (args.size() < 2) {
      std::cerr << "usage: leakguard config get <key>\n";
      return 1;
    }
    const std::string &key = args[1];
    if (key == "records.backend") {
      std::cout << cfg.value().records.backend << "\n";
      return 0;
    }
    if (key == "records.path") {
      std::cout << cfg.value().records.path << "\n";
      return 0;
    }
    if (key == "guard.max_input_chars") {
      std::cout << cfg.value().guard.max_input_chars << "\n";
      return 0;
    }
    if (key == "guard.max_output_chars") {
      std::cout << cfg.value().guard.max_output_chars << "\n";
      return 0;
    }
    if (key == "observability.backend") {
      std::cout << cfg.value().observability.backend << "\n";
      return 0;
    }
    std::cerr << "unknown key: " << key << "\n";
    return 1;
  }

  if (args[0] == "set") {
    if (args.size() < 3) {
      std::cerr << "usage: leakguard config set <key> <value>\n";
      return 1;
    }
    const std::string &key = args[1];
    const std::string &value = args[2];
    if (key == "records.backend") {
      cfg.value().records.backend = value;
    } else if (key == "records.path") {
      cfg.value().records.path = value;
    } else if (key == "guard.max_input_chars" || key == "guard.max_output_chars") {
      auto parsed = parse_size(value);
      if (!parsed.ok()) {
        std::cerr << key << ": " << parsed.error() << "\n";
        return 1;
      }
      if (key == "guard.max_input_chars") {
        cfg.value().guard.max_input_chars = parsed.value();
      } else {
        cfg.value().guard.max_output_chars = parsed.value();
      }
    } else if (key == "observability.backend") {
      cfg.value().observability.backend = value;
    } else {
      std::cerr << "unknown key: " << key << "\n";
      return 1;
    }

    auto validated = config::validate_config(cfg.value());
    if (!validated.ok()) {
      std::cerr << validated.error() << "\n";
      return 1;
    }
    auto saved = config::save_config(cfg.value());
    if (!saved.ok()) {
      std::cerr << saved.error() << "\n";
      return 1;
    }
    return 0;
  }

  std::cerr << "unknown config command\n";
  return 1;
}

} // namespace

void print_help() {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *CYAN = "\033[36m";
  constexpr const char *GREEN = "\033[32m";

  std::cout << "\n";
  std::cout << BOLD << CYAN << "  LeakGuard" << RESET << DIM
            << "  confidential leak detection and prompt I/O safety" << RESET << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "leakguard [--config PATH] <command> [options]\n\n";

  std::cout << BOLD << "  SCANNING" << RESET << "\n";
  std::cout << "  " << GREEN << "scan" << RESET << DIM
            << "           --document <file|-> [--entity NAME] [--records PATH] [--json]" << RESET
            << "\n";
  std::cout << "  " << GREEN << "records" << RESET << DIM
            << "        list | show <name> | import <json> <sqlite>" << RESET << "\n\n";

  std::cout << BOLD << "  PROMPT SAFETY" << RESET << "\n";
  std::cout << "  " << GREEN << "check-input" << RESET << DIM
            << "    Detect injection attempts (exit 2 when found)" << RESET << "\n";
  std::cout << "  " << GREEN << "sanitize" << RESET << DIM
            << "       Normalize and redact user input" << RESET << "\n";
  std::cout << "  " << GREEN << "filter-output" << RESET << DIM
            << "  Replace unsafe model output with a refusal" << RESET << "\n\n";

  std::cout << BOLD << "  OTHER" << RESET << "\n";
  std::cout << "  " << GREEN << "config" << RESET << DIM
            << "         show | get <key> | set <key> <value>" << RESET << "\n";
  std::cout << "  " << GREEN << "config-path" << RESET << DIM << "    Print the config file path"
            << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "        Show version" << RESET
            << "\n\n";
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "scan") {
    return run_scan(std::move(args));
  }
  if (subcommand == "check-input") {
    return run_check_input(std::move(args));
  }
  if (subcommand == "sanitize") {
    return run_sanitize(std::move(args));
  }
  if (subcommand == "filter-output") {
    return run_filter_output(std::move(args));
  }
  if (subcommand == "records") {
    return run_records(std::move(args));
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace leakguard::cli
