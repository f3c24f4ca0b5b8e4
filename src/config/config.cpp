#include "leakguard/config/config.hpp"

#include "leakguard/common/fs.hpp"
#include "leakguard/common/toml.hpp"

#include <cstdlib>
#include <fstream>

namespace leakguard::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".leakguard";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("LEAKGUARD_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

bool is_known_records_backend(const std::string &backend) {
  const std::string normalized = common::to_lower(common::trim(backend));
  return normalized == "json" || normalized == "sqlite";
}

bool is_known_observer_backend(const std::string &backend) {
  const std::string normalized = common::to_lower(common::trim(backend));
  return normalized.empty() || normalized == "none" || normalized == "noop" ||
         normalized == "log" || normalized.find(',') != std::string::npos;
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (auto override_path = resolved_config_path_override(); override_path.has_value()) {
    return common::Result<std::filesystem::path>::success(override_path->parent_path());
  }
  auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (auto override_path = resolved_config_path_override(); override_path.has_value()) {
    return common::Result<std::filesystem::path>::success(*override_path);
  }
  auto dir = config_dir();
  if (!dir.ok()) {
    return common::Result<std::filesystem::path>::failure(dir.error());
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  return path.ok() && std::filesystem::exists(path.value());
}

std::optional<std::filesystem::path> config_path_override() { return g_config_path_override; }

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

void apply_env_overrides(Config &config) {
  if (const char *path = std::getenv("LEAKGUARD_RECORDS_PATH"); path != nullptr && *path) {
    config.records.path = common::expand_path(path);
  }
  if (const char *backend = std::getenv("LEAKGUARD_RECORDS_BACKEND");
      backend != nullptr && *backend) {
    config.records.backend = backend;
  }
  if (const char *observer = std::getenv("LEAKGUARD_OBSERVABILITY");
      observer != nullptr && *observer) {
    config.observability.backend = observer;
  }
}

common::Result<Config> parse_config(const std::string &toml) {
  const auto parsed = common::parse_toml(toml);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  config.records.backend = doc.get_string("records.backend", config.records.backend);
  config.records.path = expand_config_value(doc.get_string("records.path", config.records.path));
  config.guard.max_input_chars = static_cast<std::size_t>(
      doc.get_u64("guard.max_input_chars", config.guard.max_input_chars));
  config.guard.max_output_chars = static_cast<std::size_t>(
      doc.get_u64("guard.max_output_chars", config.guard.max_output_chars));
  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    config.records.path = common::expand_path(config.records.path);
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  auto config = parse_config(content.value());
  if (!config.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + config.error());
  }
  config.value().records.path = common::expand_path(config.value().records.path);
  apply_env_overrides(config.value());
  return config;
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error());
  }

  const std::filesystem::path path = cfg_path_result.value();
  if (!path.parent_path().empty()) {
    std::error_code ensure_ec;
    std::filesystem::create_directories(path.parent_path(), ensure_ec);
    if (ensure_ec) {
      return common::Status::error("Failed to create config directory: " + ensure_ec.message());
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error("Unable to write temporary config file");
  }

  file << "[records]\n";
  file << "backend = " << common::quote_toml_string(config.records.backend) << "\n";
  file << "path = " << common::quote_toml_string(config.records.path) << "\n";

  file << "\n[guard]\n";
  file << "max_input_chars = " << config.guard.max_input_chars << "\n";
  file << "max_output_chars = " << config.guard.max_output_chars << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  file.close();
  if (!file) {
    return common::Status::error("Failed to flush temporary config file");
  }

  std::error_code rename_ec;
  std::filesystem::rename(tmp_path, path, rename_ec);
  if (rename_ec) {
    return common::Status::error("Failed to replace config file: " + rename_ec.message());
  }
  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (!is_known_records_backend(config.records.backend)) {
    return common::Result<std::vector<std::string>>::failure("Invalid records.backend: " +
                                                              config.records.backend);
  }
  if (common::trim(config.records.path).empty()) {
    return common::Result<std::vector<std::string>>::failure("records.path must not be empty");
  }
  if (config.guard.max_input_chars == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "guard.max_input_chars must be greater than zero");
  }
  if (config.guard.max_output_chars == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "guard.max_output_chars must be greater than zero");
  }
  if (!is_known_observer_backend(config.observability.backend)) {
    return common::Result<std::vector<std::string>>::failure("Invalid observability.backend: " +
                                                              config.observability.backend);
  }

  std::error_code ec;
  if (!std::filesystem::exists(common::expand_path(config.records.path), ec)) {
    warnings.push_back("records.path does not exist yet: " + config.records.path);
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace leakguard::config
