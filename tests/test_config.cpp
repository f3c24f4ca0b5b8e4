#include "test_framework.hpp"

#include "leakguard/common/fs.hpp"
#include "leakguard/config/config.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>
#include <fstream>
#include <random>

namespace {

using leakguard::testing::EnvGuard;

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt) {
    old_override = leakguard::config::config_path_override();
    if (next.has_value()) {
      leakguard::config::set_config_path_override(*next);
    } else {
      leakguard::config::clear_config_path_override();
    }
  }

  ~ConfigOverrideGuard() {
    if (old_override.has_value()) {
      leakguard::config::set_config_path_override(*old_override);
    } else {
      leakguard::config::clear_config_path_override();
    }
  }
};

std::filesystem::path make_temp_home() {
  static std::mt19937_64 rng{std::random_device{}()};
  std::filesystem::path path = std::filesystem::temp_directory_path() /
                               ("leakguard-test-home-" + std::to_string(rng()));
  std::filesystem::create_directories(path);
  return path;
}

void write_file(const std::filesystem::path &path, const std::string &content) {
  std::error_code ec;
  if (!path.parent_path().empty()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  out << content;
}

} // namespace

void register_config_tests(std::vector<leakguard::tests::TestCase> &tests) {
  using leakguard::tests::require;
  namespace cfg = leakguard::config;

  tests.push_back({"config_path_under_home", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const EnvGuard env_cfg("LEAKGUARD_CONFIG_PATH", std::nullopt);
                     const ConfigOverrideGuard cfg_override;
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == home / ".leakguard" / "config.toml",
                             "unexpected config path: " + path.value().string());
                   }});

  tests.push_back({"load_config_missing_file_returns_defaults", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const EnvGuard env_cfg("LEAKGUARD_CONFIG_PATH", std::nullopt);
                     const EnvGuard env_records("LEAKGUARD_RECORDS_PATH", std::nullopt);
                     const ConfigOverrideGuard cfg_override;

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().records.backend == "json", "default backend is json");
                     require(loaded.value().records.path ==
                                 (home / ".leakguard" / "company_database.json").string(),
                             "default records path should expand: " + loaded.value().records.path);
                     require(loaded.value().guard.max_input_chars == 10000, "input limit");
                     require(loaded.value().guard.max_output_chars == 5000, "output limit");
                   }});

  tests.push_back({"load_config_valid_toml", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const EnvGuard env_path("LEAKGUARD_RECORDS_PATH", std::nullopt);
                     const EnvGuard env_backend("LEAKGUARD_RECORDS_BACKEND", std::nullopt);
                     const EnvGuard env_observer("LEAKGUARD_OBSERVABILITY", std::nullopt);
                     const ConfigOverrideGuard cfg_override(home / "custom.toml");

                     write_file(home / "custom.toml", R"(
[records]
backend = "sqlite"
path = "~/records.db"

[guard]
max_input_chars = 2_000
max_output_chars = 800

[observability]
backend = "none"
)");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().records.backend == "sqlite", "backend mismatch");
                     require(loaded.value().records.path == (home / "records.db").string(),
                             "path should expand tilde");
                     require(loaded.value().guard.max_input_chars == 2000, "input limit mismatch");
                     require(loaded.value().guard.max_output_chars == 800, "output limit mismatch");
                     require(loaded.value().observability.backend == "none", "observer mismatch");
                   }});

  tests.push_back({"config_env_overrides", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const ConfigOverrideGuard cfg_override(home / "absent.toml");
                     const EnvGuard env_path("LEAKGUARD_RECORDS_PATH",
                                             std::optional<std::string>("/srv/records.json"));
                     const EnvGuard env_backend("LEAKGUARD_RECORDS_BACKEND",
                                                std::optional<std::string>("sqlite"));
                     const EnvGuard env_observer("LEAKGUARD_OBSERVABILITY",
                                                 std::optional<std::string>("log,none"));

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().records.path == "/srv/records.json", "path override");
                     require(loaded.value().records.backend == "sqlite", "backend override");
                     require(loaded.value().observability.backend == "log,none", "observer override");
                   }});

  tests.push_back({"config_env_path_override", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const ConfigOverrideGuard cfg_override;
                     const EnvGuard env_cfg("LEAKGUARD_CONFIG_PATH",
                                            std::optional<std::string>((home / "env.toml").string()));
                     const auto path = cfg::config_path();
                     require(path.ok() && path.value() == home / "env.toml",
                             "env config path should win");
                   }});

  tests.push_back({"config_invalid_toml_fails", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const ConfigOverrideGuard cfg_override(home / "broken.toml");
                     write_file(home / "broken.toml", "[records]\nthis line has no equals\n");
                     require(!cfg::load_config().ok(), "malformed toml should fail");
                   }});

  tests.push_back({"config_validate_rejects_bad_values", [] {
                     cfg::Config config;
                     config.records.backend = "csv";
                     require(!cfg::validate_config(config).ok(), "unknown backend should fail");

                     config = cfg::Config{};
                     config.guard.max_input_chars = 0;
                     require(!cfg::validate_config(config).ok(), "zero input limit should fail");

                     config = cfg::Config{};
                     config.guard.max_output_chars = 0;
                     require(!cfg::validate_config(config).ok(), "zero output limit should fail");

                     config = cfg::Config{};
                     config.observability.backend = "prometheus";
                     require(!cfg::validate_config(config).ok(), "unknown observer should fail");

                     config = cfg::Config{};
                     config.records.path = "   ";
                     require(!cfg::validate_config(config).ok(), "blank path should fail");
                   }});

  tests.push_back({"config_validate_warns_on_missing_records", [] {
                     cfg::Config config;
                     config.records.path = "/definitely/not/here/company.json";
                     const auto warnings = cfg::validate_config(config);
                     require(warnings.ok(), warnings.error());
                     require(warnings.value().size() == 1, "expected one warning");
                     require(leakguard::common::contains(warnings.value()[0], "records.path"),
                             "warning should name the key");
                   }});
}
