#include "test_framework.hpp"

#include "sandshell/common/fs.hpp"
#include "sandshell/common/toml.hpp"
#include "sandshell/config/config.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <sys/stat.h>

namespace {

using sandshell::testing::ConfigOverrideGuard;
using sandshell::testing::EnvGuard;
using sandshell::testing::TempDir;

bool has_warning(const std::vector<std::string> &warnings, const std::string &needle) {
  for (const auto &warning : warnings) {
    if (warning.find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

std::string read_file(const std::filesystem::path &path) {
  std::ifstream in(path);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

} // namespace

void register_config_tests(std::vector<sandshell::tests::TestCase> &tests) {
  using sandshell::tests::require;
  namespace cfg = sandshell::config;
  namespace common = sandshell::common;

  tests.push_back({"toml_parses_sections_strings_and_arrays", [] {
                     const auto doc = common::parse_toml(
                         "# comment\n[sandbox]\nbwrap_path = \"/usr/bin/bwrap\" # trailing\n"
                         "forward_env = [\"LANG\", 'PAGER']\ndrop_capabilities = false\n"
                         "timeout_secs = 30\n");
                     require(doc.ok(), doc.error());
                     require(doc.value().get_string("sandbox.bwrap_path") == "/usr/bin/bwrap",
                             "string value");
                     require(doc.value().get_string_array("sandbox.forward_env") ==
                                 std::vector<std::string>{"LANG", "PAGER"},
                             "string array");
                     require(!doc.value().get_bool("sandbox.drop_capabilities", true), "bool");
                     require(doc.value().get_u64("sandbox.timeout_secs", 0) == 30, "integer");
                   }});

  tests.push_back({"toml_rejects_duplicates_and_multiline_arrays", [] {
                     require(!common::parse_toml("[a]\nx = 1\nx = 2\n").ok(), "duplicate key");
                     require(!common::parse_toml("[a]\nx = [\n\"y\"]\n").ok(), "multi-line array");
                     require(!common::parse_toml("[a]\nx =\n").ok(), "missing value");
                     require(!common::parse_toml("[]\n").ok(), "empty section");
                   }});

  tests.push_back({"toml_quote_round_trips_special_characters", [] {
                     const std::string raw = "a \"quoted\" \\ path";
                     const auto doc = common::parse_toml("v = " + common::quote_toml_string(raw));
                     require(doc.ok(), doc.error());
                     require(doc.value().get_string("v") == raw, "quoted value should survive");
                   }});

  tests.push_back({"config_defaults_are_hardened", [] {
                     const cfg::Config config;
                     require(config.sandbox.drop_capabilities, "capabilities dropped by default");
                     require(config.sandbox.timeout == std::chrono::seconds(60), "60s timeout");
                     require(config.sandbox.bwrap_path == "bwrap", "bwrap from PATH");
                     require(config.sandbox.shell == "/bin/sh", "shell");
                     const auto validation = cfg::validate_config(config);
                     require(validation.ok(), validation.error());
                     require(validation.value().empty(), "defaults should not warn");
                   }});

  tests.push_back({"config_parse_reads_all_sections", [] {
                     const auto parsed = cfg::parse_config(
                         "[sandbox]\ntimeout_secs = 5\ndrop_capabilities = false\n"
                         "forward_env = [\"LANG\"]\nforward_env_prefixes = []\n"
                         "fallback_user = \"nobody\"\n"
                         "[observability]\nbackend = \"none\"\nlevel = \"debug\"\n");
                     require(parsed.ok(), parsed.error());
                     const auto &config = parsed.value();
                     require(config.sandbox.timeout == std::chrono::seconds(5), "timeout");
                     require(!config.sandbox.drop_capabilities, "drop_capabilities");
                     require(config.sandbox.forward_env == std::vector<std::string>{"LANG"},
                             "forward_env");
                     require(config.sandbox.forward_env_prefixes.empty(), "prefixes cleared");
                     require(config.sandbox.fallback_user == "nobody", "fallback_user");
                     require(config.observability.backend == "none", "backend");
                     require(config.observability.level == "debug", "level");
                   }});

  tests.push_back({"config_parse_rejects_unknown_keys", [] {
                     const auto typo = cfg::parse_config("[sandbox]\ndrop_capabilites = false\n");
                     require(!typo.ok(), "misspelled key should be rejected");
                     require(typo.error().find("drop_capabilites") != std::string::npos,
                             "error should name the key");
                     require(!cfg::parse_config("[network]\nallow = true\n").ok(),
                             "unknown section should be rejected");
                     require(!cfg::parse_config("top = 1\n").ok(), "top-level key rejected");
                   }});

  tests.push_back({"config_parse_rejects_bad_values", [] {
                     require(!cfg::parse_config("[sandbox]\ntimeout_secs = -1\n").ok(),
                             "negative timeout");
                     require(!cfg::parse_config("[sandbox]\ntimeout_secs = \"10\"\n").ok(),
                             "quoted timeout");
                     require(!cfg::parse_config("[sandbox]\ndrop_capabilities = yes\n").ok(),
                             "non-boolean switch");
                   }});

  tests.push_back({"config_rejects_timeouts_beyond_ceiling", [] {
                     const auto huge = cfg::parse_config("[sandbox]\ntimeout_secs = 10000000000\n");
                     require(!huge.ok(), "ten billion seconds should be rejected");
                     require(huge.error().find("at most") != std::string::npos, huge.error());

                     const auto wraps =
                         cfg::parse_config("[sandbox]\ntimeout_secs = 18446744073709551615\n");
                     require(!wraps.ok(), "u64 max should be rejected");
                     require(wraps.error().find("at most") != std::string::npos,
                             "should not wrap negative: " + wraps.error());

                     const auto week = cfg::parse_config("[sandbox]\ntimeout_secs = 604800\n");
                     require(week.ok(), week.error());
                     require(week.value().sandbox.timeout == sandshell::sandbox::kMaxTimeout,
                             "the ceiling itself is allowed");

                     auto config = sandshell::testing::quiet_config();
                     config.sandbox.timeout = std::chrono::seconds(10000000000LL);
                     require(!cfg::validate_config(config).ok(), "validate should refuse it too");

                     const EnvGuard env_timeout("SANDSHELL_TIMEOUT_SECS", "10000000000");
                     cfg::Config overridden;
                     cfg::apply_env_overrides(overridden);
                     require(overridden.sandbox.timeout == std::chrono::seconds(60),
                             "oversized override should be ignored");
                   }});

  tests.push_back({"config_validate_failures", [] {
                     auto config = sandshell::testing::quiet_config();
                     config.sandbox.timeout = std::chrono::seconds(0);
                     require(!cfg::validate_config(config).ok(), "zero timeout");

                     config = sandshell::testing::quiet_config();
                     config.sandbox.shell = "sh";
                     require(!cfg::validate_config(config).ok(), "relative shell");

                     config = sandshell::testing::quiet_config();
                     config.sandbox.bwrap_path = "  ";
                     require(!cfg::validate_config(config).ok(), "empty bwrap path");

                     config = sandshell::testing::quiet_config();
                     config.sandbox.forward_env = {"BAD-NAME"};
                     require(!cfg::validate_config(config).ok(), "invalid env name");

                     config = sandshell::testing::quiet_config();
                     config.sandbox.fallback_workdir = "tmp";
                     require(!cfg::validate_config(config).ok(), "relative workdir");

                     config = sandshell::testing::quiet_config();
                     config.observability.backend = "otlp";
                     require(!cfg::validate_config(config).ok(), "unknown backend");

                     config = sandshell::testing::quiet_config();
                     config.observability.level = "loud";
                     require(!cfg::validate_config(config).ok(), "unknown level");
                   }});

  tests.push_back({"config_validate_warnings", [] {
                     auto config = sandshell::testing::quiet_config();
                     config.sandbox.drop_capabilities = false;
                     config.sandbox.forward_env.push_back("SSH_AUTH_SOCK");
                     config.sandbox.forward_env.push_back("GITHUB_TOKEN");
                     config.sandbox.timeout = std::chrono::seconds(7200);
                     const auto validation = cfg::validate_config(config);
                     require(validation.ok(), validation.error());
                     const auto &warnings = validation.value();
                     require(has_warning(warnings, "drop_capabilities"), "cap drop warning");
                     require(has_warning(warnings, "SSH_AUTH_SOCK"), "agent socket warning");
                     require(has_warning(warnings, "GITHUB_TOKEN"), "token warning");
                     require(has_warning(warnings, "hour"), "long timeout warning");
                   }});

  tests.push_back({"config_path_defaults_to_home", [] {
                     const TempDir home;
                     const EnvGuard env_home("HOME", home.path().string());
                     const EnvGuard env_cfg("SANDSHELL_CONFIG_PATH", std::nullopt);
                     const ConfigOverrideGuard guard;
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == home.path() / ".sandshell" / "config.toml",
                             "unexpected path: " + path.value().string());
                   }});

  tests.push_back({"config_path_honours_env_and_override", [] {
                     const TempDir dir;
                     const EnvGuard env_cfg("SANDSHELL_CONFIG_PATH",
                                            (dir.path() / "env.toml").string());
                     {
                       const ConfigOverrideGuard guard;
                       require(cfg::config_path().value() == dir.path() / "env.toml",
                               "env variable should select the file");
                     }
                     const ConfigOverrideGuard guard(dir.path());
                     require(cfg::config_path().value() == dir.path() / "config.toml",
                             "directory override should append config.toml");
                   }});

  tests.push_back({"config_missing_file_yields_defaults", [] {
                     const TempDir dir;
                     const ConfigOverrideGuard guard(dir.path() / "absent.toml");
                     const EnvGuard env_timeout("SANDSHELL_TIMEOUT_SECS", std::nullopt);
                     const EnvGuard env_bwrap("SANDSHELL_BWRAP", std::nullopt);
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().sandbox.timeout == std::chrono::seconds(60),
                             "default timeout expected");
                   }});

  tests.push_back({"config_save_then_load_preserves_values", [] {
                     const TempDir dir;
                     const ConfigOverrideGuard guard(dir.path() / "nested" / "config.toml");
                     const EnvGuard env_timeout("SANDSHELL_TIMEOUT_SECS", std::nullopt);
                     const EnvGuard env_log("SANDSHELL_LOG", std::nullopt);

                     auto config = sandshell::testing::quiet_config();
                     config.sandbox.timeout = std::chrono::seconds(12);
                     config.sandbox.forward_env = {"LANG", "TERM"};
                     config.sandbox.fallback_home = "/home/\"odd\"";
                     const auto saved = cfg::save_config(config);
                     require(saved.ok(), saved.error());
                     require(!std::filesystem::exists(dir.path() / "nested" / "config.toml.tmp"),
                             "temporary file should be renamed away");
                     const auto text = read_file(dir.path() / "nested" / "config.toml");
                     require(text.find("[observability]") != std::string::npos,
                             "both sections should be written");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().sandbox.timeout == std::chrono::seconds(12), "timeout");
                     require(loaded.value().sandbox.forward_env == config.sandbox.forward_env,
                             "forward_env");
                     require(loaded.value().sandbox.fallback_home == "/home/\"odd\"",
                             "escaped string");
                     require(loaded.value().observability.backend == "none", "backend");
                   }});

  tests.push_back({"config_load_reports_path_on_error", [] {
                     const TempDir dir;
                     dir.create_file("config.toml", "[sandbox]\nbogus = 1\n");
                     const ConfigOverrideGuard guard(dir.path() / "config.toml");
                     const auto loaded = cfg::load_config();
                     require(!loaded.ok(), "invalid file should fail");
                     require(loaded.error().find("config.toml") != std::string::npos,
                             "error should name the file");
                   }});

  tests.push_back({"config_env_overrides_apply", [] {
                     const EnvGuard bwrap("SANDSHELL_BWRAP", "/opt/bwrap/bin/bwrap");
                     const EnvGuard timeout("SANDSHELL_TIMEOUT_SECS", "9");
                     const EnvGuard log("SANDSHELL_LOG", "none");
                     const EnvGuard level("SANDSHELL_LOG_LEVEL", "error");
                     cfg::Config config;
                     cfg::apply_env_overrides(config);
                     require(config.sandbox.bwrap_path == "/opt/bwrap/bin/bwrap", "bwrap override");
                     require(config.sandbox.timeout == std::chrono::seconds(9), "timeout override");
                     require(config.observability.backend == "none", "backend override");
                     require(config.observability.level == "error", "level override");
                   }});

  tests.push_back({"config_env_override_ignores_malformed_timeout", [] {
                     const EnvGuard timeout("SANDSHELL_TIMEOUT_SECS", "soon");
                     cfg::Config config;
                     cfg::apply_env_overrides(config);
                     require(config.sandbox.timeout == std::chrono::seconds(60),
                             "malformed override should be ignored");
                   }});

  tests.push_back({"fs_find_executable_searches_path", [] {
                     const TempDir dir;
                     dir.create_file("tool", "#!/bin/sh\n");
                     const auto tool = dir.path() / "tool";
                     chmod(tool.c_str(), 0755);

                     const auto found =
                         common::find_executable("tool", "/nonexistent:" + dir.path().string());
                     require(found.ok(), found.error());
                     require(found.value() == tool, "should resolve into the temp dir");
                     require(!common::find_executable("tool", "/nonexistent").ok(),
                             "absent from PATH");
                     require(common::find_executable(tool.string(), "").ok(),
                             "absolute path bypasses PATH");
                     require(!common::find_executable("", "/bin").ok(), "empty name");
                   }});

  tests.push_back({"fs_env_name_validation", [] {
                     require(common::is_valid_env_name("LC_ALL"), "LC_ALL");
                     require(common::is_valid_env_name("_x1"), "_x1");
                     require(!common::is_valid_env_name("1ABC"), "leading digit");
                     require(!common::is_valid_env_name("A=B"), "equals sign");
                     require(!common::is_valid_env_name(""), "empty");
                   }});

}
