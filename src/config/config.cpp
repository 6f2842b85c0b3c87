#include "sandshell/config/config.hpp"

#include "sandshell/common/fs.hpp"
#include "sandshell/common/toml.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

namespace sandshell::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".sandshell";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr std::uint64_t kLongTimeoutSecs = 3600;
std::optional<std::filesystem::path> g_config_path_override;

const std::vector<std::string> &sandbox_keys() {
  static const std::vector<std::string> keys = {
      "bwrap_path",    "timeout_secs",  "drop_capabilities", "forward_env",
      "forward_env_prefixes", "fallback_path", "fallback_home",    "fallback_user",
      "fallback_workdir",     "shell"};
  return keys;
}

const std::vector<std::string> &observability_keys() {
  static const std::vector<std::string> keys = {"backend", "level"};
  return keys;
}

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("SANDSHELL_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::optional<std::uint64_t> parse_u64(const std::string &raw) {
  const std::string value = common::trim(raw);
  std::uint64_t parsed = 0;
  const auto *first = value.data();
  const auto *last = first + value.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (value.empty() || ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

bool looks_secret(const std::string &name) {
  static const std::vector<std::string> markers = {"TOKEN", "SECRET", "PASSWORD", "PASSWD",
                                                   "CREDENTIAL", "_KEY", "AUTH_SOCK",
                                                   "GPG_AGENT"};
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return std::any_of(markers.begin(), markers.end(), [&](const std::string &marker) {
    return upper.find(marker) != std::string::npos;
  });
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

std::string string_array_to_toml(const std::vector<std::string> &values) {
  std::ostringstream stream;
  stream << '[';
  for (std::size_t index = 0; index < values.size(); ++index) {
    if (index > 0) {
      stream << ", ";
    }
    stream << common::quote_toml_string(values[index]);
  }
  stream << ']';
  return stream.str();
}

common::Status reject_unknown_keys(const common::TomlDocument &doc) {
  for (const auto &[key, _] : doc.values) {
    if (!common::starts_with(key, "sandbox.") && !common::starts_with(key, "observability.")) {
      return common::Status::error("Unknown config key: " + key);
    }
  }
  if (const auto unknown = doc.unknown_keys("sandbox", sandbox_keys()); !unknown.empty()) {
    return common::Status::error("Unknown config key: " + unknown.front());
  }
  if (const auto unknown = doc.unknown_keys("observability", observability_keys());
      !unknown.empty()) {
    return common::Status::error("Unknown config key: " + unknown.front());
  }
  return common::Status::success();
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (const char *bwrap = std::getenv("SANDSHELL_BWRAP"); bwrap != nullptr && *bwrap) {
    config.sandbox.bwrap_path = common::expand_path(bwrap);
  }

  if (const char *timeout = std::getenv("SANDSHELL_TIMEOUT_SECS"); timeout != nullptr && *timeout) {
    if (const auto secs = parse_u64(timeout);
        secs.has_value() && *secs <= static_cast<std::uint64_t>(sandbox::kMaxTimeout.count())) {
      config.sandbox.timeout = std::chrono::seconds(*secs);
    }
  }

  if (const char *backend = std::getenv("SANDSHELL_LOG"); backend != nullptr && *backend) {
    config.observability.backend = backend;
  }

  if (const char *level = std::getenv("SANDSHELL_LOG_LEVEL"); level != nullptr && *level) {
    config.observability.level = level;
  }
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();
  if (auto known = reject_unknown_keys(doc); !known.ok()) {
    return common::Result<Config>::failure(known.error());
  }

  Config config;
  auto &sandbox = config.sandbox;
  sandbox.bwrap_path = common::expand_path(doc.get_string("sandbox.bwrap_path", sandbox.bwrap_path));
  if (doc.has("sandbox.timeout_secs")) {
    const auto secs = parse_u64(doc.values.at("sandbox.timeout_secs"));
    if (!secs.has_value()) {
      return common::Result<Config>::failure("sandbox.timeout_secs must be a non-negative integer");
    }
    if (*secs > static_cast<std::uint64_t>(sandbox::kMaxTimeout.count())) {
      return common::Result<Config>::failure("sandbox.timeout_secs must be at most " +
                                             std::to_string(sandbox::kMaxTimeout.count()));
    }
    sandbox.timeout = std::chrono::seconds(*secs);
  }
  if (doc.has("sandbox.drop_capabilities")) {
    const std::string raw = common::to_lower(common::trim(doc.values.at("sandbox.drop_capabilities")));
    if (raw != "true" && raw != "false") {
      return common::Result<Config>::failure("sandbox.drop_capabilities must be true or false");
    }
    sandbox.drop_capabilities = doc.get_bool("sandbox.drop_capabilities", true);
  }
  sandbox.forward_env = doc.get_string_array("sandbox.forward_env", sandbox.forward_env);
  sandbox.forward_env_prefixes =
      doc.get_string_array("sandbox.forward_env_prefixes", sandbox.forward_env_prefixes);
  sandbox.fallback_path = doc.get_string("sandbox.fallback_path", sandbox.fallback_path);
  sandbox.fallback_home = doc.get_string("sandbox.fallback_home", sandbox.fallback_home);
  sandbox.fallback_user = doc.get_string("sandbox.fallback_user", sandbox.fallback_user);
  sandbox.fallback_workdir = doc.get_string("sandbox.fallback_workdir", sandbox.fallback_workdir);
  sandbox.shell = doc.get_string("sandbox.shell", sandbox.shell);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.observability.level = doc.get_string("observability.level", config.observability.level);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto config = parse_config(buffer.str());
  if (!config.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + config.error());
  }

  apply_env_overrides(config.value());
  return config;
}

std::string render_config(const Config &config) {
  std::ostringstream out;
  const auto &sandbox = config.sandbox;
  out << "[sandbox]\n";
  out << "bwrap_path = " << common::quote_toml_string(sandbox.bwrap_path) << "\n";
  out << "timeout_secs = " << sandbox.timeout.count() << "\n";
  out << "drop_capabilities = " << bool_to_toml(sandbox.drop_capabilities) << "\n";
  out << "forward_env = " << string_array_to_toml(sandbox.forward_env) << "\n";
  out << "forward_env_prefixes = " << string_array_to_toml(sandbox.forward_env_prefixes) << "\n";
  out << "fallback_path = " << common::quote_toml_string(sandbox.fallback_path) << "\n";
  out << "fallback_home = " << common::quote_toml_string(sandbox.fallback_home) << "\n";
  out << "fallback_user = " << common::quote_toml_string(sandbox.fallback_user) << "\n";
  out << "fallback_workdir = " << common::quote_toml_string(sandbox.fallback_workdir) << "\n";
  out << "shell = " << common::quote_toml_string(sandbox.shell) << "\n";

  out << "\n[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  out << "level = " << common::quote_toml_string(config.observability.level) << "\n";
  return out.str();
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error());
  }

  const std::filesystem::path path = cfg_path_result.value();
  if (!path.parent_path().empty()) {
    if (auto ensured = common::ensure_dir(path.parent_path()); !ensured.ok()) {
      return common::Status::error(ensured.error());
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  {
    std::ofstream file(tmp_path, std::ios::trunc);
    if (!file) {
      return common::Status::error("Unable to write temporary config file: " + tmp_path.string());
    }

    file << render_config(config);
    file.flush();
    if (!file) {
      return common::Status::error("Failed to write config file: " + tmp_path.string());
    }
  }

  if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
    const std::string reason = std::strerror(errno);
    std::error_code ec;
    std::filesystem::remove(tmp_path, ec);
    return common::Status::error("Failed to replace config file: " + reason);
  }
  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;
  const auto &sandbox = config.sandbox;

  if (sandbox.timeout.count() <= 0) {
    return common::Result<std::vector<std::string>>::failure(
        "sandbox.timeout_secs must be greater than 0");
  }
  if (sandbox.timeout > sandbox::kMaxTimeout) {
    return common::Result<std::vector<std::string>>::failure(
        "sandbox.timeout_secs must be at most " + std::to_string(sandbox::kMaxTimeout.count()));
  }
  if (static_cast<std::uint64_t>(sandbox.timeout.count()) > kLongTimeoutSecs) {
    warnings.push_back("sandbox.timeout_secs is longer than an hour");
  }

  if (common::trim(sandbox.bwrap_path).empty()) {
    return common::Result<std::vector<std::string>>::failure("sandbox.bwrap_path is empty");
  }

  if (!common::starts_with(sandbox.shell, "/")) {
    return common::Result<std::vector<std::string>>::failure(
        "sandbox.shell must be an absolute path: " + sandbox.shell);
  }

  if (!common::starts_with(sandbox.fallback_workdir, "/")) {
    return common::Result<std::vector<std::string>>::failure(
        "sandbox.fallback_workdir must be an absolute path: " + sandbox.fallback_workdir);
  }

  for (const auto &name : sandbox.forward_env) {
    if (!common::is_valid_env_name(name)) {
      return common::Result<std::vector<std::string>>::failure(
          "sandbox.forward_env has an invalid name: " + name);
    }
    if (looks_secret(name)) {
      warnings.push_back("sandbox.forward_env forwards a secret-looking variable: " + name);
    }
  }

  for (const auto &prefix : sandbox.forward_env_prefixes) {
    if (!common::is_valid_env_name(prefix)) {
      return common::Result<std::vector<std::string>>::failure(
          "sandbox.forward_env_prefixes has an invalid prefix: " + prefix);
    }
  }

  if (!sandbox.drop_capabilities) {
    warnings.push_back("sandbox.drop_capabilities is disabled");
  }

  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend != "log" && backend != "none" && backend != "noop") {
    return common::Result<std::vector<std::string>>::failure("Invalid observability.backend: " +
                                                              config.observability.backend);
  }

  const std::string level = common::to_lower(common::trim(config.observability.level));
  if (level != "debug" && level != "info" && level != "warn" && level != "error") {
    return common::Result<std::vector<std::string>>::failure("Invalid observability.level: " +
                                                              config.observability.level);
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace sandshell::config
