#pragma once

#include "sandshell/common/result.hpp"
#include "sandshell/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sandshell::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Parses config.toml content on top of the defaults. Unknown keys in known
/// sections are rejected so a misspelled hardening switch cannot go unnoticed.
[[nodiscard]] common::Result<Config> parse_config(const std::string &content);

/// Reads the config file if present, then applies SANDSHELL_* overrides.
[[nodiscard]] common::Result<Config> load_config();
/// Serializes every key, defaults included, in config.toml syntax.
[[nodiscard]] std::string render_config(const Config &config);
[[nodiscard]] common::Status save_config(const Config &config);

/// Hard errors fail the result; soft findings come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace sandshell::config
