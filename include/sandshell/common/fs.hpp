#pragma once

#include "sandshell/common/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace sandshell::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(std::string_view value, std::string_view prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// True for names usable as environment variables: [A-Za-z_][A-Za-z0-9_]*.
[[nodiscard]] bool is_valid_env_name(std::string_view name);

/// Resolves `name` the way execvp would: names containing a slash are taken as
/// paths, anything else is searched in the colon-separated `search_path`.
[[nodiscard]] Result<std::filesystem::path> find_executable(const std::string &name,
                                                            const std::string &search_path);

} // namespace sandshell::common
