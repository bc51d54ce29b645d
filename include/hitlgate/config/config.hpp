#pragma once

#include "hitlgate/common/result.hpp"
#include "hitlgate/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace hitlgate::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Resolved snapshot / archive locations (config value, or a file in config_dir()).
[[nodiscard]] common::Result<std::filesystem::path> snapshot_path(const Config &config);
[[nodiscard]] common::Result<std::filesystem::path> archive_path(const Config &config);

[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Status save_config(const Config &config);

/// Hard errors fail; soft problems come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace hitlgate::config
