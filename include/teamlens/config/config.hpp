#pragma once

#include "teamlens/common/result.hpp"
#include "teamlens/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace teamlens::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml);

[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);
void expand_config_paths(Config &config);

[[nodiscard]] std::string describe_config(const Config &config);

} // namespace teamlens::config
