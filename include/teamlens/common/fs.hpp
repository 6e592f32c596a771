#pragma once

#include "teamlens/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace teamlens::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] bool ends_with(const std::string &value, const std::string &suffix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] bool is_subpath(const std::filesystem::path &candidate,
                             const std::filesystem::path &parent);

/// Read a whole file. Missing, unreadable and empty files are failures.
[[nodiscard]] Result<std::string> read_text_file(const std::filesystem::path &path);

[[nodiscard]] std::string now_rfc3339();
[[nodiscard]] std::int64_t now_epoch_ms();

} // namespace teamlens::common
