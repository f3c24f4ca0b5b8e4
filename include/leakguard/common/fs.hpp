#pragma once

#include "leakguard/common/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace leakguard::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] bool ends_with(const std::string &value, const std::string &suffix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] bool contains(const std::string &haystack, const std::string &needle);
[[nodiscard]] std::vector<std::string> split_whitespace(const std::string &input);

[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

} // namespace leakguard::common
