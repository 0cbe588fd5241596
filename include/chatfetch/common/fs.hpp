#pragma once

#include "chatfetch/common/result.hpp"
#include <filesystem>
#include <string>

namespace chatfetch::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] std::string expand_path(std::string value);

/// Read a whole file. A missing file is reported like any other open failure.
[[nodiscard]] Result<std::string> read_text_file(const std::filesystem::path &path);

} // namespace chatfetch::common
