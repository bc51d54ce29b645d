#pragma once

#include "hitlgate/common/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace hitlgate::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::vector<std::string> split(const std::string &value, char delimiter);

/// Percent-encode everything outside the RFC 3986 unreserved set.
[[nodiscard]] std::string url_encode(const std::string &value);
/// Decode %XX sequences and '+' (form encoding) back to bytes.
[[nodiscard]] std::string url_decode(const std::string &value);

[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);
/// Write via `<path>.tmp` and rename so readers never observe a partial file.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path,
                                       const std::string &content);

} // namespace hitlgate::common
