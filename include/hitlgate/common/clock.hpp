#pragma once

#include <cstdint>
#include <string>

namespace hitlgate::common {

/// UTC wall clock as `YYYY-MM-DDTHH:MM:SSZ`.
[[nodiscard]] std::string now_rfc3339();
[[nodiscard]] std::string format_rfc3339(std::int64_t unix_ms);
[[nodiscard]] std::int64_t now_unix_ms();

/// Hex string of `bytes` bytes from the OpenSSL CSPRNG.
[[nodiscard]] std::string random_hex(std::size_t bytes);

} // namespace hitlgate::common
