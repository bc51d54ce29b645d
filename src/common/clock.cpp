#include "hitlgate/common/clock.hpp"

#include <openssl/rand.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <vector>

namespace hitlgate::common {

std::string format_rfc3339(const std::int64_t unix_ms) {
  const auto t = static_cast<std::time_t>(unix_ms / 1000);
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

std::string now_rfc3339() { return format_rfc3339(now_unix_ms()); }

std::int64_t now_unix_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string random_hex(const std::size_t bytes) {
  std::vector<unsigned char> data(bytes);
  if (RAND_bytes(data.data(), static_cast<int>(data.size())) != 1) {
    // Entropy pool not ready; ids only need process-level uniqueness.
    static thread_local std::mt19937_64 fallback{std::random_device{}()};
    for (auto &byte : data) {
      byte = static_cast<unsigned char>(fallback() & 0xFFu);
    }
  }

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const auto byte : data) {
    stream << std::setw(2) << static_cast<int>(byte);
  }
  return stream.str();
}

} // namespace hitlgate::common
