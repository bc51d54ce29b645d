#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace hitlgate::bridge {

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  std::unordered_map<std::string, std::string> headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;

  /// True when the peer answered with any HTTP status.
  [[nodiscard]] bool answered() const { return !network_error && status != 0; }
};

/// Blocking HTTP/1.1 client. A timeout of 0 waits indefinitely.
class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse get(const std::string &url, std::uint64_t timeout_ms) = 0;
  [[nodiscard]] virtual HttpResponse post_json(const std::string &url, const std::string &body,
                                               std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();

  [[nodiscard]] HttpResponse get(const std::string &url, std::uint64_t timeout_ms) override;
  [[nodiscard]] HttpResponse post_json(const std::string &url, const std::string &body,
                                       std::uint64_t timeout_ms) override;
};

} // namespace hitlgate::bridge
