#pragma once

#include "hitlgate/bridge/http_client.hpp"
#include "hitlgate/common/result.hpp"
#include "hitlgate/dialog/types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hitlgate::bridge {

/// Typed calls against the coordination endpoint owned by the Leader.
class LeaderClient {
public:
  LeaderClient(std::shared_ptr<HttpClient> http, std::string host, std::uint16_t port);

  [[nodiscard]] std::string base_url() const;
  [[nodiscard]] std::string endpoint() const;

  /// GET /pending, filtered by workspace containment when `workspace` is non-empty.
  [[nodiscard]] common::Result<std::vector<dialog::DialogRequest>>
  pending(const std::optional<std::string> &workspace, std::uint64_t timeout_ms);

  /// POST /respond. NotFound when the Leader answers 404, Unavailable when it is unreachable.
  [[nodiscard]] common::Status respond(const std::string &id,
                                       const dialog::DialogResolution &resolution,
                                       std::uint64_t timeout_ms);

  /// POST /dialog, waiting without a deadline for a human decision.
  [[nodiscard]] common::Result<dialog::DialogResolution>
  request_dialog(const std::string &reason, const std::string &workspace);

  /// Raw /health body.
  [[nodiscard]] common::Result<std::string> health(std::uint64_t timeout_ms);

private:
  [[nodiscard]] std::string unreachable(const HttpResponse &response) const;

  std::shared_ptr<HttpClient> http_;
  std::string host_;
  std::uint16_t port_;
};

} // namespace hitlgate::bridge
