#include "hitlgate/bridge/leader_client.hpp"

#include "hitlgate/common/fs.hpp"
#include "hitlgate/common/json_util.hpp"

namespace hitlgate::bridge {

LeaderClient::LeaderClient(std::shared_ptr<HttpClient> http, std::string host,
                           const std::uint16_t port)
    : http_(std::move(http)), host_(std::move(host)), port_(port) {}

std::string LeaderClient::endpoint() const { return host_ + ":" + std::to_string(port_); }

std::string LeaderClient::base_url() const { return "http://" + endpoint(); }

std::string LeaderClient::unreachable(const HttpResponse &response) const {
  std::string message = "Leader at " + endpoint() + " unreachable";
  if (!response.network_error_message.empty()) {
    message += ": " + response.network_error_message;
  }
  return message;
}

common::Result<std::vector<dialog::DialogRequest>>
LeaderClient::pending(const std::optional<std::string> &workspace, const std::uint64_t timeout_ms) {
  using Pending = common::Result<std::vector<dialog::DialogRequest>>;
  std::string url = base_url() + "/pending";
  if (workspace.has_value() && !workspace->empty()) {
    url += "?workspace=" + common::url_encode(*workspace);
  }

  const auto response = http_->get(url, timeout_ms);
  if (!response.answered()) {
    return Pending::failure(unreachable(response), common::StatusCode::Unavailable);
  }
  if (response.status != 200) {
    return Pending::failure("GET /pending returned HTTP " + std::to_string(response.status));
  }

  const std::string dialogs = common::json_get_array(response.body, "dialogs");
  if (dialogs.empty()) {
    return Pending::failure("GET /pending returned no dialogs array",
                            common::StatusCode::InvalidArgument);
  }
  std::vector<dialog::DialogRequest> out;
  for (const auto &object : common::json_split_top_level_objects(dialogs)) {
    auto request = dialog::parse_request(object);
    if (request.ok()) {
      out.push_back(std::move(request.value()));
    }
  }
  return Pending::success(std::move(out));
}

common::Status LeaderClient::respond(const std::string &id,
                                     const dialog::DialogResolution &resolution,
                                     const std::uint64_t timeout_ms) {
  const std::string body =
      "{\"dialogId\":" + common::json_quote(id) + "," +
      dialog::resolution_to_json(resolution).substr(1);

  const auto response = http_->post_json(base_url() + "/respond", body, timeout_ms);
  if (!response.answered()) {
    return common::Status::error(unreachable(response), common::StatusCode::Unavailable);
  }
  if (response.status == 404) {
    return common::Status::not_found("Dialog not found: " + id);
  }
  if (response.status != 200) {
    return common::Status::error("POST /respond returned HTTP " + std::to_string(response.status));
  }
  return common::Status::success();
}

common::Result<dialog::DialogResolution> LeaderClient::request_dialog(const std::string &reason,
                                                                      const std::string &workspace) {
  using Resolution = common::Result<dialog::DialogResolution>;
  const std::string body = "{\"reason\":" + common::json_quote(reason) +
                           ",\"workspace\":" + common::json_quote(workspace) + "}";

  const auto response = http_->post_json(base_url() + "/dialog", body, 0);
  if (!response.answered()) {
    return Resolution::failure(unreachable(response), common::StatusCode::Unavailable);
  }
  if (response.status != 200) {
    return Resolution::failure("POST /dialog returned HTTP " + std::to_string(response.status));
  }
  return dialog::parse_resolution(response.body);
}

common::Result<std::string> LeaderClient::health(const std::uint64_t timeout_ms) {
  const auto response = http_->get(base_url() + "/health", timeout_ms);
  if (!response.answered()) {
    return common::Result<std::string>::failure(unreachable(response),
                                                common::StatusCode::Unavailable);
  }
  if (response.status != 200) {
    return common::Result<std::string>::failure("GET /health returned HTTP " +
                                                std::to_string(response.status));
  }
  return common::Result<std::string>::success(response.body);
}

} // namespace hitlgate::bridge
