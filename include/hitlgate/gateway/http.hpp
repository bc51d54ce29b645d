#pragma once

#include "hitlgate/common/result.hpp"

#include <optional>
#include <string>
#include <unordered_map>

namespace hitlgate::gateway {

struct HttpRequest {
  std::string method;
  std::string path;
  std::string raw_path;
  std::unordered_map<std::string, std::string> headers;
  std::unordered_map<std::string, std::string> query;
  std::string body;
};

struct HttpResponse {
  int status = 200;
  std::string content_type = "application/json";
  std::string body;
  std::unordered_map<std::string, std::string> headers;
};

/// Outcome of reading one request from a socket. `error_status` is 400 or 413 when no
/// request could be produced, 0 when the peer closed before sending anything.
struct ReadResult {
  std::optional<HttpRequest> request;
  int error_status = 0;
};

[[nodiscard]] std::string status_text(int status);
[[nodiscard]] std::unordered_map<std::string, std::string>
parse_query_string(const std::string &query);
[[nodiscard]] common::Result<HttpRequest> parse_http_request(const std::string &raw);
[[nodiscard]] std::string header_lookup(const HttpRequest &request, const std::string &key);

[[nodiscard]] HttpResponse make_json_response(int status, const std::string &body);
[[nodiscard]] HttpResponse make_empty_response(int status);
/// Adds the permissive CORS headers every coordination response carries.
void apply_cors(HttpResponse &response);
[[nodiscard]] std::string render_http_response(const HttpResponse &response);

/// Blocking read of one request with its body, refusing bodies over `max_body_bytes`.
[[nodiscard]] ReadResult read_http_request(int fd, std::size_t max_body_bytes);
/// Writes the whole buffer; false once the peer is gone. Never raises SIGPIPE.
[[nodiscard]] bool send_all(int fd, const std::string &data);

} // namespace hitlgate::gateway
