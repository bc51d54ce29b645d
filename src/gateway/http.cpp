#include "hitlgate/gateway/http.hpp"

#include "hitlgate/common/fs.hpp"

#include <array>
#include <charconv>
#include <sstream>
#include <sys/socket.h>
#include <sys/types.h>

namespace hitlgate::gateway {

namespace {

constexpr std::size_t kMaxHeaderBytes = 16 * 1024;

std::optional<std::size_t> parse_content_length(const std::string &value) {
  const std::string trimmed = common::trim(value);
  std::size_t length = 0;
  const auto *first = trimmed.data();
  const auto *last = first + trimmed.size();
  auto [ptr, ec] = std::from_chars(first, last, length);
  if (ec != std::errc() || ptr != last || trimmed.empty()) {
    return std::nullopt;
  }
  return length;
}

} // namespace

std::string status_text(const int status) {
  switch (status) {
  case 200:
    return "OK";
  case 202:
    return "Accepted";
  case 204:
    return "No Content";
  case 400:
    return "Bad Request";
  case 404:
    return "Not Found";
  case 413:
    return "Payload Too Large";
  case 500:
    return "Internal Server Error";
  default:
    return "OK";
  }
}

std::unordered_map<std::string, std::string> parse_query_string(const std::string &query) {
  std::unordered_map<std::string, std::string> out;
  for (const auto &part : common::split(query, '&')) {
    if (part.empty()) {
      continue;
    }
    const auto eq = part.find('=');
    if (eq == std::string::npos) {
      out[common::url_decode(part)] = "";
      continue;
    }
    out[common::url_decode(part.substr(0, eq))] = common::url_decode(part.substr(eq + 1));
  }
  return out;
}

common::Result<HttpRequest> parse_http_request(const std::string &raw) {
  const auto header_end = raw.find("\r\n\r\n");
  if (header_end == std::string::npos) {
    return common::Result<HttpRequest>::failure("incomplete request",
                                                common::StatusCode::InvalidArgument);
  }

  std::istringstream head_stream(raw.substr(0, header_end));
  std::string line;
  if (!std::getline(head_stream, line)) {
    return common::Result<HttpRequest>::failure("missing request line",
                                                common::StatusCode::InvalidArgument);
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }

  std::istringstream req_line(line);
  HttpRequest request;
  std::string http_version;
  if (!(req_line >> request.method >> request.raw_path >> http_version)) {
    return common::Result<HttpRequest>::failure("invalid request line",
                                                common::StatusCode::InvalidArgument);
  }

  while (std::getline(head_stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    const auto colon = line.find(':');
    if (line.empty() || colon == std::string::npos) {
      continue;
    }
    request.headers[common::to_lower(common::trim(line.substr(0, colon)))] =
        common::trim(line.substr(colon + 1));
  }

  request.body = raw.substr(header_end + 4);
  const auto qpos = request.raw_path.find('?');
  if (qpos == std::string::npos) {
    request.path = request.raw_path;
  } else {
    request.path = request.raw_path.substr(0, qpos);
    request.query = parse_query_string(request.raw_path.substr(qpos + 1));
  }
  return common::Result<HttpRequest>::success(std::move(request));
}

std::string header_lookup(const HttpRequest &request, const std::string &key) {
  const auto it = request.headers.find(common::to_lower(key));
  return it == request.headers.end() ? "" : it->second;
}

HttpResponse make_json_response(const int status, const std::string &body) {
  HttpResponse response;
  response.status = status;
  response.body = body;
  apply_cors(response);
  return response;
}

HttpResponse make_empty_response(const int status) {
  HttpResponse response;
  response.status = status;
  response.content_type.clear();
  apply_cors(response);
  return response;
}

void apply_cors(HttpResponse &response) {
  response.headers["Access-Control-Allow-Origin"] = "*";
  response.headers["Access-Control-Allow-Methods"] = "GET, POST, OPTIONS";
  response.headers["Access-Control-Allow-Headers"] = "Content-Type";
}

std::string render_http_response(const HttpResponse &response) {
  std::ostringstream out;
  out << "HTTP/1.1 " << response.status << " " << status_text(response.status) << "\r\n";
  if (!response.content_type.empty()) {
    out << "Content-Type: " << response.content_type << "\r\n";
  }
  out << "Content-Length: " << response.body.size() << "\r\n";
  out << "Connection: close\r\n";
  for (const auto &[k, v] : response.headers) {
    out << k << ": " << v << "\r\n";
  }
  out << "\r\n";
  out << response.body;
  return out.str();
}

ReadResult read_http_request(const int fd, const std::size_t max_body_bytes) {
  std::string raw;
  raw.reserve(4096);
  std::array<char, 4096> buf{};

  std::size_t header_end = std::string::npos;
  std::size_t content_length = 0;
  while (true) {
    if (header_end != std::string::npos && raw.size() >= header_end + 4 + content_length) {
      break;
    }
    const ssize_t n = recv(fd, buf.data(), buf.size(), 0);
    if (n <= 0) {
      if (raw.empty()) {
        return ReadResult{};
      }
      return ReadResult{.request = std::nullopt, .error_status = 400};
    }
    raw.append(buf.data(), static_cast<std::size_t>(n));

    if (header_end == std::string::npos) {
      header_end = raw.find("\r\n\r\n");
      if (header_end == std::string::npos) {
        if (raw.size() > kMaxHeaderBytes) {
          return ReadResult{.request = std::nullopt, .error_status = 400};
        }
        continue;
      }
      auto head = parse_http_request(raw.substr(0, header_end + 4));
      if (!head.ok()) {
        return ReadResult{.request = std::nullopt, .error_status = 400};
      }
      const std::string cl = header_lookup(head.value(), "content-length");
      if (!cl.empty()) {
        const auto parsed = parse_content_length(cl);
        if (!parsed.has_value()) {
          return ReadResult{.request = std::nullopt, .error_status = 400};
        }
        content_length = *parsed;
      }
      if (content_length > max_body_bytes) {
        return ReadResult{.request = std::nullopt, .error_status = 413};
      }
    }
  }

  auto parsed = parse_http_request(raw.substr(0, header_end + 4 + content_length));
  if (!parsed.ok()) {
    return ReadResult{.request = std::nullopt, .error_status = 400};
  }
  return ReadResult{.request = std::move(parsed.value()), .error_status = 0};
}

bool send_all(const int fd, const std::string &data) {
  std::size_t sent = 0;
  while (sent < data.size()) {
    const ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (n <= 0) {
      return false;
    }
    sent += static_cast<std::size_t>(n);
  }
  return true;
}

} // namespace hitlgate::gateway
