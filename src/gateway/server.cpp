#include "hitlgate/gateway/server.hpp"

#include "hitlgate/common/fs.hpp"
#include "hitlgate/common/json_util.hpp"
#include "hitlgate/health/health.hpp"

#include <arpa/inet.h>
#include <array>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <netinet/in.h>
#include <sstream>
#include <sys/socket.h>
#include <unistd.h>

namespace hitlgate::gateway {

namespace {

constexpr const char *kInvalidRequest = R"({"error":"Invalid request"})";

bool is_json_object(const std::string &body) {
  const std::size_t pos = common::json_skip_ws(body, 0);
  return pos < body.size() && body[pos] == '{' && common::json_is_valid(body);
}

bool is_message_path(const std::string &path) {
  return path == "/mcp" || common::starts_with(path, "/message");
}

} // namespace

struct CoordinationServer::Context {
  std::shared_ptr<dialog::PendingRegistry> registry;
  std::shared_ptr<rpc::RpcHandler> handler;
  std::shared_ptr<StreamHub> hub;
  ServerOptions options;
  std::atomic<std::uint16_t> bound_port{0};

  HttpResponse dispatch(const HttpRequest &request);
  void handle_client(int client_fd);
  void serve_stream(int client_fd);

  HttpResponse handle_rpc(const HttpRequest &request, bool broadcast, int notification_status);
  HttpResponse handle_health() const;
  HttpResponse handle_dialog(const HttpRequest &request);
  HttpResponse handle_pending(const HttpRequest &request) const;
  HttpResponse handle_respond(const HttpRequest &request);
};

HttpResponse CoordinationServer::Context::dispatch(const HttpRequest &request) {
  if (request.method == "OPTIONS") {
    return make_empty_response(200);
  }
  if (request.method == "POST") {
    if (is_message_path(request.path)) {
      return handle_rpc(request, true, 204);
    }
    if (request.path == "/sse") {
      return handle_rpc(request, false, 202);
    }
    if (request.path == "/dialog") {
      return handle_dialog(request);
    }
    if (request.path == "/respond") {
      return handle_respond(request);
    }
  }
  if (request.method == "GET") {
    if (request.path == "/health") {
      return handle_health();
    }
    if (request.path == "/pending") {
      return handle_pending(request);
    }
  }
  return make_json_response(404, R"({"error":"not found"})");
}

HttpResponse CoordinationServer::Context::handle_rpc(const HttpRequest &request,
                                                     const bool broadcast,
                                                     const int notification_status) {
  const auto reply = handler->handle(request.body);
  switch (reply.kind) {
  case rpc::RpcReply::Kind::ParseError:
    return make_json_response(400, reply.body);
  case rpc::RpcReply::Kind::Notification:
    return make_empty_response(notification_status);
  case rpc::RpcReply::Kind::Response:
    break;
  }
  if (broadcast) {
    (void)hub->broadcast(reply.body);
  }
  return make_json_response(200, reply.body);
}

HttpResponse CoordinationServer::Context::handle_health() const {
  std::ostringstream json;
  json << "{\"status\":\"ok\""
       << ",\"version\":" << common::json_quote(options.version)
       << ",\"port\":" << bound_port.load() << ",\"role\":\"leader\""
       << ",\"subscriberCount\":" << hub->subscriber_count()
       << ",\"pendingCount\":" << registry->pending_count()
       << ",\"totalDialogs\":" << registry->total_dialog_count()
       << ",\"health\":" << common::json_quote(health::overall_state()) << "}";
  return make_json_response(200, json.str());
}

HttpResponse CoordinationServer::Context::handle_dialog(const HttpRequest &request) {
  if (!is_json_object(request.body)) {
    return make_json_response(400, kInvalidRequest);
  }
  const auto ticket = registry->submit(common::json_get_string(request.body, "reason"),
                                       common::json_get_string(request.body, "workspace"));
  const auto resolution = ticket.resolution.get();
  return make_json_response(200, dialog::resolution_to_json(resolution));
}

HttpResponse CoordinationServer::Context::handle_pending(const HttpRequest &request) const {
  std::optional<std::string> workspace;
  if (const auto it = request.query.find("workspace");
      it != request.query.end() && !it->second.empty()) {
    workspace = it->second;
  }
  return make_json_response(
      200, "{\"dialogs\":" + dialog::requests_to_json(registry->list_pending(workspace)) + "}");
}

HttpResponse CoordinationServer::Context::handle_respond(const HttpRequest &request) {
  if (!is_json_object(request.body)) {
    return make_json_response(400, kInvalidRequest);
  }
  std::string id = common::json_get_string(request.body, "id");
  if (id.empty()) {
    id = common::json_get_string(request.body, "dialogId");
  }
  auto resolution = dialog::parse_resolution(request.body);
  if (id.empty() || !resolution.ok()) {
    return make_json_response(400, kInvalidRequest);
  }

  const auto status = registry->resolve(id, resolution.value());
  if (status.code() == common::StatusCode::NotFound) {
    return make_json_response(404, R"({"error":"Dialog not found"})");
  }
  if (!status.ok()) {
    return make_json_response(500, "{\"error\":" + common::json_quote(status.error()) + "}");
  }
  return make_json_response(200, R"({"success":true})");
}

void CoordinationServer::Context::handle_client(const int client_fd) {
  auto read = read_http_request(client_fd, options.max_body_bytes);
  if (!read.request.has_value()) {
    if (read.error_status == 413) {
      (void)send_all(client_fd,
                     render_http_response(make_json_response(413, R"({"error":"request_too_large"})")));
    } else if (read.error_status != 0) {
      (void)send_all(client_fd, render_http_response(make_json_response(400, kInvalidRequest)));
    }
    close(client_fd);
    return;
  }

  const auto &request = *read.request;
  if (request.method == "GET" && request.path == "/sse") {
    serve_stream(client_fd);
    return;
  }
  (void)send_all(client_fd, render_http_response(dispatch(request)));
  close(client_fd);
}

void CoordinationServer::Context::serve_stream(const int client_fd) {
  auto subscribed = hub->subscribe(client_fd, bound_port.load());
  if (!subscribed.ok()) {
    close(client_fd);
    return;
  }
  // The stream is one-way; block until the peer hangs up or the hub shuts the socket down.
  std::array<char, 512> sink{};
  while (recv(client_fd, sink.data(), sink.size(), 0) > 0) {
  }
  hub->unsubscribe(subscribed.value());
  close(client_fd);
}

CoordinationServer::CoordinationServer(std::shared_ptr<dialog::PendingRegistry> registry,
                                       std::shared_ptr<rpc::RpcHandler> handler,
                                       ServerOptions options)
    : context_(std::make_shared<Context>()) {
  context_->registry = std::move(registry);
  context_->handler = std::move(handler);
  context_->hub = std::make_shared<StreamHub>(options.keepalive);
  context_->options = std::move(options);
}

CoordinationServer::~CoordinationServer() { stop(); }

common::Status CoordinationServer::start() {
  if (running_) {
    return common::Status::error("coordination server already running");
  }
  const auto &options = context_->options;
  health::mark_component_starting("server");

  listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
  if (listen_fd_ < 0) {
    return common::Status::error("failed to create listen socket");
  }

  int reuse = 1;
  setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(options.port);
  const std::string host = options.host == "localhost" ? "127.0.0.1" : options.host;
  if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("invalid bind host: " + options.host,
                                 common::StatusCode::InvalidArgument);
  }

  if (bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    const int err = errno;
    close(listen_fd_);
    listen_fd_ = -1;
    if (err == EADDRINUSE) {
      health::mark_component_stopped("server");
      return common::Status::error("port " + std::to_string(options.port) + " already in use",
                                   common::StatusCode::AddressInUse);
    }
    const std::string message = std::string("bind failed: ") + std::strerror(err);
    health::mark_component_error("server", message);
    return common::Status::error(message);
  }

  if (listen(listen_fd_, 64) != 0) {
    const std::string message = std::string("listen failed: ") + std::strerror(errno);
    close(listen_fd_);
    listen_fd_ = -1;
    health::mark_component_error("server", message);
    return common::Status::error(message);
  }

  sockaddr_in bound{};
  socklen_t bound_len = sizeof(bound);
  if (getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&bound), &bound_len) == 0) {
    context_->bound_port = ntohs(bound.sin_port);
  } else {
    context_->bound_port = options.port;
  }

  context_->hub->start();
  running_ = true;
  accept_thread_ = std::thread([this]() { accept_loop(); });
  health::mark_component_ok("server");
  std::cerr << "[hitlgate][server] listening on " << host << ":" << context_->bound_port.load()
            << "\n";
  return common::Status::success();
}

void CoordinationServer::stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  if (listen_fd_ >= 0) {
    shutdown(listen_fd_, SHUT_RDWR);
    close(listen_fd_);
    listen_fd_ = -1;
  }
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  context_->hub->stop();
  health::mark_component_stopped("server");
  std::cerr << "[hitlgate][server] stopped\n";
}

std::uint16_t CoordinationServer::port() const { return context_->bound_port.load(); }

StreamHub &CoordinationServer::stream() { return *context_->hub; }

HttpResponse CoordinationServer::dispatch(const HttpRequest &request) {
  return context_->dispatch(request);
}

void CoordinationServer::accept_loop() {
  while (running_) {
    sockaddr_in client_addr{};
    socklen_t len = sizeof(client_addr);
    const int client = accept(listen_fd_, reinterpret_cast<sockaddr *>(&client_addr), &len);
    if (client < 0) {
      if (!running_) {
        break;
      }
      continue;
    }
    // Connection threads share ownership of the context, so a dialog that is still waiting
    // can answer after this server object is gone.
    std::thread([context = context_, client]() { context->handle_client(client); }).detach();
  }
}

} // namespace hitlgate::gateway
