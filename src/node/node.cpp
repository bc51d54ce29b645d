#include "hitlgate/node/node.hpp"

#include "hitlgate/dialog/router.hpp"
#include "hitlgate/health/health.hpp"
#include "hitlgate/observability/global.hpp"
#include "hitlgate/rpc/backends.hpp"

#include <iostream>

namespace hitlgate::node {

const char *role_name(const Role role) {
  switch (role) {
  case Role::Stopped:
    return "stopped";
  case Role::Leader:
    return "leader";
  case Role::Follower:
    return "follower";
  }
  return "stopped";
}

Node::Node(config::Config config, std::shared_ptr<IDialogPresenter> presenter,
           std::shared_ptr<bridge::HttpClient> http)
    : config_(std::move(config)), presenter_(std::move(presenter)), http_(std::move(http)),
      registry_(std::make_shared<dialog::PendingRegistry>()) {
  if (http_ == nullptr) {
    http_ = std::make_shared<bridge::CurlHttpClient>();
  }
  handler_ = std::make_shared<rpc::RpcHandler>(
      std::make_shared<rpc::LocalDialogBackend>(registry_), config_.server.version);
  registry_->set_listener([this](const dialog::PendingOffer &pending) {
    offer(PresentedDialog{.request = pending.request,
                          .history = pending.history,
                          .dialog_count = pending.dialog_count});
  });
}

Node::~Node() {
  stop();
  registry_->set_listener(nullptr);
}

common::Status Node::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (role_ != Role::Stopped) {
    return common::Status::success();
  }
  return start_locked(config_.server.port);
}

common::Status Node::rebind(const std::uint16_t port) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (role_ != Role::Stopped && port == port_) {
    return common::Status::success();
  }
  std::cerr << "[hitlgate][node] rebinding from port " << port_ << " to " << port << "\n";

  // The current role keeps running until the new port is known to work.
  auto server = std::make_unique<gateway::CoordinationServer>(registry_, handler_,
                                                              server_options(port));
  const auto status = server->start();
  if (!status.ok() && status.code() != common::StatusCode::AddressInUse) {
    observability::record_error("node", status.error());
    std::cerr << "[hitlgate][node] staying " << role_name(role_) << " on port " << port_
              << "\n";
    return status;
  }

  teardown_locked();
  config_.server.port = port;
  if (status.ok()) {
    server_ = std::move(server);
    health::mark_component_ok("server");
    set_role(Role::Leader, server_->port());
    return common::Status::success();
  }
  start_follower_locked(port);
  return common::Status::success();
}

void Node::stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  stop_locked();
}

gateway::ServerOptions Node::server_options(const std::uint16_t port) const {
  gateway::ServerOptions options;
  options.host = config_.server.host;
  options.port = port;
  options.version = config_.server.version;
  options.max_body_bytes = config_.server.max_body_bytes;
  options.keepalive = std::chrono::seconds(config_.stream.keepalive_secs);
  return options;
}

common::Status Node::start_locked(const std::uint16_t port) {
  auto server = std::make_unique<gateway::CoordinationServer>(registry_, handler_,
                                                              server_options(port));
  const auto status = server->start();
  if (status.ok()) {
    server_ = std::move(server);
    set_role(Role::Leader, server_->port());
    return common::Status::success();
  }
  if (status.code() != common::StatusCode::AddressInUse) {
    observability::record_error("node", status.error());
    return status;
  }
  start_follower_locked(port);
  return common::Status::success();
}

void Node::start_follower_locked(const std::uint16_t port) {
  auto client = std::make_shared<bridge::LeaderClient>(http_, config_.server.host, port);
  bridge::PollingBridgeOptions bridge_options;
  bridge_options.interval = std::chrono::milliseconds(config_.follower.poll_interval_ms);
  bridge_options.request_timeout_ms = config_.follower.request_timeout_ms;
  bridge_ = std::make_unique<bridge::PollingBridge>(client, config_.workspaces, bridge_options);
  bridge_->set_claim_callback([this](const dialog::DialogRequest &request) {
    offer(PresentedDialog{
        .request = request, .history = {}, .dialog_count = request.sequence_number});
  });
  bridge_->start();
  set_role(Role::Follower, port);
}

void Node::teardown_locked() {
  if (server_ != nullptr) {
    server_->stop();
    server_.reset();
  }
  if (bridge_ != nullptr) {
    bridge_->stop();
    bridge_.reset();
  }
}

void Node::stop_locked() {
  teardown_locked();
  if (role_ != Role::Stopped) {
    set_role(Role::Stopped, port_);
  }
}

void Node::set_role(const Role role, const std::uint16_t port) {
  role_ = role;
  port_ = port;
  std::cerr << "[hitlgate][node] " << role_name(role) << " on port " << port << "\n";
  observability::record_role_changed(role_name(role), port);
}

Role Node::role() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return role_;
}

std::uint16_t Node::port() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return port_;
}

std::size_t Node::subscriber_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return server_ == nullptr ? 0 : server_->stream().subscriber_count();
}

std::size_t Node::bridge_seen_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return bridge_ == nullptr ? 0 : bridge_->seen_count();
}

common::Status Node::respond(const std::string &id, const dialog::DialogResolution &resolution) {
  if (!registry_->find(id).has_value()) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (role_ == Role::Follower && bridge_ != nullptr) {
      return bridge_->relay(id, resolution);
    }
  }
  return registry_->resolve(id, resolution);
}

void Node::offer(const PresentedDialog &dialog) {
  if (presenter_ == nullptr || !dialog::should_claim(dialog.request.workspace, config_.workspaces)) {
    return;
  }
  presenter_->present(dialog, [this](const std::string &id,
                                     const dialog::DialogResolution &resolution) {
    return respond(id, resolution);
  });
}

} // namespace hitlgate::node
