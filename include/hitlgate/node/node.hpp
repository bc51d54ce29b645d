#pragma once

#include "hitlgate/bridge/http_client.hpp"
#include "hitlgate/bridge/polling_bridge.hpp"
#include "hitlgate/common/result.hpp"
#include "hitlgate/config/schema.hpp"
#include "hitlgate/dialog/registry.hpp"
#include "hitlgate/gateway/server.hpp"
#include "hitlgate/node/presenter.hpp"
#include "hitlgate/rpc/handler.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace hitlgate::node {

enum class Role { Stopped, Leader, Follower };

[[nodiscard]] const char *role_name(Role role);

/// One front-end process. Whoever binds the coordination port first is the Leader and owns
/// the server; everyone else follows the Leader through a polling bridge. Requests are
/// presented locally only when they belong to one of this node's workspaces.
class Node {
public:
  Node(config::Config config, std::shared_ptr<IDialogPresenter> presenter,
       std::shared_ptr<bridge::HttpClient> http = nullptr);
  ~Node();

  Node(const Node &) = delete;
  Node &operator=(const Node &) = delete;

  [[nodiscard]] common::Status start();
  /// Moves to `port`: Leader when it binds, Follower when it is taken. On any other bind
  /// failure the current role stays as it was and the error is returned.
  [[nodiscard]] common::Status rebind(std::uint16_t port);
  void stop();

  [[nodiscard]] Role role() const;
  [[nodiscard]] std::uint16_t port() const;

  /// Resolve locally; a Follower relays to the Leader when the dialog is not its own.
  [[nodiscard]] common::Status respond(const std::string &id,
                                       const dialog::DialogResolution &resolution);

  [[nodiscard]] std::shared_ptr<dialog::PendingRegistry> registry() const { return registry_; }
  [[nodiscard]] std::shared_ptr<rpc::RpcHandler> handler() const { return handler_; }
  [[nodiscard]] const std::vector<std::string> &workspaces() const { return config_.workspaces; }
  [[nodiscard]] std::size_t subscriber_count() const;
  /// Seen-set size of the bridge (0 unless Follower).
  [[nodiscard]] std::size_t bridge_seen_count() const;

private:
  [[nodiscard]] gateway::ServerOptions server_options(std::uint16_t port) const;
  [[nodiscard]] common::Status start_locked(std::uint16_t port);
  void start_follower_locked(std::uint16_t port);
  void teardown_locked();
  void stop_locked();
  void set_role(Role role, std::uint16_t port);
  void offer(const PresentedDialog &dialog);

  config::Config config_;
  std::shared_ptr<IDialogPresenter> presenter_;
  std::shared_ptr<bridge::HttpClient> http_;
  std::shared_ptr<dialog::PendingRegistry> registry_;
  std::shared_ptr<rpc::RpcHandler> handler_;

  mutable std::mutex mutex_;
  std::unique_ptr<gateway::CoordinationServer> server_;
  std::unique_ptr<bridge::PollingBridge> bridge_;
  Role role_ = Role::Stopped;
  std::uint16_t port_ = 0;
};

} // namespace hitlgate::node
