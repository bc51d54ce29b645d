#pragma once

#include "hitlgate/common/result.hpp"
#include "hitlgate/dialog/registry.hpp"
#include "hitlgate/gateway/http.hpp"
#include "hitlgate/gateway/stream_hub.hpp"
#include "hitlgate/rpc/handler.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace hitlgate::gateway {

struct ServerOptions {
  std::string host = "127.0.0.1";
  std::uint16_t port = 23987;
  std::string version = "1.5.0";
  std::size_t max_body_bytes = 4 * 1024 * 1024;
  std::chrono::seconds keepalive{30};
};

/// The coordination endpoint run by the Leader: JSON-RPC over HTTP, the SSE stream, and the
/// dialog routes used by followers and CLI clients. One thread per accepted connection.
class CoordinationServer {
public:
  CoordinationServer(std::shared_ptr<dialog::PendingRegistry> registry,
                     std::shared_ptr<rpc::RpcHandler> handler, ServerOptions options);
  ~CoordinationServer();

  CoordinationServer(const CoordinationServer &) = delete;
  CoordinationServer &operator=(const CoordinationServer &) = delete;

  /// Binds and starts accepting. AddressInUse when another process owns the port.
  [[nodiscard]] common::Status start();
  /// Stops accepting and closes push streams. Requests already blocked on a dialog keep
  /// their connection and answer when it resolves.
  void stop();

  [[nodiscard]] std::uint16_t port() const;
  [[nodiscard]] bool is_running() const { return running_; }
  [[nodiscard]] StreamHub &stream();

  /// Every route except the GET /sse push stream, which needs the socket.
  [[nodiscard]] HttpResponse dispatch(const HttpRequest &request);

private:
  struct Context;

  void accept_loop();

  std::shared_ptr<Context> context_;
  std::atomic<bool> running_{false};
  int listen_fd_ = -1;
  std::thread accept_thread_;
};

} // namespace hitlgate::gateway
