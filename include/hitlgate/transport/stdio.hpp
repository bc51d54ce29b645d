#pragma once

#include "hitlgate/rpc/handler.hpp"

#include <atomic>
#include <iosfwd>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace hitlgate::transport {

/// `Content-Length: N\r\n\r\n` followed by N bytes.
[[nodiscard]] std::string encode_frame(const std::string &body);

/// Reads Content-Length framed messages. Header names match case-insensitively and header
/// blocks without a usable Content-Length are skipped.
class FrameReader {
public:
  explicit FrameReader(std::istream &in) : in_(in) {}

  /// Next message body, or nullopt at end of input.
  [[nodiscard]] std::optional<std::string> next();

private:
  std::istream &in_;
};

/// JSON-RPC over framed stdin/stdout. Each message is handled on its own thread so a blocked
/// tools/call does not hold up initialize or tools/list.
class StdioServer {
public:
  StdioServer(std::shared_ptr<rpc::RpcHandler> handler, std::istream &in, std::ostream &out);
  ~StdioServer();

  StdioServer(const StdioServer &) = delete;
  StdioServer &operator=(const StdioServer &) = delete;

  /// Serves until end of input, then waits for in-flight requests to finish.
  void run();
  void write_frame(const std::string &body);

private:
  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void reap_finished();
  void join_all();

  std::shared_ptr<rpc::RpcHandler> handler_;
  std::istream &in_;
  std::ostream &out_;
  std::mutex write_mutex_;
  std::list<Worker> workers_;
};

} // namespace hitlgate::transport
