#pragma once

#include "hitlgate/common/result.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace hitlgate::gateway {

[[nodiscard]] std::string sse_event(const std::string &event, const std::string &data);

/// Server-sent-event fan-out. Subscribers are sockets owned by their connection thread; the hub
/// only writes to them, and drops any subscriber whose write fails.
class StreamHub {
public:
  explicit StreamHub(std::chrono::seconds keepalive = std::chrono::seconds(30));
  ~StreamHub();

  StreamHub(const StreamHub &) = delete;
  StreamHub &operator=(const StreamHub &) = delete;

  void start();
  void stop();

  /// Sends the stream preamble (headers, endpoint event, connected comment) and registers
  /// the socket. Returns the subscriber id.
  [[nodiscard]] common::Result<std::uint64_t> subscribe(int fd, std::uint16_t port);
  void unsubscribe(std::uint64_t id);

  /// `event: message` to every subscriber; returns how many writes succeeded.
  std::size_t broadcast(const std::string &json);
  /// Keepalive comment to every subscriber.
  std::size_t ping();

  [[nodiscard]] std::size_t subscriber_count() const;

private:
  struct Subscriber {
    int fd = -1;
    bool closed = false;
    std::mutex write_mutex;
  };

  std::size_t send_to_all(const std::string &payload);
  void keepalive_loop();

  std::chrono::seconds keepalive_;
  mutable std::mutex mutex_;
  std::unordered_map<std::uint64_t, std::shared_ptr<Subscriber>> subscribers_;
  std::uint64_t next_id_ = 1;

  std::thread keepalive_thread_;
  std::atomic<bool> running_{false};
};

} // namespace hitlgate::gateway
