#include "hitlgate/gateway/stream_hub.hpp"

#include "hitlgate/gateway/http.hpp"
#include "hitlgate/health/health.hpp"
#include "hitlgate/observability/global.hpp"

#include <sstream>
#include <sys/socket.h>
#include <vector>

namespace hitlgate::gateway {

std::string sse_event(const std::string &event, const std::string &data) {
  return "event: " + event + "\ndata: " + data + "\n\n";
}

StreamHub::StreamHub(const std::chrono::seconds keepalive) : keepalive_(keepalive) {}

StreamHub::~StreamHub() { stop(); }

void StreamHub::start() {
  if (running_) {
    return;
  }
  running_ = true;
  health::mark_component_ok("stream");
  keepalive_thread_ = std::thread([this]() { keepalive_loop(); });
}

void StreamHub::stop() {
  running_ = false;
  if (keepalive_thread_.joinable()) {
    keepalive_thread_.join();
  }
  std::lock_guard<std::mutex> lock(mutex_);
  // Wake the owning connection threads; they unsubscribe and close their sockets.
  for (const auto &[id, subscriber] : subscribers_) {
    std::lock_guard<std::mutex> write_lock(subscriber->write_mutex);
    if (!subscriber->closed) {
      shutdown(subscriber->fd, SHUT_RDWR);
    }
  }
  health::mark_component_stopped("stream");
}

common::Result<std::uint64_t> StreamHub::subscribe(const int fd, const std::uint16_t port) {
  std::ostringstream preamble;
  preamble << "HTTP/1.1 200 OK\r\n"
           << "Content-Type: text/event-stream\r\n"
           << "Cache-Control: no-cache\r\n"
           << "Connection: keep-alive\r\n"
           << "X-Accel-Buffering: no\r\n"
           << "Access-Control-Allow-Origin: *\r\n"
           << "Access-Control-Allow-Methods: GET, POST, OPTIONS\r\n"
           << "Access-Control-Allow-Headers: Content-Type\r\n"
           << "\r\n"
           << sse_event("endpoint", "http://127.0.0.1:" + std::to_string(port) + "/messages")
           << ": connected\n\n";
  if (!send_all(fd, preamble.str())) {
    return common::Result<std::uint64_t>::failure("subscriber disconnected during handshake",
                                                  common::StatusCode::Unavailable);
  }

  auto subscriber = std::make_shared<Subscriber>();
  subscriber->fd = fd;
  std::uint64_t id = 0;
  std::size_t count = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    id = next_id_++;
    subscribers_.emplace(id, std::move(subscriber));
    count = subscribers_.size();
  }
  observability::record_subscribers(true, count);
  return common::Result<std::uint64_t>::success(id);
}

void StreamHub::unsubscribe(const std::uint64_t id) {
  std::shared_ptr<Subscriber> subscriber;
  std::size_t count = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = subscribers_.find(id);
    if (it == subscribers_.end()) {
      return;
    }
    subscriber = it->second;
    subscribers_.erase(it);
    count = subscribers_.size();
  }
  {
    // After this no writer touches the fd, so the owner may close it.
    std::lock_guard<std::mutex> write_lock(subscriber->write_mutex);
    subscriber->closed = true;
  }
  observability::record_subscribers(false, count);
}

std::size_t StreamHub::broadcast(const std::string &json) {
  return send_to_all(sse_event("message", json));
}

std::size_t StreamHub::ping() { return send_to_all(": ping\n\n"); }

std::size_t StreamHub::subscriber_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscribers_.size();
}

std::size_t StreamHub::send_to_all(const std::string &payload) {
  std::vector<std::pair<std::uint64_t, std::shared_ptr<Subscriber>>> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    targets.assign(subscribers_.begin(), subscribers_.end());
  }

  std::size_t delivered = 0;
  std::vector<std::uint64_t> failed;
  for (const auto &[id, subscriber] : targets) {
    std::lock_guard<std::mutex> write_lock(subscriber->write_mutex);
    if (subscriber->closed) {
      continue;
    }
    if (send_all(subscriber->fd, payload)) {
      ++delivered;
    } else {
      shutdown(subscriber->fd, SHUT_RDWR);
      failed.push_back(id);
    }
  }
  for (const auto id : failed) {
    unsubscribe(id);
  }
  return delivered;
}

void StreamHub::keepalive_loop() {
  constexpr auto kSlice = std::chrono::milliseconds(100);
  auto waited = std::chrono::milliseconds(0);
  while (running_) {
    std::this_thread::sleep_for(kSlice);
    waited += kSlice;
    if (waited >= keepalive_) {
      waited = std::chrono::milliseconds(0);
      (void)ping();
    }
  }
}

} // namespace hitlgate::gateway
