#include "hitlgate/transport/stdio.hpp"

#include "hitlgate/common/fs.hpp"

#include <charconv>
#include <istream>
#include <ostream>

namespace hitlgate::transport {

namespace {

constexpr std::size_t kMaxFrameBytes = 64 * 1024 * 1024;

std::optional<std::size_t> content_length_of(const std::string &line) {
  const auto colon = line.find(':');
  if (colon == std::string::npos) {
    return std::nullopt;
  }
  if (common::to_lower(common::trim(line.substr(0, colon))) != "content-length") {
    return std::nullopt;
  }
  const std::string value = common::trim(line.substr(colon + 1));
  std::size_t length = 0;
  const auto *first = value.data();
  const auto *last = first + value.size();
  auto [ptr, ec] = std::from_chars(first, last, length);
  if (ec != std::errc() || ptr != last || value.empty()) {
    return std::nullopt;
  }
  return length;
}

} // namespace

std::string encode_frame(const std::string &body) {
  return "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
}

std::optional<std::string> FrameReader::next() {
  while (in_) {
    std::optional<std::size_t> length;
    bool saw_header = false;
    std::string line;
    while (std::getline(in_, line)) {
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      if (line.empty()) {
        if (saw_header) {
          break;
        }
        continue;
      }
      saw_header = true;
      if (const auto parsed = content_length_of(line); parsed.has_value()) {
        length = parsed;
      }
    }
    if (!in_) {
      return std::nullopt;
    }
    if (!length.has_value() || *length > kMaxFrameBytes) {
      continue;
    }

    std::string body(*length, '\0');
    in_.read(body.data(), static_cast<std::streamsize>(*length));
    if (static_cast<std::size_t>(in_.gcount()) != *length) {
      return std::nullopt;
    }
    return body;
  }
  return std::nullopt;
}

StdioServer::StdioServer(std::shared_ptr<rpc::RpcHandler> handler, std::istream &in,
                         std::ostream &out)
    : handler_(std::move(handler)), in_(in), out_(out) {}

StdioServer::~StdioServer() { join_all(); }

void StdioServer::write_frame(const std::string &body) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  out_ << encode_frame(body);
  out_.flush();
}

void StdioServer::run() {
  FrameReader reader(in_);
  while (auto message = reader.next()) {
    reap_finished();
    auto done = std::make_shared<std::atomic<bool>>(false);
    workers_.push_back(Worker{
        .thread = std::thread([this, body = std::move(*message), done]() {
          const auto reply = handler_->handle(body);
          if (reply.kind != rpc::RpcReply::Kind::Notification) {
            write_frame(reply.body);
          }
          done->store(true);
        }),
        .done = done,
    });
  }
  join_all();
}

void StdioServer::reap_finished() {
  for (auto it = workers_.begin(); it != workers_.end();) {
    if (it->done->load()) {
      it->thread.join();
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
}

void StdioServer::join_all() {
  for (auto &worker : workers_) {
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }
  workers_.clear();
}

} // namespace hitlgate::transport
