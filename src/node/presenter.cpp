#include "hitlgate/node/presenter.hpp"

#include "hitlgate/common/clock.hpp"
#include "hitlgate/common/fs.hpp"
#include "hitlgate/dialog/attachment_loader.hpp"

#include <array>
#include <filesystem>
#include <poll.h>
#include <sstream>
#include <unistd.h>

namespace hitlgate::node {

namespace {

constexpr std::size_t kHistoryShown = 5;

std::string project_name(const std::string &workspace) {
  const auto pos = workspace.find_last_of("/\\");
  const std::string name = pos == std::string::npos ? workspace : workspace.substr(pos + 1);
  return name.empty() ? "Unknown" : name;
}

} // namespace

std::string render_dialog(const PresentedDialog &dialog) {
  std::ostringstream out;
  out << "\n=== " << project_name(dialog.request.workspace) << " | dialog #"
      << dialog.dialog_count << " | " << dialog.request.id << " ===\n";
  out << dialog.request.reason << "\n";
  if (!dialog.history.empty()) {
    out << "--- recent ---\n";
    const std::size_t first =
        dialog.history.size() > kHistoryShown ? dialog.history.size() - kHistoryShown : 0;
    for (std::size_t i = first; i < dialog.history.size(); ++i) {
      const auto &entry = dialog.history[i];
      out << common::format_rfc3339(entry.timestamp_ms) << " "
          << (entry.continued ? "[continue] " : "[stop] ") << entry.user_input << "\n";
    }
  }
  out << "answer: c <instructions> | s | +file/+code/+image PATH\n";
  return out.str();
}

TerminalPresenter::TerminalPresenter(const int input_fd, std::ostream &out)
    : input_fd_(input_fd), out_(out) {}

TerminalPresenter::~TerminalPresenter() { stop(); }

void TerminalPresenter::start() {
  if (running_) {
    return;
  }
  running_ = true;
  thread_ = std::thread([this]() { run_loop(); });
}

void TerminalPresenter::stop() {
  running_ = false;
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void TerminalPresenter::present(const PresentedDialog &dialog, RespondFn respond) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(Item{.dialog = dialog, .respond = std::move(respond)});
  }
  cv_.notify_one();
}

void TerminalPresenter::restored(const std::vector<dialog::DialogRequest> &requests) {
  std::ostringstream text;
  for (const auto &request : requests) {
    text << "[outstanding from previous run] " << request.id << " (" << request.workspace
         << "): " << request.reason << "\n";
  }
  write(text.str());
}

void TerminalPresenter::write(const std::string &text) {
  std::lock_guard<std::mutex> lock(out_mutex_);
  out_ << text;
  out_.flush();
}

std::size_t TerminalPresenter::queued() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

bool TerminalPresenter::read_line(std::string &line) {
  while (running_) {
    const auto newline = buffered_.find('\n');
    if (newline != std::string::npos) {
      line = buffered_.substr(0, newline);
      buffered_.erase(0, newline + 1);
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      return true;
    }

    pollfd pfd{.fd = input_fd_, .events = POLLIN, .revents = 0};
    const int ready = poll(&pfd, 1, 100);
    if (ready <= 0) {
      continue;
    }
    std::array<char, 1024> buf{};
    const ssize_t n = read(input_fd_, buf.data(), buf.size());
    if (n <= 0) {
      return false;
    }
    buffered_.append(buf.data(), static_cast<std::size_t>(n));
  }
  return false;
}

void TerminalPresenter::run_loop() {
  while (running_) {
    Item item;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this]() { return !running_ || !queue_.empty(); });
      if (!running_) {
        return;
      }
      item = std::move(queue_.front());
      queue_.pop_front();
    }

    write(render_dialog(item.dialog));

    dialog::DialogResolution resolution;
    bool answered = false;
    std::string line;
    while (!answered && read_line(line)) {
      const std::string trimmed = common::trim(line);
      if (trimmed == "s") {
        resolution.should_continue = false;
        answered = true;
      } else if (trimmed == "c" || common::starts_with(trimmed, "c ")) {
        resolution.should_continue = true;
        resolution.user_input = trimmed.size() > 2 ? trimmed.substr(2) : "";
        answered = true;
      } else if (common::starts_with(trimmed, "+")) {
        const auto space = trimmed.find(' ');
        const auto kind =
            dialog::parse_attachment_kind(trimmed.substr(1, space == std::string::npos
                                                                ? std::string::npos
                                                                : space - 1));
        if (!kind.has_value() || space == std::string::npos) {
          write("usage: +file PATH | +code PATH | +image PATH\n");
          continue;
        }
        auto attachment = dialog::load_attachment(
            *kind, common::expand_path(common::trim(trimmed.substr(space + 1))));
        if (!attachment.ok()) {
          write("attach failed: " + attachment.error() + "\n");
          continue;
        }
        write("attached " + attachment.value().name + "\n");
        resolution.attachments.push_back(std::move(attachment.value()));
      } else if (!trimmed.empty()) {
        write("answer with 'c <instructions>' or 's'\n");
      }
    }
    if (!answered) {
      return;
    }

    const auto status = item.respond(item.dialog.request.id, resolution);
    if (status.code() == common::StatusCode::NotFound) {
      write("dialog " + item.dialog.request.id + " was already answered elsewhere\n");
    } else if (!status.ok()) {
      write("respond failed: " + status.error() + "\n");
    } else {
      write("sent\n");
    }
  }
}

} // namespace hitlgate::node
