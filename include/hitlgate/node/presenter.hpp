#pragma once

#include "hitlgate/common/result.hpp"
#include "hitlgate/dialog/types.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>
#include <vector>

namespace hitlgate::node {

struct PresentedDialog {
  dialog::DialogRequest request;
  std::vector<dialog::HistoryEntry> history;
  std::uint64_t dialog_count = 0;
};

using RespondFn =
    std::function<common::Status(const std::string &id, const dialog::DialogResolution &)>;

/// Human-facing surface of a front-end. `present` must not block; the presenter calls
/// `respond` once the human decides.
class IDialogPresenter {
public:
  virtual ~IDialogPresenter() = default;
  virtual void present(const PresentedDialog &dialog, RespondFn respond) = 0;
  /// Dialogs that were outstanding when a previous run exited. Display only.
  virtual void restored(const std::vector<dialog::DialogRequest> &) {}
};

/// Line-oriented prompt on a file descriptor (stdin in `hitlgate serve`). One dialog is
/// prompted at a time; later ones queue.
///
///   c <text>        continue with new instructions
///   s               stop
///   +file PATH      attach a file (also +code, +image) before answering
class TerminalPresenter final : public IDialogPresenter {
public:
  TerminalPresenter(int input_fd, std::ostream &out);
  ~TerminalPresenter() override;

  void start();
  void stop();

  void present(const PresentedDialog &dialog, RespondFn respond) override;
  void restored(const std::vector<dialog::DialogRequest> &requests) override;

  [[nodiscard]] std::size_t queued() const;

private:
  struct Item {
    PresentedDialog dialog;
    RespondFn respond;
  };

  void run_loop();
  void prompt(const PresentedDialog &dialog);
  /// Next input line, or false when stopping or the input is closed.
  bool read_line(std::string &line);
  void write(const std::string &text);

  int input_fd_;
  std::ostream &out_;
  std::string buffered_;
  std::mutex out_mutex_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Item> queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

/// Formats the text block a presenter shows for one dialog.
[[nodiscard]] std::string render_dialog(const PresentedDialog &dialog);

} // namespace hitlgate::node
