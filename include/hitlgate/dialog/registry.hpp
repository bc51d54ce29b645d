#pragma once

#include "hitlgate/common/result.hpp"
#include "hitlgate/dialog/history.hpp"
#include "hitlgate/dialog/types.hpp"

#include <functional>
#include <future>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace hitlgate::dialog {

struct SubmitTicket {
  DialogRequest request;
  std::shared_future<DialogResolution> resolution;
};

/// What a presenter needs to show a newly submitted dialog: the request, the workspace
/// history as it stood before this dialog, and the workspace's dialog counter.
struct PendingOffer {
  DialogRequest request;
  std::vector<HistoryEntry> history;
  std::uint64_t dialog_count = 0;
};

using OfferListener = std::function<void(const PendingOffer &)>;
using ChangeListener = std::function<void()>;

/// Owns every outstanding dialog and the history ledger. Each dialog is resolved at most
/// once; the waiter's future becomes ready only after the history entry is recorded.
class PendingRegistry {
public:
  PendingRegistry() = default;
  PendingRegistry(const PendingRegistry &) = delete;
  PendingRegistry &operator=(const PendingRegistry &) = delete;

  /// Invoked after each submit, outside the lock, once the entry is visible to list_pending.
  void set_listener(OfferListener listener);
  /// Invoked after every submit and successful resolve (snapshot persistence).
  void set_change_listener(ChangeListener listener);
  void set_history_sink(std::shared_ptr<IHistorySink> sink);

  [[nodiscard]] SubmitTicket submit(const std::string &reason, const std::string &workspace);
  /// NotFound when the id is unknown or already resolved; nothing changes in that case.
  [[nodiscard]] common::Status resolve(const std::string &id, const DialogResolution &resolution);

  /// Pending requests in submission order, optionally filtered by workspace containment.
  [[nodiscard]] std::vector<DialogRequest>
  list_pending(const std::optional<std::string> &workspace = std::nullopt) const;
  [[nodiscard]] std::size_t pending_count() const;
  [[nodiscard]] std::optional<DialogRequest> find(const std::string &id) const;

  [[nodiscard]] std::vector<HistoryEntry> history(const std::string &workspace) const;
  [[nodiscard]] std::uint64_t dialog_count(const std::string &workspace) const;
  [[nodiscard]] std::uint64_t total_dialog_count() const;

private:
  struct Entry {
    DialogRequest request;
    std::promise<DialogResolution> promise;
  };

  mutable std::mutex mutex_;
  std::list<Entry> pending_;
  std::unordered_map<std::string, std::list<Entry>::iterator> index_;
  HistoryLedger ledger_;
  OfferListener listener_;
  ChangeListener change_listener_;
};

} // namespace hitlgate::dialog
