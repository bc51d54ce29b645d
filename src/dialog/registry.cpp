#include "hitlgate/dialog/registry.hpp"

#include "hitlgate/common/clock.hpp"
#include "hitlgate/dialog/router.hpp"
#include "hitlgate/observability/global.hpp"

namespace hitlgate::dialog {

void PendingRegistry::set_listener(OfferListener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  listener_ = std::move(listener);
}

void PendingRegistry::set_change_listener(ChangeListener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  change_listener_ = std::move(listener);
}

void PendingRegistry::set_history_sink(std::shared_ptr<IHistorySink> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  ledger_.set_sink(std::move(sink));
}

SubmitTicket PendingRegistry::submit(const std::string &reason, const std::string &workspace) {
  SubmitTicket ticket;
  PendingOffer offer;
  OfferListener listener;
  ChangeListener change_listener;
  std::size_t pending = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    DialogRequest request;
    request.id = make_dialog_id();
    while (index_.contains(request.id)) {
      request.id = make_dialog_id();
    }
    request.reason = reason;
    request.workspace = workspace;
    request.sequence_number = ledger_.next_sequence(workspace);
    request.submitted_at_ms = common::now_unix_ms();

    pending_.push_back(Entry{.request = request, .promise = {}});
    auto it = std::prev(pending_.end());
    index_.emplace(request.id, it);

    ticket.request = request;
    ticket.resolution = it->promise.get_future().share();
    offer.request = request;
    offer.history = ledger_.entries(workspace);
    offer.dialog_count = request.sequence_number;
    listener = listener_;
    change_listener = change_listener_;
    pending = pending_.size();
  }

  observability::record_dialog_submitted(ticket.request.id, ticket.request.workspace,
                                         ticket.request.sequence_number);
  observability::record_metric(observability::PendingDialogsMetric{.count = pending});
  if (listener) {
    listener(offer);
  }
  if (change_listener) {
    change_listener();
  }
  return ticket;
}

common::Status PendingRegistry::resolve(const std::string &id,
                                        const DialogResolution &resolution) {
  std::promise<DialogResolution> promise;
  DialogRequest request;
  ChangeListener change_listener;
  std::size_t pending = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto found = index_.find(id);
    if (found == index_.end()) {
      observability::record_resolve_miss(id);
      return common::Status::not_found("Dialog not found: " + id);
    }
    auto it = found->second;
    request = it->request;
    promise = std::move(it->promise);
    index_.erase(found);
    pending_.erase(it);

    ledger_.append(request.workspace, HistoryEntry{.timestamp_ms = common::now_unix_ms(),
                                                   .reason = request.reason,
                                                   .user_input = resolution.user_input,
                                                   .continued = resolution.should_continue});
    change_listener = change_listener_;
    pending = pending_.size();
  }

  promise.set_value(resolution);
  observability::record_dialog_resolved(
      request.id, request.workspace, resolution.should_continue,
      std::chrono::milliseconds(common::now_unix_ms() - request.submitted_at_ms));
  observability::record_metric(observability::PendingDialogsMetric{.count = pending});
  if (change_listener) {
    change_listener();
  }
  return common::Status::success();
}

std::vector<DialogRequest>
PendingRegistry::list_pending(const std::optional<std::string> &workspace) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<DialogRequest> out;
  out.reserve(pending_.size());
  for (const auto &entry : pending_) {
    if (!workspace.has_value() || workspace->empty() ||
        workspaces_match(entry.request.workspace, *workspace)) {
      out.push_back(entry.request);
    }
  }
  return out;
}

std::size_t PendingRegistry::pending_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

std::optional<DialogRequest> PendingRegistry::find(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = index_.find(id);
  if (it == index_.end()) {
    return std::nullopt;
  }
  return it->second->request;
}

std::vector<HistoryEntry> PendingRegistry::history(const std::string &workspace) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ledger_.entries(workspace);
}

std::uint64_t PendingRegistry::dialog_count(const std::string &workspace) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ledger_.dialog_count(workspace);
}

std::uint64_t PendingRegistry::total_dialog_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ledger_.total_dialog_count();
}

} // namespace hitlgate::dialog
