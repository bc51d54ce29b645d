#include "hitlgate/dialog/history.hpp"

#include "hitlgate/dialog/router.hpp"

namespace hitlgate::dialog {

std::uint64_t HistoryLedger::next_sequence(const std::string &workspace) {
  return ++counters_[normalize_workspace(workspace)];
}

void HistoryLedger::append(const std::string &workspace, HistoryEntry entry) {
  const std::string key = normalize_workspace(workspace);
  auto &list = entries_[key];
  list.push_back(std::move(entry));
  if (sink_ != nullptr) {
    sink_->on_history_appended(key, list.back());
  }
}

std::vector<HistoryEntry> HistoryLedger::entries(const std::string &workspace) const {
  const auto it = entries_.find(normalize_workspace(workspace));
  if (it == entries_.end()) {
    return {};
  }
  return it->second;
}

std::uint64_t HistoryLedger::dialog_count(const std::string &workspace) const {
  const auto it = counters_.find(normalize_workspace(workspace));
  return it == counters_.end() ? 0 : it->second;
}

std::uint64_t HistoryLedger::total_dialog_count() const {
  std::uint64_t total = 0;
  for (const auto &[key, count] : counters_) {
    total += count;
  }
  return total;
}

} // namespace hitlgate::dialog
