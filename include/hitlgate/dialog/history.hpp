#pragma once

#include "hitlgate/dialog/types.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace hitlgate::dialog {

/// Secondary destination for appended history entries (for example a durable archive).
class IHistorySink {
public:
  virtual ~IHistorySink() = default;
  virtual void on_history_appended(const std::string &workspace_key,
                                   const HistoryEntry &entry) = 0;
};

/// Per-workspace append-only history plus the per-workspace dialog counters. Keys are
/// normalized workspaces. Not synchronized; the owning registry serializes access.
class HistoryLedger {
public:
  /// Increments and returns the dialog counter for `workspace` (1 for the first dialog).
  std::uint64_t next_sequence(const std::string &workspace);
  void append(const std::string &workspace, HistoryEntry entry);

  [[nodiscard]] std::vector<HistoryEntry> entries(const std::string &workspace) const;
  [[nodiscard]] std::uint64_t dialog_count(const std::string &workspace) const;
  /// Sum of dialog counters across all workspaces.
  [[nodiscard]] std::uint64_t total_dialog_count() const;

  void set_sink(std::shared_ptr<IHistorySink> sink) { sink_ = std::move(sink); }

private:
  std::unordered_map<std::string, std::vector<HistoryEntry>> entries_;
  std::unordered_map<std::string, std::uint64_t> counters_;
  std::shared_ptr<IHistorySink> sink_;
};

} // namespace hitlgate::dialog
