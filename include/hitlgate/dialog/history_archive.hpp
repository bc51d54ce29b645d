#pragma once

#include "hitlgate/common/result.hpp"
#include "hitlgate/dialog/history.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <vector>

namespace hitlgate::dialog {

struct ArchivedEntry {
  std::string workspace;
  HistoryEntry entry;
};

/// SQLite copy of every resolved dialog (`dialog_history` table). The in-memory ledger stays
/// authoritative; the archive only lets `hitlgate history` read past runs.
class HistoryArchive final : public IHistorySink {
public:
  explicit HistoryArchive(std::filesystem::path db_path);
  ~HistoryArchive() override;

  HistoryArchive(const HistoryArchive &) = delete;
  HistoryArchive &operator=(const HistoryArchive &) = delete;

  [[nodiscard]] bool is_open() const { return db_ != nullptr; }
  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }

  [[nodiscard]] common::Status append(const std::string &workspace_key, const HistoryEntry &entry);
  /// Newest first. An empty workspace returns entries of every workspace.
  [[nodiscard]] common::Result<std::vector<ArchivedEntry>>
  entries(const std::optional<std::string> &workspace, std::size_t limit);
  [[nodiscard]] common::Result<std::size_t> count();

  void on_history_appended(const std::string &workspace_key, const HistoryEntry &entry) override;

private:
  [[nodiscard]] common::Status init_schema();

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
};

} // namespace hitlgate::dialog
