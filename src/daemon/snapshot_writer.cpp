#include "hitlgate/daemon/snapshot_writer.hpp"

#include "hitlgate/common/clock.hpp"
#include "hitlgate/common/fs.hpp"
#include "hitlgate/common/json_util.hpp"
#include "hitlgate/health/health.hpp"
#include "hitlgate/observability/global.hpp"

#include <charconv>
#include <sstream>

namespace hitlgate::daemon {

namespace {

std::int64_t parse_i64(const std::string &text) {
  std::int64_t value = 0;
  const auto *first = text.data();
  const auto *last = first + text.size();
  const auto result = std::from_chars(first, last, value);
  return result.ec == std::errc() ? value : 0;
}

} // namespace

std::string snapshot_json(const std::vector<dialog::DialogRequest> &dialogs,
                          const std::string &written_at) {
  std::ostringstream json;
  json << "{\"writtenAt\":" << common::json_quote(written_at) << ",\"dialogs\":[";
  for (std::size_t i = 0; i < dialogs.size(); ++i) {
    const auto &request = dialogs[i];
    if (i > 0) {
      json << ",";
    }
    json << "{\"id\":" << common::json_quote(request.id)
         << ",\"reason\":" << common::json_quote(request.reason)
         << ",\"workspace\":" << common::json_quote(request.workspace)
         << ",\"sequenceNumber\":" << request.sequence_number
         << ",\"timestamp\":" << request.submitted_at_ms << "}";
  }
  json << "]}";
  return json.str();
}

common::Result<PendingSnapshot> parse_snapshot(const std::string &json) {
  const std::string dialogs = common::json_get_array(json, "dialogs");
  if (!common::json_is_valid(json) || dialogs.empty()) {
    return common::Result<PendingSnapshot>::failure("malformed pending snapshot",
                                                    common::StatusCode::InvalidArgument);
  }
  PendingSnapshot snapshot;
  snapshot.written_at = common::json_get_string(json, "writtenAt");
  for (const auto &object : common::json_split_top_level_objects(dialogs)) {
    auto request = dialog::parse_request(object);
    if (!request.ok()) {
      continue;
    }
    request.value().submitted_at_ms = parse_i64(common::json_get_number(object, "timestamp"));
    snapshot.dialogs.push_back(std::move(request.value()));
  }
  return common::Result<PendingSnapshot>::success(std::move(snapshot));
}

common::Result<PendingSnapshot> load_snapshot(const std::filesystem::path &path) {
  auto text = common::read_file(path);
  if (!text.ok()) {
    return common::Result<PendingSnapshot>::failure(text.status());
  }
  return parse_snapshot(text.value());
}

SnapshotWriter::SnapshotWriter(std::shared_ptr<dialog::PendingRegistry> registry,
                               std::filesystem::path snapshot_file,
                               const std::chrono::seconds interval)
    : registry_(std::move(registry)), snapshot_file_(std::move(snapshot_file)),
      interval_(interval) {}

SnapshotWriter::~SnapshotWriter() { stop(); }

void SnapshotWriter::start() {
  if (running_) {
    return;
  }
  running_ = true;
  health::mark_component_starting("snapshot");
  registry_->set_change_listener([this]() { (void)write_now(); });
  thread_ = std::thread([this]() { write_loop(); });
}

void SnapshotWriter::stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  registry_->set_change_listener(nullptr);
  if (thread_.joinable()) {
    thread_.join();
  }
  health::mark_component_stopped("snapshot");
}

void SnapshotWriter::write_loop() {
  constexpr auto kSlice = std::chrono::milliseconds(100);
  while (running_) {
    (void)write_now();
    auto waited = std::chrono::milliseconds(0);
    while (running_ && waited < interval_) {
      std::this_thread::sleep_for(kSlice);
      waited += kSlice;
    }
  }
  (void)write_now();
}

void SnapshotWriter::set_gate(std::function<bool()> gate) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  gate_ = std::move(gate);
}

common::Status SnapshotWriter::write_now() {
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (gate_ && !gate_()) {
    return common::Status::success();
  }
  const auto status = common::write_file_atomic(
      snapshot_file_, snapshot_json(registry_->list_pending(), common::now_rfc3339()));
  if (status.ok()) {
    health::mark_component_ok("snapshot");
  } else {
    health::mark_component_error("snapshot", status.error());
    observability::record_error("snapshot", status.error());
  }
  return status;
}

} // namespace hitlgate::daemon
