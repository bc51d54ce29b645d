#pragma once

#include "hitlgate/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hitlgate::dialog {

enum class AttachmentKind { Image, File, Code };

[[nodiscard]] const char *attachment_kind_name(AttachmentKind kind);
[[nodiscard]] std::optional<AttachmentKind> parse_attachment_kind(const std::string &name);

struct Attachment {
  AttachmentKind kind = AttachmentKind::File;
  std::string name;
  /// Text for file/code, `data:<mime>;base64,...` (or a bare reference) for images.
  std::string content;
  std::optional<std::string> mime_type;
};

/// One outstanding human decision. `sequence_number` is the 1-based ordinal of this dialog
/// within its (normalized) workspace.
struct DialogRequest {
  std::string id;
  std::string reason;
  std::string workspace;
  std::uint64_t sequence_number = 0;
  std::int64_t submitted_at_ms = 0;
};

struct DialogResolution {
  bool should_continue = false;
  std::string user_input;
  std::vector<Attachment> attachments;
};

struct HistoryEntry {
  std::int64_t timestamp_ms = 0;
  std::string reason;
  std::string user_input;
  bool continued = false;
};

/// `dialog_<unix-ms>_<12 hex chars>`.
[[nodiscard]] std::string make_dialog_id();

[[nodiscard]] std::string attachment_to_json(const Attachment &attachment);
[[nodiscard]] std::string attachments_to_json(const std::vector<Attachment> &attachments);
/// Decodes `[{type|kind, name, content, mimeType?}, ...]`; entries of unknown kind are dropped.
[[nodiscard]] std::vector<Attachment> parse_attachments(const std::string &array_json);

[[nodiscard]] std::string request_to_json(const DialogRequest &request);
[[nodiscard]] std::string requests_to_json(const std::vector<DialogRequest> &requests);
[[nodiscard]] common::Result<DialogRequest> parse_request(const std::string &json);

[[nodiscard]] std::string resolution_to_json(const DialogResolution &resolution);
[[nodiscard]] common::Result<DialogResolution> parse_resolution(const std::string &json);

} // namespace hitlgate::dialog
