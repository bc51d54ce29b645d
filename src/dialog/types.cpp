#include "hitlgate/dialog/types.hpp"

#include "hitlgate/common/clock.hpp"
#include "hitlgate/common/fs.hpp"
#include "hitlgate/common/json_util.hpp"

#include <charconv>
#include <sstream>

namespace hitlgate::dialog {

namespace {

std::optional<std::uint64_t> parse_u64(const std::string &text) {
  std::uint64_t value = 0;
  const auto *first = text.data();
  const auto *last = first + text.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last || text.empty()) {
    return std::nullopt;
  }
  return value;
}

bool is_json_object(const std::string &json) {
  const std::size_t pos = common::json_skip_ws(json, 0);
  return pos < json.size() && json[pos] == '{' && common::json_is_valid(json);
}

} // namespace

const char *attachment_kind_name(const AttachmentKind kind) {
  switch (kind) {
  case AttachmentKind::Image:
    return "image";
  case AttachmentKind::File:
    return "file";
  case AttachmentKind::Code:
    return "code";
  }
  return "file";
}

std::optional<AttachmentKind> parse_attachment_kind(const std::string &name) {
  const std::string lowered = common::to_lower(common::trim(name));
  if (lowered == "image") {
    return AttachmentKind::Image;
  }
  if (lowered == "file") {
    return AttachmentKind::File;
  }
  if (lowered == "code") {
    return AttachmentKind::Code;
  }
  return std::nullopt;
}

std::string make_dialog_id() {
  return "dialog_" + std::to_string(common::now_unix_ms()) + "_" + common::random_hex(6);
}

std::string attachment_to_json(const Attachment &attachment) {
  std::ostringstream out;
  out << "{\"type\":" << common::json_quote(attachment_kind_name(attachment.kind))
      << ",\"name\":" << common::json_quote(attachment.name)
      << ",\"content\":" << common::json_quote(attachment.content);
  if (attachment.mime_type.has_value()) {
    out << ",\"mimeType\":" << common::json_quote(*attachment.mime_type);
  }
  out << "}";
  return out.str();
}

std::string attachments_to_json(const std::vector<Attachment> &attachments) {
  std::string out = "[";
  for (std::size_t i = 0; i < attachments.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += attachment_to_json(attachments[i]);
  }
  out += "]";
  return out;
}

std::vector<Attachment> parse_attachments(const std::string &array_json) {
  std::vector<Attachment> out;
  for (const auto &object : common::json_split_top_level_objects(array_json)) {
    std::string kind_name = common::json_get_string(object, "type");
    if (kind_name.empty()) {
      kind_name = common::json_get_string(object, "kind");
    }
    const auto kind = parse_attachment_kind(kind_name);
    if (!kind.has_value()) {
      continue;
    }
    Attachment attachment;
    attachment.kind = *kind;
    attachment.name = common::json_get_string(object, "name");
    attachment.content = common::json_get_string(object, "content");
    if (!common::json_get_raw(object, "mimeType").empty()) {
      attachment.mime_type = common::json_get_string(object, "mimeType");
    }
    out.push_back(std::move(attachment));
  }
  return out;
}

std::string request_to_json(const DialogRequest &request) {
  std::ostringstream out;
  out << "{\"id\":" << common::json_quote(request.id)
      << ",\"reason\":" << common::json_quote(request.reason)
      << ",\"workspace\":" << common::json_quote(request.workspace)
      << ",\"sequenceNumber\":" << request.sequence_number << "}";
  return out.str();
}

std::string requests_to_json(const std::vector<DialogRequest> &requests) {
  std::string out = "[";
  for (std::size_t i = 0; i < requests.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += request_to_json(requests[i]);
  }
  out += "]";
  return out;
}

common::Result<DialogRequest> parse_request(const std::string &json) {
  if (!is_json_object(json)) {
    return common::Result<DialogRequest>::failure("dialog request is not a JSON object",
                                                  common::StatusCode::InvalidArgument);
  }
  DialogRequest request;
  request.id = common::json_get_string(json, "id");
  if (request.id.empty()) {
    return common::Result<DialogRequest>::failure("dialog request has no id",
                                                  common::StatusCode::InvalidArgument);
  }
  request.reason = common::json_get_string(json, "reason");
  request.workspace = common::json_get_string(json, "workspace");
  if (const auto seq = parse_u64(common::json_get_number(json, "sequenceNumber"));
      seq.has_value()) {
    request.sequence_number = *seq;
  }
  return common::Result<DialogRequest>::success(std::move(request));
}

std::string resolution_to_json(const DialogResolution &resolution) {
  std::ostringstream out;
  out << "{\"shouldContinue\":" << (resolution.should_continue ? "true" : "false")
      << ",\"userInput\":" << common::json_quote(resolution.user_input)
      << ",\"attachments\":" << attachments_to_json(resolution.attachments) << "}";
  return out.str();
}

common::Result<DialogResolution> parse_resolution(const std::string &json) {
  if (!is_json_object(json)) {
    return common::Result<DialogResolution>::failure("resolution is not a JSON object",
                                                     common::StatusCode::InvalidArgument);
  }
  DialogResolution resolution;
  resolution.should_continue = common::json_get_bool(json, "shouldContinue", false);
  resolution.user_input = common::json_get_string(json, "userInput");
  const std::string attachments = common::json_get_array(json, "attachments");
  if (!attachments.empty()) {
    resolution.attachments = parse_attachments(attachments);
  }
  return common::Result<DialogResolution>::success(std::move(resolution));
}

} // namespace hitlgate::dialog
