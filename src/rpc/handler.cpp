#include "hitlgate/rpc/handler.hpp"

#include "hitlgate/common/fs.hpp"
#include "hitlgate/common/json_util.hpp"
#include "hitlgate/observability/global.hpp"

#include <sstream>
#include <type_traits>

namespace hitlgate::rpc {

namespace {

constexpr const char *kStopText = "The user chose to end the conversation. Stop all actions "
                                  "immediately and do not continue with any task.";

void append_attachment(std::ostringstream &out, const dialog::Attachment &attachment) {
  switch (attachment.kind) {
  case dialog::AttachmentKind::Image:
    out << "- [image] " << attachment.name << "\n";
    if (common::starts_with(attachment.content, "data:")) {
      out << "Image data (base64): " << attachment.content << "\n";
    }
    break;
  case dialog::AttachmentKind::File:
    out << "- [file] " << attachment.name << "\nContent:\n" << attachment.content << "\n";
    break;
  case dialog::AttachmentKind::Code:
    out << "- [code] " << attachment.name << "\n```\n" << attachment.content << "\n```\n";
    break;
  }
}

} // namespace

std::string format_tool_result_text(const dialog::DialogResolution &resolution) {
  if (!resolution.should_continue) {
    return kStopText;
  }
  std::ostringstream out;
  out << "The user chose to continue with new instructions:\n"
      << resolution.user_input << "\n\nExecute the user's new instructions immediately.";
  if (!resolution.attachments.empty()) {
    out << "\n\nAttachments:\n";
    for (const auto &attachment : resolution.attachments) {
      append_attachment(out, attachment);
    }
  }
  return out.str();
}

RpcHandler::RpcHandler(std::shared_ptr<IDialogBackend> backend, std::string server_version)
    : backend_(std::move(backend)), server_version_(std::move(server_version)) {}

RpcReply RpcHandler::handle(const std::string &message_json) {
  auto decoded = decode_message(message_json);
  if (!decoded.ok()) {
    return RpcReply{.kind = RpcReply::Kind::ParseError, .body = parse_error_response()};
  }
  return dispatch(decoded.value());
}

RpcReply RpcHandler::dispatch(const RpcMessage &message) {
  return std::visit(
      [this](auto &&msg) -> RpcReply {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, InitializeRequest>) {
          return RpcReply{.kind = RpcReply::Kind::Response,
                          .body = make_result(msg.id, initialize_result())};
        } else if constexpr (std::is_same_v<T, ToolsListRequest>) {
          return RpcReply{.kind = RpcReply::Kind::Response,
                          .body = make_result(msg.id, tools_list_result())};
        } else if constexpr (std::is_same_v<T, ToolsCallRequest>) {
          return RpcReply{.kind = RpcReply::Kind::Response, .body = call_tool(msg)};
        } else if constexpr (std::is_same_v<T, UnknownRequest>) {
          return RpcReply{.kind = RpcReply::Kind::Response,
                          .body = make_error(msg.id, kMethodNotFound,
                                             "Method not found: " + msg.method)};
        } else {
          return RpcReply{};
        }
      },
      message);
}

std::string RpcHandler::initialize_result() const {
  return std::string("{\"protocolVersion\":\"") + kProtocolVersion +
         "\",\"capabilities\":{\"tools\":{}},\"serverInfo\":{\"name\":\"" + kServerName +
         "\",\"version\":" + common::json_quote(server_version_) + "}}";
}

std::string RpcHandler::tools_list_result() {
  return std::string("{\"tools\":[{\"name\":\"") + kToolName +
         "\",\"description\":\"Pause and ask the human operator whether to continue. Call this "
         "whenever a task is finished or a decision is needed; the reply carries the user's "
         "new instructions or a request to stop.\","
         "\"inputSchema\":{\"type\":\"object\",\"properties\":{"
         "\"reason\":{\"type\":\"string\",\"description\":\"What was done and why input is "
         "needed\"},"
         "\"workspace\":{\"type\":\"string\",\"description\":\"Absolute path of the current "
         "workspace\"}},"
         "\"required\":[\"reason\",\"workspace\"]}}]}";
}

std::string RpcHandler::call_tool(const ToolsCallRequest &request) {
  if (request.tool_name != kToolName) {
    return make_error(request.id, kMethodNotFound, "Unknown tool: " + request.tool_name);
  }

  auto resolution = backend_->request_dialog(request.reason, request.workspace);
  if (!resolution.ok()) {
    observability::record_error("rpc", resolution.error());
    return make_error(request.id, kToolFailure, "Failed to show dialog: " + resolution.error());
  }

  const std::string text = format_tool_result_text(resolution.value());
  return make_result(request.id, "{\"content\":[{\"type\":\"text\",\"text\":" +
                                     common::json_quote(text) + "}]}");
}

} // namespace hitlgate::rpc
