#pragma once

#include "hitlgate/common/result.hpp"
#include "hitlgate/dialog/types.hpp"
#include "hitlgate/rpc/protocol.hpp"

#include <memory>
#include <string>

namespace hitlgate::rpc {

/// Where a `tools/call` goes to obtain a human decision. Blocks until one exists.
class IDialogBackend {
public:
  virtual ~IDialogBackend() = default;
  [[nodiscard]] virtual common::Result<dialog::DialogResolution>
  request_dialog(const std::string &reason, const std::string &workspace) = 0;
};

struct RpcReply {
  enum class Kind { Response, Notification, ParseError };

  Kind kind = Kind::Notification;
  /// Complete JSON-RPC response text; empty for notifications.
  std::string body;
};

/// Text returned to the agent for a resolved dialog.
[[nodiscard]] std::string format_tool_result_text(const dialog::DialogResolution &resolution);

class RpcHandler {
public:
  RpcHandler(std::shared_ptr<IDialogBackend> backend, std::string server_version);

  /// Decode and dispatch one message. Thread-safe; a tools/call blocks the calling thread.
  [[nodiscard]] RpcReply handle(const std::string &message_json);
  [[nodiscard]] RpcReply dispatch(const RpcMessage &message);

  [[nodiscard]] std::string initialize_result() const;
  [[nodiscard]] static std::string tools_list_result();

private:
  [[nodiscard]] std::string call_tool(const ToolsCallRequest &request);

  std::shared_ptr<IDialogBackend> backend_;
  std::string server_version_;
};

} // namespace hitlgate::rpc
