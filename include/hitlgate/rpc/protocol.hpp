#pragma once

#include "hitlgate/common/result.hpp"

#include <string>
#include <variant>

namespace hitlgate::rpc {

inline constexpr const char *kProtocolVersion = "2024-11-05";
inline constexpr const char *kServerName = "AI_chat_HITL";
inline constexpr const char *kToolName = "AI_chat_HITL";

inline constexpr int kParseError = -32700;
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kToolFailure = -32000;

// Request ids are kept as raw JSON text (a number or a quoted string) and echoed verbatim.

struct InitializeRequest {
  std::string id;
};

struct InitializedNotification {};

struct ToolsListRequest {
  std::string id;
};

struct ToolsCallRequest {
  std::string id;
  std::string tool_name;
  std::string reason;
  std::string workspace;
};

struct UnknownRequest {
  std::string id;
  std::string method;
};

struct UnknownNotification {
  std::string method;
};

using RpcMessage = std::variant<InitializeRequest, InitializedNotification, ToolsListRequest,
                                ToolsCallRequest, UnknownRequest, UnknownNotification>;

/// Classifies one JSON-RPC message. Fails (InvalidArgument) when the text is not a JSON object
/// with a string `method`; callers answer that with parse_error_response().
[[nodiscard]] common::Result<RpcMessage> decode_message(const std::string &json);

[[nodiscard]] std::string make_result(const std::string &id, const std::string &result_json);
[[nodiscard]] std::string make_error(const std::string &id, int code, const std::string &message);
[[nodiscard]] std::string parse_error_response();

} // namespace hitlgate::rpc
