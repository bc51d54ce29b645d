#include "hitlgate/rpc/protocol.hpp"

#include "hitlgate/common/json_util.hpp"

#include <cctype>

namespace hitlgate::rpc {

namespace {

bool is_valid_id(const std::string &raw) {
  if (raw.empty()) {
    return false;
  }
  return raw.front() == '"' || raw.front() == '-' ||
         std::isdigit(static_cast<unsigned char>(raw.front())) != 0;
}

} // namespace

common::Result<RpcMessage> decode_message(const std::string &json) {
  using Decoded = common::Result<RpcMessage>;
  const std::size_t start = common::json_skip_ws(json, 0);
  if (start >= json.size() || json[start] != '{' || !common::json_is_valid(json)) {
    return Decoded::failure("Parse error", common::StatusCode::InvalidArgument);
  }

  const auto members = common::json_parse_flat(json);
  const auto method_it = members.find("method");
  if (method_it == members.end() || method_it->second.empty() ||
      method_it->second.front() != '"') {
    return Decoded::failure("Parse error", common::StatusCode::InvalidArgument);
  }
  const std::string method =
      common::json_unescape(method_it->second.substr(1, method_it->second.size() - 2));

  std::string id;
  if (const auto id_it = members.find("id"); id_it != members.end() && is_valid_id(id_it->second)) {
    id = id_it->second;
  }
  const bool has_id = !id.empty();

  if (method == "initialize") {
    return Decoded::success(InitializeRequest{.id = has_id ? id : "null"});
  }
  if (method == "initialized" || method == "notifications/initialized") {
    return Decoded::success(InitializedNotification{});
  }
  if (method == "tools/list") {
    return Decoded::success(ToolsListRequest{.id = has_id ? id : "null"});
  }
  if (method == "tools/call") {
    const std::string params = common::json_get_object(json, "params");
    const std::string arguments = common::json_get_object(params, "arguments");
    return Decoded::success(ToolsCallRequest{
        .id = has_id ? id : "null",
        .tool_name = common::json_get_string(params, "name"),
        .reason = common::json_get_string(arguments, "reason"),
        .workspace = common::json_get_string(arguments, "workspace"),
    });
  }
  if (has_id) {
    return Decoded::success(UnknownRequest{.id = id, .method = method});
  }
  return Decoded::success(UnknownNotification{.method = method});
}

std::string make_result(const std::string &id, const std::string &result_json) {
  return "{\"jsonrpc\":\"2.0\",\"id\":" + id + ",\"result\":" + result_json + "}";
}

std::string make_error(const std::string &id, const int code, const std::string &message) {
  return "{\"jsonrpc\":\"2.0\",\"id\":" + id + ",\"error\":{\"code\":" + std::to_string(code) +
         ",\"message\":" + common::json_quote(message) + "}}";
}

std::string parse_error_response() { return make_error("null", kParseError, "Parse error"); }

} // namespace hitlgate::rpc
