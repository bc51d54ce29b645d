#include "test_framework.hpp"

#include "hitlgate/common/json_util.hpp"
#include "hitlgate/rpc/backends.hpp"
#include "hitlgate/rpc/handler.hpp"
#include "hitlgate/rpc/protocol.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <thread>

namespace {

namespace rpc = hitlgate::rpc;
namespace dl = hitlgate::dialog;
namespace common = hitlgate::common;

class FixedBackend final : public rpc::IDialogBackend {
public:
  explicit FixedBackend(common::Result<dl::DialogResolution> answer) : answer_(std::move(answer)) {}

  [[nodiscard]] common::Result<dl::DialogResolution>
  request_dialog(const std::string &reason, const std::string &workspace) override {
    last_reason = reason;
    last_workspace = workspace;
    return answer_;
  }

  std::string last_reason;
  std::string last_workspace;

private:
  common::Result<dl::DialogResolution> answer_;
};

std::string tools_call(const std::string &id, const std::string &tool, const std::string &reason,
                       const std::string &workspace) {
  return R"({"jsonrpc":"2.0","id":)" + id + R"(,"method":"tools/call","params":{"name":")" + tool +
         R"(","arguments":{"reason":)" + common::json_quote(reason) +
         R"(,"workspace":)" + common::json_quote(workspace) + "}}}";
}

std::string result_text(const std::string &response) {
  const auto result = common::json_get_object(response, "result");
  const auto content = common::json_get_array(result, "content");
  const auto items = common::json_split_top_level_objects(content);
  return items.empty() ? "" : common::json_get_string(items[0], "text");
}

} // namespace

void register_rpc_tests(std::vector<hitlgate::tests::TestCase> &tests) {
  using hitlgate::tests::require;

  tests.push_back({"decode_classifies_messages", [] {
                     const auto init = rpc::decode_message(R"({"jsonrpc":"2.0","id":1,"method":"initialize"})");
                     require(init.ok() && std::holds_alternative<rpc::InitializeRequest>(init.value()),
                             "initialize");
                     require(std::get<rpc::InitializeRequest>(init.value()).id == "1", "numeric id");

                     const auto note = rpc::decode_message(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
                     require(note.ok() &&
                                 std::holds_alternative<rpc::InitializedNotification>(note.value()),
                             "initialized notification");

                     const auto call = rpc::decode_message(tools_call(R"("abc")", "AI_chat_HITL", "r", "/w"));
                     require(call.ok(), call.error());
                     const auto &request = std::get<rpc::ToolsCallRequest>(call.value());
                     require(request.id == "\"abc\"", "string id kept with quotes");
                     require(request.reason == "r" && request.workspace == "/w", "arguments");

                     const auto unknown = rpc::decode_message(R"({"id":7,"method":"resources/list"})");
                     require(std::holds_alternative<rpc::UnknownRequest>(unknown.value()),
                             "unknown request");
                     const auto unknown_note = rpc::decode_message(R"({"method":"$/cancel"})");
                     require(std::holds_alternative<rpc::UnknownNotification>(unknown_note.value()),
                             "unknown notification");

                     require(!rpc::decode_message("{not json").ok(), "garbage");
                     require(!rpc::decode_message(R"({"id":1})").ok(), "missing method");
                   }});

  tests.push_back({"initialize_is_idempotent", [] {
                     auto backend = std::make_shared<FixedBackend>(
                         common::Result<dl::DialogResolution>::success({}));
                     rpc::RpcHandler handler(backend, "1.5.0");
                     const std::string message = R"({"jsonrpc":"2.0","id":1,"method":"initialize"})";
                     const auto first = handler.handle(message);
                     const auto second = handler.handle(message);
                     require(first.kind == rpc::RpcReply::Kind::Response, "response expected");
                     require(first.body == second.body, "initialize must be idempotent");
                     const auto result = common::json_get_object(first.body, "result");
                     require(common::json_get_string(result, "protocolVersion") == "2024-11-05",
                             "protocol version");
                     require(common::json_get_string(common::json_get_object(result, "serverInfo"),
                                                     "version") == "1.5.0",
                             "server version");
                   }});

  tests.push_back({"tools_list_describes_single_tool", [] {
                     const std::string result = rpc::RpcHandler::tools_list_result();
                     require(common::json_is_valid(result), "tools/list result must be valid JSON");
                     const auto tools =
                         common::json_split_top_level_objects(common::json_get_array(result, "tools"));
                     require(tools.size() == 1, "exactly one tool");
                     require(common::json_get_string(tools[0], "name") == "AI_chat_HITL", "tool name");
                     const auto schema = common::json_get_object(tools[0], "inputSchema");
                     require(common::json_get_array(schema, "required") ==
                                 R"(["reason","workspace"])",
                             "required arguments");
                   }});

  tests.push_back({"tools_call_continue_end_to_end", [] {
                     auto registry = std::make_shared<dl::PendingRegistry>();
                     rpc::RpcHandler handler(std::make_shared<rpc::LocalDialogBackend>(registry),
                                             "1.5.0");
                     std::thread human([&registry]() {
                       hitlgate::testing::wait_until(
                           [&registry]() { return registry->pending_count() == 1; });
                       const auto pending = registry->list_pending();
                       dl::DialogResolution resolution;
                       resolution.should_continue = true;
                       resolution.user_input = "keep going";
                       resolution.attachments.push_back(dl::Attachment{
                           .kind = dl::AttachmentKind::Code, .name = "a.py", .content = "print(1)",
                           .mime_type = std::nullopt});
                       (void)registry->resolve(pending.front().id, resolution);
                     });
                     const auto reply =
                         handler.handle(tools_call("5", "AI_chat_HITL", "finished step", "/proj"));
                     human.join();

                     require(reply.kind == rpc::RpcReply::Kind::Response, "response expected");
                     const std::string text = result_text(reply.body);
                     require(text.find("keep going") != std::string::npos, "user input in text");
                     require(text.find("print(1)") != std::string::npos, "attachment in text");
                     const auto history = registry->history("/proj");
                     require(history.size() == 1 && history[0].continued, "history recorded");
                   }});

  tests.push_back({"tools_call_stop_uses_fixed_text", [] {
                     dl::DialogResolution stop;
                     stop.should_continue = false;
                     stop.user_input = "this text is ignored";
                     auto backend = std::make_shared<FixedBackend>(
                         common::Result<dl::DialogResolution>::success(stop));
                     rpc::RpcHandler handler(backend, "1.5.0");
                     const auto reply = handler.handle(tools_call("2", "AI_chat_HITL", "r", "/w"));
                     const std::string text = result_text(reply.body);
                     require(text == rpc::format_tool_result_text(stop), "stop text");
                     require(text.find("ignored") == std::string::npos,
                             "user input must not leak into the stop text");
                     require(backend->last_workspace == "/w", "workspace forwarded");
                   }});

  tests.push_back({"tools_call_errors", [] {
                     auto backend = std::make_shared<FixedBackend>(
                         common::Result<dl::DialogResolution>::failure(
                             "Leader at 127.0.0.1:23987 unreachable",
                             common::StatusCode::Unavailable));
                     rpc::RpcHandler handler(backend, "1.5.0");

                     const auto wrong_tool = handler.handle(tools_call("3", "other", "r", "/w"));
                     const auto wrong_error = common::json_get_object(wrong_tool.body, "error");
                     require(common::json_get_number(wrong_error, "code") == "-32601",
                             "unknown tool code");
                     require(common::json_get_string(wrong_error, "message") == "Unknown tool: other",
                             "unknown tool message");

                     const auto failed = handler.handle(tools_call("4", "AI_chat_HITL", "r", "/w"));
                     const auto failed_error = common::json_get_object(failed.body, "error");
                     require(common::json_get_number(failed_error, "code") == "-32000",
                             "backend failure code");
                     require(common::json_get_string(failed_error, "message")
                                     .find("127.0.0.1:23987") != std::string::npos,
                             "failure should name the endpoint");
                   }});

  tests.push_back({"unknown_method_and_parse_error", [] {
                     auto backend = std::make_shared<FixedBackend>(
                         common::Result<dl::DialogResolution>::success({}));
                     rpc::RpcHandler handler(backend, "1.5.0");
                     const auto unknown = handler.handle(R"({"jsonrpc":"2.0","id":9,"method":"ping"})");
                     require(common::json_get_number(common::json_get_object(unknown.body, "error"),
                                                     "code") == "-32601",
                             "method not found");
                     require(common::json_get_number(unknown.body, "id") == "9", "id echoed");

                     const auto note = handler.handle(R"({"jsonrpc":"2.0","method":"initialized"})");
                     require(note.kind == rpc::RpcReply::Kind::Notification && note.body.empty(),
                             "notifications get no reply");

                     const auto bad = handler.handle("][");
                     require(bad.kind == rpc::RpcReply::Kind::ParseError, "parse error kind");
                     require(common::json_get_raw(bad.body, "id") == "null", "null id");
                   }});

  tests.push_back({"remote_backend_reports_unreachable_leader", [] {
                     auto http = std::make_shared<hitlgate::testing::FakeHttpClient>();
                     auto client = std::make_shared<hitlgate::bridge::LeaderClient>(
                         http, "127.0.0.1", 24999);
                     rpc::RemoteDialogBackend backend(client);
                     const auto result = backend.request_dialog("r", "/w");
                     require(!result.ok(), "should fail without a leader");
                     require(result.code() == common::StatusCode::Unavailable, "unavailable");
                     require(result.error().find("127.0.0.1:24999") != std::string::npos,
                             "error names the endpoint: " + result.error());
                     const auto calls = http->calls();
                     require(calls.size() == 1 && calls[0].timeout_ms == 0,
                             "dialog requests wait without a deadline");
                   }});
}
