#include "test_framework.hpp"

#include "hitlgate/common/json_util.hpp"
#include "hitlgate/dialog/registry.hpp"
#include "hitlgate/gateway/http.hpp"
#include "hitlgate/gateway/server.hpp"
#include "hitlgate/gateway/stream_hub.hpp"
#include "hitlgate/health/health.hpp"
#include "hitlgate/rpc/backends.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <future>
#include <thread>

namespace {

namespace gw = hitlgate::gateway;
namespace common = hitlgate::common;
namespace dl = hitlgate::dialog;

struct Fixture {
  std::shared_ptr<dl::PendingRegistry> registry = std::make_shared<dl::PendingRegistry>();
  std::shared_ptr<hitlgate::rpc::RpcHandler> handler = std::make_shared<hitlgate::rpc::RpcHandler>(
      std::make_shared<hitlgate::rpc::LocalDialogBackend>(registry), "1.5.0");
  gw::CoordinationServer server{registry, handler, gw::ServerOptions{}};
};

gw::HttpRequest make_request(const std::string &method, const std::string &raw_path,
                             const std::string &body = "") {
  std::string raw = method + " " + raw_path + " HTTP/1.1\r\nHost: x\r\n";
  if (!body.empty()) {
    raw += "Content-Length: " + std::to_string(body.size()) + "\r\n";
  }
  raw += "\r\n" + body;
  auto parsed = gw::parse_http_request(raw);
  if (!parsed.ok()) {
    throw std::runtime_error("bad test request: " + parsed.error());
  }
  return parsed.value();
}

} // namespace

void register_gateway_tests(std::vector<hitlgate::tests::TestCase> &tests) {
  using hitlgate::tests::require;

  tests.push_back({"parse_http_request_reads_head_and_body", [] {
                     const auto parsed = gw::parse_http_request(
                         "POST /respond?x=1 HTTP/1.1\r\nContent-Type: application/json\r\n"
                         "X-Mixed-Case:  v \r\n\r\n{\"a\":1}");
                     require(parsed.ok(), parsed.error());
                     const auto &request = parsed.value();
                     require(request.method == "POST", "method");
                     require(request.path == "/respond", "path without query");
                     require(request.raw_path == "/respond?x=1", "raw path");
                     require(gw::header_lookup(request, "x-mixed-case") == "v",
                             "header keys are lowercased and values trimmed");
                     require(gw::header_lookup(request, "Content-Type") == "application/json",
                             "lookup is case-insensitive");
                     require(request.body == "{\"a\":1}", "body");

                     require(!gw::parse_http_request("GET / HTTP/1.1\r\n").ok(),
                             "missing blank line");
                     require(!gw::parse_http_request("GARBAGE\r\n\r\n").ok(),
                             "bad request line");
                   }});

  tests.push_back({"query_string_is_url_decoded", [] {
                     const auto query =
                         gw::parse_query_string("workspace=%2Fhome%2Fme%2Fmy%20proj&flag&&x=a+b");
                     require(query.at("workspace") == "/home/me/my proj", "encoded path");
                     require(query.contains("flag") && query.at("flag").empty(), "bare key");
                     require(query.at("x") == "a b", "plus is a space");
                   }});

  tests.push_back({"render_includes_cors_headers", [] {
                     const auto json = gw::render_http_response(gw::make_json_response(404, "{}"));
                     require(json.rfind("HTTP/1.1 404 Not Found\r\n", 0) == 0, "status line");
                     require(json.find("Content-Type: application/json\r\n") != std::string::npos,
                             "content type");
                     require(json.find("Access-Control-Allow-Origin: *\r\n") != std::string::npos,
                             "allow origin");
                     require(json.find("Access-Control-Allow-Methods: GET, POST, OPTIONS\r\n") !=
                                 std::string::npos,
                             "allow methods");
                     require(json.find("Content-Length: 2\r\n") != std::string::npos, "length");

                     const auto empty = gw::render_http_response(gw::make_empty_response(204));
                     require(empty.rfind("HTTP/1.1 204 No Content\r\n", 0) == 0, "204");
                     require(empty.find("\r\nContent-Type:") == std::string::npos,
                             "empty responses carry no content type");
                     require(empty.find("Access-Control-Allow-Headers: Content-Type\r\n") !=
                                 std::string::npos,
                             "empty responses keep the CORS headers");
                     require(gw::status_text(413) == "Payload Too Large", "413 text");
                   }});

  tests.push_back({"dispatch_options_and_unknown_routes", [] {
                     Fixture fx;
                     const auto options = fx.server.dispatch(make_request("OPTIONS", "/dialog"));
                     require(options.status == 200 && options.body.empty(), "preflight");
                     require(options.headers.at("Access-Control-Allow-Headers") == "Content-Type",
                             "preflight headers");

                     const auto missing = fx.server.dispatch(make_request("GET", "/nope"));
                     require(missing.status == 404, "unknown route");
                     require(missing.body == R"({"error":"not found"})", "404 body");
                     require(fx.server.dispatch(make_request("GET", "/respond")).status == 404,
                             "wrong method");
                   }});

  tests.push_back({"dispatch_pending_filters_by_workspace", [] {
                     Fixture fx;
                     const auto a = fx.registry->submit("first", "/work/a");
                     const auto b = fx.registry->submit("second", "/work/b");

                     const auto all = fx.server.dispatch(make_request("GET", "/pending"));
                     require(all.status == 200, "status");
                     const auto all_dialogs = common::json_split_top_level_objects(
                         common::json_get_array(all.body, "dialogs"));
                     require(all_dialogs.size() == 2, "both dialogs listed");

                     const auto filtered = fx.server.dispatch(
                         make_request("GET", "/pending?workspace=%2Fwork%2Fb%2Fsub"));
                     const auto dialogs = common::json_split_top_level_objects(
                         common::json_get_array(filtered.body, "dialogs"));
                     require(dialogs.size() == 1, "one dialog for /work/b/sub");
                     require(common::json_get_string(dialogs[0], "id") == b.request.id,
                             "containment match");
                     require(common::json_get_number(dialogs[0], "sequenceNumber") == "1",
                             "sequence number");

                     (void)fx.registry->resolve(a.request.id, dl::DialogResolution{});
                     (void)fx.registry->resolve(b.request.id, dl::DialogResolution{});
                   }});

  tests.push_back({"dispatch_respond_validates_and_resolves", [] {
                     Fixture fx;
                     const auto ticket = fx.registry->submit("r", "/w");

                     const auto invalid =
                         fx.server.dispatch(make_request("POST", "/respond", "[1,2]"));
                     require(invalid.status == 400, "array body");
                     require(invalid.body == R"({"error":"Invalid request"})", "400 body");
                     require(fx.server
                                     .dispatch(make_request("POST", "/respond",
                                                            R"({"shouldContinue":true})"))
                                     .status == 400,
                             "missing id");

                     const auto unknown = fx.server.dispatch(make_request(
                         "POST", "/respond", R"({"dialogId":"dialog_0_x","shouldContinue":true})"));
                     require(unknown.status == 404, "unknown id");
                     require(unknown.body == R"({"error":"Dialog not found"})", "404 body");

                     const auto ok = fx.server.dispatch(make_request(
                         "POST", "/respond",
                         R"({"dialogId":")" + ticket.request.id +
                             R"(","shouldContinue":true,"userInput":"go","attachments":[{"type":"code","name":"a.sh","content":"ls"}]})"));
                     require(ok.status == 200 && ok.body == R"({"success":true})", "resolved");
                     const auto resolution = ticket.resolution.get();
                     require(resolution.should_continue && resolution.user_input == "go",
                             "resolution delivered");
                     require(resolution.attachments.size() == 1 &&
                                 resolution.attachments[0].kind == dl::AttachmentKind::Code,
                             "attachment delivered");

                     const auto again = fx.server.dispatch(make_request(
                         "POST", "/respond",
                         R"({"id":")" + ticket.request.id + R"(","shouldContinue":false})"));
                     require(again.status == 404, "second answer must be rejected");
                   }});

  tests.push_back({"dispatch_dialog_blocks_until_resolved", [] {
                     Fixture fx;
                     require(fx.server.dispatch(make_request("POST", "/dialog", "nope")).status ==
                                 400,
                             "non-object body");

                     auto pending = std::async(std::launch::async, [&fx]() {
                       return fx.server.dispatch(make_request(
                           "POST", "/dialog", R"({"reason":"deploy?","workspace":"/srv"})"));
                     });
                     require(hitlgate::testing::wait_until(
                                 [&fx]() { return fx.registry->pending_count() == 1; }),
                             "dialog should be registered");
                     const auto listed = fx.registry->list_pending();
                     require(listed.front().reason == "deploy?", "reason");
                     dl::DialogResolution answer;
                     answer.should_continue = false;
                     require(fx.registry->resolve(listed.front().id, answer).ok(), "resolve");

                     const auto response = pending.get();
                     require(response.status == 200, "status");
                     require(!common::json_get_bool(response.body, "shouldContinue", true),
                             "shouldContinue false");
                     require(common::json_get_array(response.body, "attachments") == "[]",
                             "empty attachments");
                   }});

  tests.push_back({"dispatch_health_reports_counts", [] {
                     hitlgate::health::clear();
                     Fixture fx;
                     const auto ticket = fx.registry->submit("r", "/w");
                     const auto health = fx.server.dispatch(make_request("GET", "/health"));
                     require(health.status == 200, "status");
                     require(common::json_is_valid(health.body), "valid json");
                     require(common::json_get_string(health.body, "status") == "ok", "status ok");
                     require(common::json_get_string(health.body, "version") == "1.5.0",
                             "version");
                     require(common::json_get_string(health.body, "role") == "leader", "role");
                     require(common::json_get_number(health.body, "pendingCount") == "1",
                             "pending count");
                     require(common::json_get_number(health.body, "subscriberCount") == "0",
                             "no subscribers");
                     require(common::json_get_number(health.body, "totalDialogs") == "1",
                             "total dialogs");
                     require(common::json_get_string(health.body, "health") == "ok", "health");
                     (void)fx.registry->resolve(ticket.request.id, dl::DialogResolution{});
                   }});

  tests.push_back({"dispatch_rpc_routes", [] {
                     Fixture fx;
                     const std::string list = R"({"jsonrpc":"2.0","id":3,"method":"tools/list"})";
                     const std::string note =
                         R"({"jsonrpc":"2.0","method":"notifications/initialized"})";

                     const auto messages = fx.server.dispatch(make_request("POST", "/messages", list));
                     require(messages.status == 200, "messages status");
                     require(common::json_get_number(messages.body, "id") == "3", "id echoed");
                     require(fx.server.dispatch(make_request("POST", "/mcp", list)).status == 200,
                             "/mcp alias");
                     require(fx.server.dispatch(make_request("POST", "/message?session=1", list))
                                     .status == 200,
                             "/message prefix");

                     const auto quiet = fx.server.dispatch(make_request("POST", "/messages", note));
                     require(quiet.status == 204 && quiet.body.empty(), "notification on /messages");
                     const auto accepted = fx.server.dispatch(make_request("POST", "/sse", note));
                     require(accepted.status == 202, "notification on /sse");

                     const auto bad = fx.server.dispatch(make_request("POST", "/messages", "{oops"));
                     require(bad.status == 400, "parse error status");
                     require(common::json_get_number(common::json_get_object(bad.body, "error"),
                                                     "code") == "-32700",
                             "parse error code");
                   }});

  tests.push_back({"sse_event_format", [] {
                     require(gw::sse_event("message", "{}") == "event: message\ndata: {}\n\n",
                             "event framing");
                   }});

  tests.push_back({"start_reports_address_in_use", [] {
                     Fixture first;
                     gw::ServerOptions options;
                     options.port = hitlgate::testing::free_port();
                     gw::CoordinationServer a(first.registry, first.handler, options);
                     require(a.start().ok(), "first bind");
                     require(a.port() == options.port, "bound port");

                     Fixture second;
                     gw::CoordinationServer b(second.registry, second.handler, options);
                     const auto status = b.start();
                     require(!status.ok(), "second bind must fail");
                     require(status.code() == common::StatusCode::AddressInUse, "AddressInUse");
                     a.stop();
                     require(!a.is_running(), "stopped");
                   }});
}
