#include "test_framework.hpp"

#include "hitlgate/bridge/leader_client.hpp"
#include "hitlgate/bridge/polling_bridge.hpp"
#include "hitlgate/common/json_util.hpp"
#include "hitlgate/health/health.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <atomic>
#include <mutex>
#include <thread>

namespace {

namespace br = hitlgate::bridge;
namespace common = hitlgate::common;
namespace dl = hitlgate::dialog;
using hitlgate::testing::FakeHttpClient;

std::string pending_body(const std::vector<std::string> &ids) {
  std::string out = R"({"dialogs":[)";
  for (std::size_t i = 0; i < ids.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += R"({"id":")" + ids[i] + R"(","reason":"r","workspace":"/w","sequenceNumber":)" +
           std::to_string(i + 1) + "}";
  }
  return out + "]}";
}

struct BridgeFixture {
  std::shared_ptr<FakeHttpClient> http = std::make_shared<FakeHttpClient>();
  std::shared_ptr<br::LeaderClient> client =
      std::make_shared<br::LeaderClient>(http, "127.0.0.1", 24001);
  br::PollingBridge bridge{client, {"/w"}, br::PollingBridgeOptions{}};
  std::vector<std::string> claimed;

  BridgeFixture() {
    bridge.set_claim_callback(
        [this](const dl::DialogRequest &request) { claimed.push_back(request.id); });
  }
};

} // namespace

void register_bridge_tests(std::vector<hitlgate::tests::TestCase> &tests) {
  using hitlgate::tests::require;

  tests.push_back({"leader_client_pending_encodes_workspace", [] {
                     auto http = std::make_shared<FakeHttpClient>();
                     http->set_handler([](const FakeHttpClient::Call &) {
                       return FakeHttpClient::reply(200, pending_body({"dialog_1_a", "dialog_2_b"}));
                     });
                     br::LeaderClient client(http, "127.0.0.1", 24001);
                     require(client.base_url() == "http://127.0.0.1:24001", "base url");

                     const auto pending = client.pending(std::string("/home/me/my proj"), 500);
                     require(pending.ok(), pending.error());
                     require(pending.value().size() == 2, "two dialogs");
                     require(pending.value()[1].sequence_number == 2, "sequence number parsed");

                     const auto calls = http->calls();
                     require(calls.size() == 1 && calls[0].method == "GET", "one GET");
                     require(calls[0].url ==
                                 "http://127.0.0.1:24001/pending?workspace=%2Fhome%2Fme%2Fmy%20proj",
                             "url: " + calls[0].url);
                     require(calls[0].timeout_ms == 500, "timeout forwarded");

                     (void)client.pending(std::nullopt, 500);
                     require(http->calls().back().url == "http://127.0.0.1:24001/pending",
                             "no filter without a workspace");
                   }});

  tests.push_back({"leader_client_pending_rejects_bad_bodies", [] {
                     auto http = std::make_shared<FakeHttpClient>();
                     br::LeaderClient client(http, "127.0.0.1", 24001);
                     const auto down = client.pending(std::nullopt, 100);
                     require(down.code() == common::StatusCode::Unavailable, "unreachable");

                     http->set_handler([](const FakeHttpClient::Call &) {
                       return FakeHttpClient::reply(500, "{}");
                     });
                     const auto failed = client.pending(std::nullopt, 100);
                     require(!failed.ok() && failed.code() != common::StatusCode::Unavailable,
                             "HTTP errors are not unavailability");

                     http->set_handler([](const FakeHttpClient::Call &) {
                       return FakeHttpClient::reply(200, R"({"other":1})");
                     });
                     require(!client.pending(std::nullopt, 100).ok(), "missing dialogs array");

                     http->set_handler([](const FakeHttpClient::Call &) {
                       return FakeHttpClient::reply(200, R"({"dialogs":[]})");
                     });
                     const auto empty = client.pending(std::nullopt, 100);
                     require(empty.ok() && empty.value().empty(), "empty list is fine");
                   }});

  tests.push_back({"leader_client_respond_maps_status", [] {
                     auto http = std::make_shared<FakeHttpClient>();
                     std::atomic<int> status{200};
                     http->set_handler([&status](const FakeHttpClient::Call &) {
                       return FakeHttpClient::reply(static_cast<std::uint16_t>(status.load()),
                                                    "{}");
                     });
                     br::LeaderClient client(http, "127.0.0.1", 24001);
                     dl::DialogResolution resolution;
                     resolution.should_continue = true;
                     resolution.user_input = "ok";

                     require(client.respond("dialog_9_x", resolution, 100).ok(), "200 is success");
                     const auto call = http->calls().back();
                     require(call.method == "POST" &&
                                 call.url == "http://127.0.0.1:24001/respond",
                             "POST /respond");
                     require(common::json_is_valid(call.body), "body must be JSON: " + call.body);
                     require(common::json_get_string(call.body, "dialogId") == "dialog_9_x",
                             "dialogId");
                     require(common::json_get_bool(call.body, "shouldContinue", false),
                             "shouldContinue");
                     require(common::json_get_string(call.body, "userInput") == "ok", "userInput");

                     status = 404;
                     require(client.respond("dialog_9_x", resolution, 100).code() ==
                                 common::StatusCode::NotFound,
                             "404 is NotFound");
                     status = 500;
                     const auto failed = client.respond("dialog_9_x", resolution, 100);
                     require(!failed.ok() && failed.code() != common::StatusCode::NotFound,
                             "500 is an error");
                   }});

  tests.push_back({"leader_client_request_dialog_parses_resolution", [] {
                     auto http = std::make_shared<FakeHttpClient>();
                     http->set_handler([](const FakeHttpClient::Call &) {
                       return FakeHttpClient::reply(
                           200, R"({"shouldContinue":true,"userInput":"next","attachments":[]})");
                     });
                     br::LeaderClient client(http, "127.0.0.1", 24001);
                     const auto resolution = client.request_dialog("why", "/w");
                     require(resolution.ok(), resolution.error());
                     require(resolution.value().should_continue, "continue");
                     require(resolution.value().user_input == "next", "input");
                     const auto call = http->calls().back();
                     require(call.url == "http://127.0.0.1:24001/dialog", "POST /dialog");
                     require(common::json_get_string(call.body, "reason") == "why", "reason");
                     require(call.timeout_ms == 0, "no deadline");
                   }});

  tests.push_back({"bridge_tick_claims_new_dialogs_once", [] {
                     hitlgate::health::clear();
                     BridgeFixture fx;
                     std::vector<std::string> listed{"dialog_1_a", "dialog_2_b"};
                     std::mutex listed_mutex;
                     fx.http->set_handler([&](const FakeHttpClient::Call &) {
                       std::lock_guard<std::mutex> lock(listed_mutex);
                       return FakeHttpClient::reply(200, pending_body(listed));
                     });

                     fx.bridge.tick();
                     require(fx.claimed.size() == 2, "both dialogs claimed");
                     require(fx.bridge.seen_count() == 2, "seen set");
                     require(fx.http->calls().front().url.find("workspace=%2Fw") !=
                                 std::string::npos,
                             "filtered by the local workspace");

                     fx.bridge.tick();
                     require(fx.claimed.size() == 2, "a dialog is claimed only once");

                     {
                       std::lock_guard<std::mutex> lock(listed_mutex);
                       listed = {"dialog_2_b", "dialog_3_c"};
                     }
                     fx.bridge.tick();
                     require(fx.claimed.size() == 3 && fx.claimed.back() == "dialog_3_c",
                             "new dialog claimed");
                     require(!fx.bridge.has_seen("dialog_1_a"),
                             "ids the Leader dropped are pruned");
                     require(hitlgate::health::get_component("bridge")->state == "ok",
                             "bridge healthy");
                   }});

  tests.push_back({"bridge_tick_polls_every_local_workspace", [] {
                     hitlgate::health::clear();
                     auto http = std::make_shared<FakeHttpClient>();
                     http->set_handler([](const FakeHttpClient::Call &call) {
                       if (call.url.find("workspace=%2Fproj%2Fa") != std::string::npos) {
                         return FakeHttpClient::reply(200, pending_body({"dialog_1_a", "dialog_9_x"}));
                       }
                       return FakeHttpClient::reply(200, pending_body({"dialog_2_b", "dialog_9_x"}));
                     });
                     auto client = std::make_shared<br::LeaderClient>(http, "127.0.0.1", 24001);
                     br::PollingBridge bridge(client, {"/proj/a", "/proj/b"});
                     std::vector<std::string> claimed;
                     bridge.set_claim_callback(
                         [&claimed](const dl::DialogRequest &request) { claimed.push_back(request.id); });

                     bridge.tick();
                     const auto calls = http->calls();
                     require(calls.size() == 2, "one query per workspace");
                     require(calls[1].url.find("workspace=%2Fproj%2Fb") != std::string::npos,
                             "second workspace queried: " + calls[1].url);
                     require(claimed == std::vector<std::string>{"dialog_1_a", "dialog_9_x",
                                                                 "dialog_2_b"},
                             "listings merged by id");

                     bridge.tick();
                     require(claimed.size() == 3, "nothing claimed twice");
                     require(bridge.has_seen("dialog_2_b"),
                             "ids from the second workspace are not pruned");
                     hitlgate::health::clear();
                   }});

  tests.push_back({"bridge_tick_keeps_seen_ids_when_one_query_fails", [] {
                     hitlgate::health::clear();
                     auto http = std::make_shared<FakeHttpClient>();
                     std::atomic<bool> second_up{true};
                     http->set_handler([&second_up](const FakeHttpClient::Call &call) {
                       if (call.url.find("workspace=%2Fproj%2Fb") != std::string::npos) {
                         return second_up ? FakeHttpClient::reply(200, pending_body({"dialog_2_b"}))
                                          : FakeHttpClient::unreachable();
                       }
                       return FakeHttpClient::reply(200, pending_body({}));
                     });
                     auto client = std::make_shared<br::LeaderClient>(http, "127.0.0.1", 24001);
                     br::PollingBridge bridge(client, {"/proj/a", "/proj/b"});
                     bridge.tick();
                     require(bridge.has_seen("dialog_2_b"), "claimed");

                     second_up = false;
                     bridge.tick();
                     require(bridge.has_seen("dialog_2_b"), "a failed query prunes nothing");
                     require(hitlgate::health::get_component("bridge")->state == "error",
                             "failure reported");
                     hitlgate::health::clear();
                   }});

  tests.push_back({"bridge_tick_absorbs_network_failures", [] {
                     hitlgate::health::clear();
                     BridgeFixture fx;
                     fx.bridge.tick();
                     require(fx.claimed.empty(), "nothing claimed");
                     const auto component = hitlgate::health::get_component("bridge");
                     require(component.has_value() && component->state == "error",
                             "bridge marked as error");
                     require(hitlgate::health::overall_state() == "degraded", "degraded");
                     hitlgate::health::clear();
                   }});

  tests.push_back({"bridge_relay_tracks_outcome", [] {
                     hitlgate::testing::ObserverScope scope;
                     BridgeFixture fx;
                     std::atomic<bool> reachable{true};
                     fx.http->set_handler([&reachable](const FakeHttpClient::Call &call) {
                       if (!reachable) {
                         return FakeHttpClient::unreachable();
                       }
                       if (call.method == "GET") {
                         return FakeHttpClient::reply(200, pending_body({"dialog_1_a", "dialog_2_b"}));
                       }
                       return FakeHttpClient::reply(200, R"({"success":true})");
                     });
                     fx.bridge.tick();
                     require(fx.bridge.seen_count() == 2, "two seen");

                     require(fx.bridge.relay("dialog_1_a", dl::DialogResolution{}).ok(), "relayed");
                     require(!fx.bridge.has_seen("dialog_1_a"), "relayed id is forgotten");

                     reachable = false;
                     const auto failed = fx.bridge.relay("dialog_2_b", dl::DialogResolution{});
                     require(failed.code() == common::StatusCode::Unavailable, "unavailable");
                     require(fx.bridge.has_seen("dialog_2_b"),
                             "an unreachable Leader keeps the id tracked");
                     require(scope.recorder().count<hitlgate::observability::RelayEvent>() == 2,
                             "relay events recorded");
                   }});

  tests.push_back({"bridge_start_and_stop_poll_on_a_timer", [] {
                     auto http = std::make_shared<FakeHttpClient>();
                     http->set_handler([](const FakeHttpClient::Call &) {
                       return FakeHttpClient::reply(200, pending_body({}));
                     });
                     auto client = std::make_shared<br::LeaderClient>(http, "127.0.0.1", 24001);
                     br::PollingBridgeOptions options;
                     options.interval = std::chrono::milliseconds(50);
                     br::PollingBridge bridge(client, {}, options);
                     bridge.start();
                     require(bridge.is_running(), "running");
                     require(hitlgate::testing::wait_until(
                                 [&http]() { return http->calls().size() >= 3; }),
                             "should poll repeatedly");
                     bridge.stop();
                     require(!bridge.is_running(), "stopped");
                     const auto after = http->calls().size();
                     std::this_thread::sleep_for(std::chrono::milliseconds(150));
                     require(http->calls().size() == after, "no polling after stop");
                     require(http->calls().front().url == "http://127.0.0.1:24001/pending",
                             "no workspace filter without local workspaces");
                   }});
}
