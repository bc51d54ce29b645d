#include "test_framework.hpp"

#include "hitlgate/common/json_util.hpp"
#include "hitlgate/dialog/registry.hpp"
#include "hitlgate/health/health.hpp"
#include "hitlgate/observability/factory.hpp"
#include "hitlgate/observability/global.hpp"
#include "hitlgate/observability/log_observer.hpp"
#include "hitlgate/observability/multi_observer.hpp"
#include "tests/helpers/test_helpers.hpp"

namespace {

namespace obs = hitlgate::observability;
namespace health = hitlgate::health;

} // namespace

void register_observability_health_tests(std::vector<hitlgate::tests::TestCase> &tests) {
  using hitlgate::tests::require;

  tests.push_back({"factory_builds_backends", [] {
                     require(obs::create_observer("log")->name() == "log", "log backend");
                     require(obs::create_observer("noop")->name() == "noop", "noop backend");
                     require(obs::create_observer(" NONE ")->name() == "noop", "none alias");
                     require(obs::create_observer("prometheus")->name() == "log",
                             "unknown names fall back to log");

                     auto multi = obs::create_observer("log, noop, log");
                     require(multi->name() == "multi", "comma list");
                     const auto *as_multi = dynamic_cast<obs::MultiObserver *>(multi.get());
                     require(as_multi != nullptr && as_multi->size() == 2,
                             "duplicate backends collapse");

                     hitlgate::config::Config config;
                     config.observability.backend = "noop";
                     require(obs::create_observer(config)->name() == "noop", "from config");
                   }});

  tests.push_back({"describe_event_is_readable", [] {
                     require(obs::describe_event(obs::DialogSubmittedEvent{
                                 .id = "d1", .workspace = "/w", .sequence_number = 2}) ==
                                 "dialog.submitted id=d1 workspace=/w seq=2",
                             "submitted");
                     require(obs::describe_event(obs::RelayEvent{
                                 .id = "d2", .success = false, .detail = "down"}) ==
                                 "bridge.relay id=d2 success=false detail=down",
                             "relay");
                     require(obs::describe_event(obs::RoleChangedEvent{.role = "leader", .port = 1}) ==
                                 "node.role role=leader port=1",
                             "role");
                     require(obs::describe_event(obs::ErrorEvent{.component = "c", .message = "m"}) ==
                                 "c: m",
                             "error");
                   }});

  tests.push_back({"registry_reports_lifecycle_events", [] {
                     hitlgate::testing::ObserverScope scope;
                     hitlgate::dialog::PendingRegistry registry;
                     const auto ticket = registry.submit("r", "/w");
                     require(registry.resolve(ticket.request.id, {}).ok(), "resolve");
                     (void)registry.resolve(ticket.request.id, {});

                     auto &recorder = scope.recorder();
                     require(recorder.count<obs::DialogSubmittedEvent>() == 1, "submitted");
                     require(recorder.count<obs::DialogResolvedEvent>() == 1, "resolved");
                     require(recorder.count<obs::ResolveMissEvent>() == 1, "miss");
                     bool saw_wait = false;
                     for (const auto &metric : recorder.metrics()) {
                       saw_wait = saw_wait || std::holds_alternative<obs::DialogWaitMetric>(metric);
                     }
                     require(saw_wait, "wait metric recorded");
                   }});

  tests.push_back({"health_tracks_component_states", [] {
                     health::clear();
                     require(health::overall_state() == "ok", "empty table is ok");

                     health::mark_component_starting("server");
                     health::mark_component_ok("server");
                     health::mark_component_error("bridge", "Leader unreachable");
                     health::bump_component_restart("bridge");
                     require(health::overall_state() == "degraded", "one error degrades");

                     const auto bridge = health::get_component("bridge");
                     require(bridge.has_value() && bridge->restart_count == 1, "restart count");
                     require(bridge->last_error.value_or("") == "Leader unreachable", "last error");

                     const auto json = health::components_json();
                     require(hitlgate::common::json_is_valid(json), "valid json: " + json);
                     const auto components = hitlgate::common::json_get_object(json, "components");
                     require(hitlgate::common::json_get_string(
                                 hitlgate::common::json_get_object(components, "bridge"), "state") ==
                                 "error",
                             "bridge state");
                     require(json.find("\"bridge\"") < json.find("\"server\""), "name order");

                     health::mark_component_ok("bridge");
                     require(!health::get_component("bridge")->last_error.has_value(),
                             "recovery clears the error");
                     require(health::overall_state() == "ok", "recovered");
                     require(!health::get_component("absent").has_value(), "unknown component");
                     health::clear();
                   }});
}
