#include "bench_common.hpp"

#include "hitlgate/dialog/registry.hpp"
#include "hitlgate/dialog/router.hpp"

#include <string>
#include <vector>

void run_registry_benchmark() {
  hitlgate::dialog::PendingRegistry registry;
  hitlgate::bench::run_bench("registry_submit_resolve", 5000, [&registry] {
    const auto ticket = registry.submit("step finished", "/home/dev/project");
    (void)registry.resolve(ticket.request.id, hitlgate::dialog::DialogResolution{});
  });

  // A Leader listing pending dialogs for a follower while many are open.
  hitlgate::dialog::PendingRegistry busy;
  std::vector<std::string> ids;
  for (int i = 0; i < 200; ++i) {
    ids.push_back(busy.submit("r", "/ws/" + std::to_string(i % 10)).request.id);
  }
  hitlgate::bench::run_bench("registry_list_pending_filtered", 2000, [&busy] {
    (void)busy.list_pending(std::string("/ws/3/src"));
  });
  for (const auto &id : ids) {
    (void)busy.resolve(id, hitlgate::dialog::DialogResolution{});
  }

  const std::vector<std::string> locals{"C:\\Users\\Dev\\Api", "/home/dev/web", "/srv/tools"};
  hitlgate::bench::run_bench("router_should_claim", 20000, [&locals] {
    (void)hitlgate::dialog::should_claim("c:/users/dev/api/src/main", locals);
  });
}
