#pragma once

#include "hitlgate/bridge/leader_client.hpp"
#include "hitlgate/dialog/registry.hpp"
#include "hitlgate/rpc/handler.hpp"

#include <memory>

namespace hitlgate::rpc {

/// Submits into the registry owned by this process and waits for its resolution.
class LocalDialogBackend final : public IDialogBackend {
public:
  explicit LocalDialogBackend(std::shared_ptr<dialog::PendingRegistry> registry);

  [[nodiscard]] common::Result<dialog::DialogResolution>
  request_dialog(const std::string &reason, const std::string &workspace) override;

private:
  std::shared_ptr<dialog::PendingRegistry> registry_;
};

/// Forwards to the Leader's POST /dialog.
class RemoteDialogBackend final : public IDialogBackend {
public:
  explicit RemoteDialogBackend(std::shared_ptr<bridge::LeaderClient> client);

  [[nodiscard]] common::Result<dialog::DialogResolution>
  request_dialog(const std::string &reason, const std::string &workspace) override;

private:
  std::shared_ptr<bridge::LeaderClient> client_;
};

} // namespace hitlgate::rpc
