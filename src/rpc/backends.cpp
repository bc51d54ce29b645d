#include "hitlgate/rpc/backends.hpp"

namespace hitlgate::rpc {

LocalDialogBackend::LocalDialogBackend(std::shared_ptr<dialog::PendingRegistry> registry)
    : registry_(std::move(registry)) {}

common::Result<dialog::DialogResolution>
LocalDialogBackend::request_dialog(const std::string &reason, const std::string &workspace) {
  const auto ticket = registry_->submit(reason, workspace);
  return common::Result<dialog::DialogResolution>::success(ticket.resolution.get());
}

RemoteDialogBackend::RemoteDialogBackend(std::shared_ptr<bridge::LeaderClient> client)
    : client_(std::move(client)) {}

common::Result<dialog::DialogResolution>
RemoteDialogBackend::request_dialog(const std::string &reason, const std::string &workspace) {
  return client_->request_dialog(reason, workspace);
}

} // namespace hitlgate::rpc
