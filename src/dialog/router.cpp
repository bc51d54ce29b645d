#include "hitlgate/dialog/router.hpp"

#include "hitlgate/common/fs.hpp"

#include <algorithm>

namespace hitlgate::dialog {

std::string normalize_workspace(const std::string &workspace) {
  std::string normalized = common::to_lower(workspace);
  std::replace(normalized.begin(), normalized.end(), '\\', '/');
  return normalized;
}

bool workspaces_match(const std::string &a, const std::string &b) {
  const std::string left = normalize_workspace(a);
  const std::string right = normalize_workspace(b);
  return left == right || common::starts_with(left, right + "/") ||
         common::starts_with(right, left + "/");
}

bool should_claim(const std::string &request_workspace,
                  const std::vector<std::string> &local_workspaces) {
  if (local_workspaces.empty()) {
    return true;
  }
  return std::any_of(local_workspaces.begin(), local_workspaces.end(),
                     [&](const std::string &local) {
                       return workspaces_match(request_workspace, local);
                     });
}

} // namespace hitlgate::dialog
