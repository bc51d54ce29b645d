#pragma once

#include <string>
#include <vector>

namespace hitlgate::dialog {

/// Case-folded, forward-slash form of a workspace path. Used as the key for history and
/// sequence counters and for every containment comparison.
[[nodiscard]] std::string normalize_workspace(const std::string &workspace);

/// True when the two workspaces are the same path or one lies inside the other.
[[nodiscard]] bool workspaces_match(const std::string &a, const std::string &b);

/// Whether a front-end with `local_workspaces` open should present a request tagged with
/// `request_workspace`. An empty local list claims everything.
[[nodiscard]] bool should_claim(const std::string &request_workspace,
                                const std::vector<std::string> &local_workspaces);

} // namespace hitlgate::dialog
