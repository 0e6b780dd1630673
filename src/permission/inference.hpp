#pragma once

#include <string>

#include "core/types.hpp"

namespace warden::permission {

// Generalize one approved invocation into a pattern worth remembering:
//   "cd /x && npm run test"        -> Bash(npm run test:*)
//   "find /path -name '*.cpp'"     -> Bash(find:*)
//   Write /src/app/main.cpp        -> Write(/src/app/**)
//   WebFetch https://api.github.com -> WebFetch(domain:api.github.com)
// Other tools get their bare name. With nothing to generalize from (no
// command, a leading flag, no path or host) the empty-argument form is
// returned, which never widens to every call of the tool.
std::string infer_pattern(const std::string& tool_name, const json& input);

}  // namespace warden::permission
