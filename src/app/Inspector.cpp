#include "app/Inspector.hpp"
#include "policy/Naming.hpp"
#include "util/Log.hpp"

namespace dmclean::app {

using model::DeviceState;
using model::PathType;

PathType Inspector::path_type(const std::string& path) {
  return backend_.path_type(path);
}

bool Inspector::exists(const std::string& path) {
  return backend_.path_type(path) != PathType::Missing;
}

DeviceState Inspector::state(const std::string& path) {
  auto s = backend_.state(path);
  util::log_debug("Inspector", "%s is %s", path.c_str(), model::to_string(s));
  return s;
}

bool Inspector::is_idle(const std::string& path) {
  return state(path) == DeviceState::Idle;
}

std::optional<model::Dependencies> Inspector::dependencies_of(const std::string& path) {
  auto deps = backend_.dependencies(path);
  if (deps) {
    for (const auto& d : deps->paths) util::log_debug("Inspector", "%s depends on %s", path.c_str(), d.c_str());
  }
  return deps;
}

std::vector<std::string> Inspector::siblings_of(const model::Classification& origin) {
  std::vector<std::string> out;
  if (origin.kind != model::DeviceKind::Origin) return out;
  for (auto& candidate : backend_.glob(origin.sibling_glob)) {
    if (policy::is_sibling_of(origin.path, candidate)) {
      out.push_back(std::move(candidate));
    } else {
      util::log_debug("Inspector", "ignoring %s: not a snapshot of %s", candidate.c_str(), origin.path.c_str());
    }
  }
  return out;
}

} // namespace dmclean::app
