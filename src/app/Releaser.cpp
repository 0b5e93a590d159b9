#include "app/Releaser.hpp"
#include "policy/Naming.hpp"
#include "util/Log.hpp"
#include "util/Races.hpp"

#include <thread>

namespace dmclean::app {

using model::NodeClass;
using model::RemoveStatus;

RemoveStatus Releaser::remove_dm_node(const std::string& path) {
  int attempts = policy_.attempts < 1 ? 1 : policy_.attempts;
  for (int i = 1; i <= attempts; ++i) {
    auto s = backend_.remove_dm(path);
    if (s == RemoveStatus::Gone) util::note_race(util::RaceKind::Vanished);
    if (s != RemoveStatus::Busy) return s;
    util::note_race(util::RaceKind::Busy);
    util::log_debug("Releaser", "%s busy (attempt %d/%d)", path.c_str(), i, attempts);
    if (i < attempts && policy_.delay.count() > 0) std::this_thread::sleep_for(policy_.delay);
  }
  return RemoveStatus::Busy;
}

RemoveStatus Releaser::detach_loop(const std::string& path) {
  auto s = backend_.detach_loop(path);
  if (s == RemoveStatus::Gone) util::note_race(util::RaceKind::Vanished);
  return s;
}

RemoveStatus Releaser::release(const std::string& path) {
  switch (policy::node_class(path)) {
    case NodeClass::Loop: return detach_loop(path);
    case NodeClass::Dm: return remove_dm_node(path);
    case NodeClass::Other: break;
  }
  util::log_debug("Releaser", "skipping %s: not a loop or device-mapper node", path.c_str());
  return RemoveStatus::NotManaged;
}

} // namespace dmclean::app
