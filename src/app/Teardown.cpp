#include "app/Teardown.hpp"
#include "policy/Naming.hpp"
#include "util/Log.hpp"

#include <algorithm>

namespace dmclean::app {

using model::DeviceKind;
using model::DeviceState;
using model::NodeClass;
using model::Outcome;
using model::PathType;
using model::RemoveStatus;
using model::TeardownError;
using model::TeardownReport;

static constexpr const char* kComponent = "Teardown";

static void fail(TeardownReport& r, TeardownError e, std::string message) {
  r.error = e;
  r.message = std::move(message);
}

// Adds the dependencies of a device that is now gone. An unreadable list
// leaves its backing devices behind, which is recorded like a failed release.
static void collect(std::vector<std::string>& into, const std::string& owner,
                    const model::Dependencies& from, TeardownReport& r) {
  if (!from.complete) {
    util::log_warn(kComponent, "dependencies of %s unknown; its backing devices are left in place",
                   owner.c_str());
    r.unresolved.push_back(owner);
    return;
  }
  for (const auto& p : from.paths) {
    if (std::find(into.begin(), into.end(), p) == into.end()) into.push_back(p);
  }
}

TeardownReport Teardown::run(const std::string& target) {
  TeardownReport r;
  r.target = target;

  switch (inspector_.path_type(target)) {
    case PathType::Missing:
      r.outcome = Outcome::SkippedMissing;
      return r;
    case PathType::Other:
      fail(r, TeardownError::NotBlockDevice, target + " is not a block device");
      return r;
    case PathType::BlockDevice:
      break;
  }

  auto c = policy::classify(target);
  util::log_debug(kComponent, "%s classified as %s", target.c_str(), model::to_string(c.kind));
  if (c.kind == DeviceKind::Unknown) {
    fail(r, TeardownError::UnrecognizedName,
         target + " is neither an origin-<name> nor a snapshot-<name>-<id> device");
    return r;
  }

  switch (inspector_.state(target)) {
    case DeviceState::Missing:
      r.outcome = Outcome::SkippedMissing;
      return r;
    case DeviceState::Busy:
      r.outcome = Outcome::SkippedBusy;
      return r;
    case DeviceState::Idle:
      break;
  }

  if (c.kind == DeviceKind::Snapshot) tear_snapshot(c, r);
  else tear_origin(c, r);
  return r;
}

void Teardown::tear_snapshot(const model::Classification& c, TeardownReport& r) {
  if (inspector_.exists(c.origin_path)) {
    util::log_debug(kComponent, "%s: origin %s still present, leaving snapshot for origin cleanup",
                    c.path.c_str(), c.origin_path.c_str());
    r.outcome = Outcome::SkippedOriginPresent;
    return;
  }

  auto deps = inspector_.dependencies_of(c.path);
  if (!deps) {
    r.outcome = Outcome::SkippedMissing;
    return;
  }

  // Re-check right before removal; someone may have opened it meanwhile
  auto st = inspector_.state(c.path);
  if (st != DeviceState::Idle) {
    r.outcome = st == DeviceState::Busy ? Outcome::SkippedBusy : Outcome::SkippedMissing;
    return;
  }

  auto s = releaser_.remove_dm_node(c.path);
  if (s == RemoveStatus::Removed) {
    util::log_info(kComponent, "removed %s", c.path.c_str());
    r.removed.push_back(c.path);
    r.outcome = Outcome::Removed;
  } else if (s == RemoveStatus::Gone) {
    r.outcome = Outcome::SkippedMissing;
  } else {
    fail(r, TeardownError::RemoveFailed,
         "failed to remove idle device " + c.path + " (" + model::to_string(s) + ")");
    return;
  }
  std::vector<std::string> release;
  collect(release, c.path, *deps, r);
  release_dependencies(release, r);
}

void Teardown::tear_origin(const model::Classification& c, TeardownReport& r) {
  std::vector<std::string> deps;
  bool live_snapshot = false;

  for (const auto& snap : inspector_.siblings_of(c)) {
    auto st = inspector_.state(snap);
    if (st == DeviceState::Missing) continue;
    if (st == DeviceState::Busy) {
      util::log_debug(kComponent, "%s still in use, keeping %s", snap.c_str(), c.path.c_str());
      live_snapshot = true;
      continue;
    }
    auto snap_deps = inspector_.dependencies_of(snap);
    if (!snap_deps) continue; // vanished

    auto s = releaser_.remove_dm_node(snap);
    if (model::is_absent(s)) {
      if (s == RemoveStatus::Removed) {
        util::log_info(kComponent, "removed %s", snap.c_str());
        r.removed.push_back(snap);
      }
      collect(deps, snap, *snap_deps, r);
    } else if (s == RemoveStatus::Busy) {
      util::log_warn(kComponent, "%s became busy, keeping %s", snap.c_str(), c.path.c_str());
      live_snapshot = true;
    } else {
      live_snapshot = true;
      fail(r, TeardownError::RemoveFailed,
           "failed to remove idle snapshot " + snap + " (" + model::to_string(s) + ")");
    }
  }

  if (live_snapshot) {
    // The origin's own backing devices stay until the run that removes it
    r.outcome = Outcome::DeferredLiveSnapshot;
  } else {
    auto own_deps = inspector_.dependencies_of(c.path);
    auto st = inspector_.state(c.path);
    if (!own_deps || st == DeviceState::Missing) {
      // Vanished during the sweep; r.removed still lists any snapshots taken out
      r.outcome = Outcome::SkippedMissing;
    } else if (st == DeviceState::Busy) {
      r.outcome = Outcome::SkippedBusy;
    } else {
      auto s = releaser_.remove_dm_node(c.path);
      if (model::is_absent(s)) {
        if (s == RemoveStatus::Removed) {
          util::log_info(kComponent, "removed %s", c.path.c_str());
          r.removed.push_back(c.path);
          r.outcome = Outcome::Removed;
        } else {
          r.outcome = Outcome::SkippedMissing;
        }
        collect(deps, c.path, *own_deps, r);
      } else {
        fail(r, TeardownError::RemoveFailed,
             "failed to remove idle device " + c.path + " (" + model::to_string(s) + ")");
      }
    }
  }

  release_dependencies(deps, r);
}

void Teardown::release_dependencies(const std::vector<std::string>& deps, TeardownReport& r) {
  // Device-mapper nodes may sit on the loop devices in the same set
  std::vector<std::string> ordered(deps);
  std::stable_partition(ordered.begin(), ordered.end(), [](const std::string& p) {
    return policy::node_class(p) == NodeClass::Dm;
  });

  for (const auto& dep : ordered) {
    if (std::find(r.removed.begin(), r.removed.end(), dep) != r.removed.end()) continue;
    auto s = releaser_.release(dep);
    switch (s) {
      case RemoveStatus::Removed:
        util::log_info(kComponent, "released %s", dep.c_str());
        r.released.push_back(dep);
        break;
      case RemoveStatus::Gone:
      case RemoveStatus::NotManaged:
        break;
      case RemoveStatus::Busy:
      case RemoveStatus::Failed:
        util::log_warn(kComponent, "could not release %s (%s); it may still be in use elsewhere",
                       dep.c_str(), model::to_string(s));
        r.release_failures.push_back(dep);
        break;
    }
  }
}

int exit_code_for(const TeardownReport& report) {
  return report.ok() ? 0 : 1;
}

} // namespace dmclean::app
