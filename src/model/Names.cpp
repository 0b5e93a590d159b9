#include "model/Device.hpp"
#include "model/Report.hpp"

namespace dmclean::model {

const char* to_string(DeviceKind k) {
  switch (k) {
    case DeviceKind::Origin: return "origin";
    case DeviceKind::Snapshot: return "snapshot";
    case DeviceKind::Unknown: return "unknown";
  }
  return "unknown";
}

const char* to_string(DeviceState s) {
  switch (s) {
    case DeviceState::Missing: return "missing";
    case DeviceState::Idle: return "idle";
    case DeviceState::Busy: return "busy";
  }
  return "unknown";
}

const char* to_string(RemoveStatus s) {
  switch (s) {
    case RemoveStatus::Removed: return "removed";
    case RemoveStatus::Gone: return "gone";
    case RemoveStatus::Busy: return "busy";
    case RemoveStatus::NotManaged: return "not-managed";
    case RemoveStatus::Failed: return "failed";
  }
  return "unknown";
}

const char* to_string(Outcome o) {
  switch (o) {
    case Outcome::Removed: return "removed";
    case Outcome::SkippedMissing: return "skipped-missing";
    case Outcome::SkippedBusy: return "skipped-busy";
    case Outcome::SkippedOriginPresent: return "skipped-origin-present";
    case Outcome::DeferredLiveSnapshot: return "deferred-live-snapshot";
  }
  return "unknown";
}

const char* to_string(TeardownError e) {
  switch (e) {
    case TeardownError::None: return "none";
    case TeardownError::NotBlockDevice: return "not-block-device";
    case TeardownError::UnrecognizedName: return "unrecognized-name";
    case TeardownError::RemoveFailed: return "remove-failed";
  }
  return "unknown";
}

} // namespace dmclean::model
