#pragma once
#include <string>
#include <vector>

namespace dmclean::model {

// Kind as derived from the device name alone
enum class DeviceKind { Origin, Snapshot, Unknown };

// Node type as derived from the path prefix; drives release dispatch
enum class NodeClass { Loop, Dm, Other };

// What sits at a path: nothing, a block device node, or something else
enum class PathType { Missing, BlockDevice, Other };

// Point-in-time view of a device. Missing is a normal answer, not an error.
enum class DeviceState { Missing, Idle, Busy };

enum class RemoveStatus {
  Removed,     // this call removed or detached it
  Gone,        // already absent before or during the call
  Busy,        // still held open after the bounded retry
  NotManaged,  // not a loop or DM node; left alone
  Failed       // any other kernel error
};

struct Classification {
  DeviceKind kind{DeviceKind::Unknown};
  std::string path;
  std::string origin_path;   // Snapshot: paired origin
  std::string sibling_glob;  // Origin: glob matching its snapshots
};

// Block devices a DM table references. complete is false when the kernel
// would not report the list; paths is then empty and must not be read as a leaf.
struct Dependencies {
  std::vector<std::string> paths;
  bool complete{true};
};

// Removed and Gone both leave the device absent
[[nodiscard]] inline bool is_absent(RemoveStatus s) {
  return s == RemoveStatus::Removed || s == RemoveStatus::Gone;
}

[[nodiscard]] const char* to_string(DeviceKind k);
[[nodiscard]] const char* to_string(DeviceState s);
[[nodiscard]] const char* to_string(RemoveStatus s);

} // namespace dmclean::model
