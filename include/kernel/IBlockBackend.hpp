#pragma once
#include "model/Device.hpp"
#include <optional>
#include <string>
#include <vector>

namespace dmclean::kernel {

// Kernel-facing primitives, so the teardown logic can run against the real
// device-mapper, a dry-run wrapper, or an in-memory table in tests.
// Every call is a fresh query; implementations must not cache.
class IBlockBackend {
public:
  virtual ~IBlockBackend() = default;

  [[nodiscard]] virtual model::PathType path_type(const std::string& path) = 0;

  // Missing if no block node is there; Busy if the open count is non-zero or
  // cannot be read.
  [[nodiscard]] virtual model::DeviceState state(const std::string& path) = 0;

  // Block devices the table of `path` references, as /dev paths.
  // std::nullopt if the device vanished; complete=false if the list could not
  // be read.
  [[nodiscard]] virtual std::optional<model::Dependencies> dependencies(const std::string& path) = 0;

  // Existing paths matching a shell glob, sorted.
  [[nodiscard]] virtual std::vector<std::string> glob(const std::string& pattern) = 0;

  // Single removal attempt. Retry policy belongs to the caller.
  [[nodiscard]] virtual model::RemoveStatus remove_dm(const std::string& path) = 0;

  [[nodiscard]] virtual model::RemoveStatus detach_loop(const std::string& path) = 0;

  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace dmclean::kernel
