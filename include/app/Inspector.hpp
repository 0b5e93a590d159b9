#pragma once
#include "kernel/IBlockBackend.hpp"
#include "model/Device.hpp"
#include <optional>
#include <string>
#include <vector>

namespace dmclean::app {

// Read-only view of the device-mapper registry. Nothing here is cached: every
// call reflects the kernel at the moment it is made.
class Inspector {
public:
  explicit Inspector(kernel::IBlockBackend& backend) : backend_(backend) {}

  [[nodiscard]] model::PathType path_type(const std::string& path);
  [[nodiscard]] bool exists(const std::string& path);
  [[nodiscard]] model::DeviceState state(const std::string& path);
  [[nodiscard]] bool is_idle(const std::string& path);
  [[nodiscard]] std::optional<model::Dependencies> dependencies_of(const std::string& path);

  // Snapshots currently present for an origin classification, filtered
  // through the naming policy so look-alike names of other origins are excluded.
  [[nodiscard]] std::vector<std::string> siblings_of(const model::Classification& origin);

private:
  kernel::IBlockBackend& backend_;
};

} // namespace dmclean::app
