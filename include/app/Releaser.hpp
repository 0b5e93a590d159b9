#pragma once
#include "kernel/IBlockBackend.hpp"
#include "model/Device.hpp"
#include <chrono>
#include <string>

namespace dmclean::app {

struct RetryPolicy {
  int attempts{5};
  std::chrono::milliseconds delay{200};
};

// Issues removals. Already-gone devices are success everywhere.
class Releaser {
public:
  Releaser(kernel::IBlockBackend& backend, RetryPolicy policy)
      : backend_(backend), policy_(policy) {}

  // DM removal, retried while the kernel answers EBUSY.
  [[nodiscard]] model::RemoveStatus remove_dm_node(const std::string& path);

  [[nodiscard]] model::RemoveStatus detach_loop(const std::string& path);

  // Dispatch by node class. Other nodes are NotManaged and untouched.
  [[nodiscard]] model::RemoveStatus release(const std::string& path);

private:
  kernel::IBlockBackend& backend_;
  RetryPolicy policy_;
};

} // namespace dmclean::app
