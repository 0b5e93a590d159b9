#include "kernel/DryRunBackend.hpp"
#include "util/Log.hpp"

namespace dmclean::kernel {

model::RemoveStatus DryRunBackend::remove_dm(const std::string& path) {
  util::log_info("DryRun", "would remove %s", path.c_str());
  return model::RemoveStatus::Removed;
}

model::RemoveStatus DryRunBackend::detach_loop(const std::string& path) {
  util::log_info("DryRun", "would detach %s", path.c_str());
  return model::RemoveStatus::Removed;
}

} // namespace dmclean::kernel
