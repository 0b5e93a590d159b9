#pragma once
#include "kernel/IBlockBackend.hpp"

namespace dmclean::kernel {

// Forwards every query to the wrapped backend and replaces mutations with a
// log line. Mutations report Removed so the run proceeds as it would for real.
class DryRunBackend : public IBlockBackend {
public:
  explicit DryRunBackend(IBlockBackend& inner) : inner_(inner) {}

  [[nodiscard]] model::PathType path_type(const std::string& path) override { return inner_.path_type(path); }
  [[nodiscard]] model::DeviceState state(const std::string& path) override { return inner_.state(path); }
  [[nodiscard]] std::optional<model::Dependencies> dependencies(const std::string& path) override {
    return inner_.dependencies(path);
  }
  [[nodiscard]] std::vector<std::string> glob(const std::string& pattern) override { return inner_.glob(pattern); }
  [[nodiscard]] model::RemoveStatus remove_dm(const std::string& path) override;
  [[nodiscard]] model::RemoveStatus detach_loop(const std::string& path) override;
  [[nodiscard]] const char* name() const override { return "dry-run"; }

private:
  IBlockBackend& inner_;
};

} // namespace dmclean::kernel
