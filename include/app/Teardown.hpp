#pragma once
#include "app/Inspector.hpp"
#include "app/Releaser.hpp"
#include "model/Device.hpp"
#include "model/Report.hpp"
#include <string>
#include <vector>

namespace dmclean::app {

// Removes one origin or snapshot device and whatever it leaves orphaned.
//
// An origin is removed only after every snapshot of it is gone; idle
// snapshots are removed first, busy ones keep the origin alive. A snapshot is
// removed only once its origin is gone. Dependencies collected from removed
// devices are released last, device-mapper nodes before loop devices, and
// their failures never fail the run.
class Teardown {
public:
  Teardown(Inspector& inspector, Releaser& releaser)
      : inspector_(inspector), releaser_(releaser) {}

  [[nodiscard]] model::TeardownReport run(const std::string& target);

private:
  void tear_snapshot(const model::Classification& c, model::TeardownReport& r);
  void tear_origin(const model::Classification& c, model::TeardownReport& r);
  void release_dependencies(const std::vector<std::string>& deps, model::TeardownReport& r);

  Inspector& inspector_;
  Releaser& releaser_;
};

// 0 for every outcome without an error, 1 otherwise.
[[nodiscard]] int exit_code_for(const model::TeardownReport& report);

} // namespace dmclean::app
