#include "app/Config.hpp"
#include "app/Inspector.hpp"
#include "app/Releaser.hpp"
#include "app/Teardown.hpp"
#include "kernel/DmBackend.hpp"
#include "kernel/DryRunBackend.hpp"
#include "model/Report.hpp"
#include "util/Log.hpp"
#include "util/Races.hpp"

#include <chrono>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

using dmclean::model::Outcome;

static void print_usage(std::FILE* out) {
  std::fprintf(out, "Usage: dmclean <device-path>\n");
  std::fprintf(out, "Removes an idle origin-<name> or snapshot-<name>-<id> device-mapper device\n");
  std::fprintf(out, "and releases the loop and device-mapper nodes it leaves orphaned.\n");
  std::fprintf(out, "Environment: DMCLEAN_CONFIG, DMCLEAN_VERBOSE, DMCLEAN_DRY_RUN,\n");
  std::fprintf(out, "             DMCLEAN_REMOVE_ATTEMPTS, DMCLEAN_RETRY_DELAY_MS, DMCLEAN_DM_CONTROL\n");
}

int main(int argc, char** argv) {
  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "-h" || a == "--help") {
      print_usage(stdout);
      return 0;
    }
    positional.push_back(std::move(a));
  }
  if (positional.size() != 1) {
    print_usage(stderr);
    return 2;
  }
  const std::string& target = positional.front();

  auto cfg = dmclean::app::load_config();
  if (cfg.verbose) dmclean::util::set_log_level(dmclean::util::LogLevel::Debug);

  dmclean::kernel::DmBackend dm(cfg.dm_control);
  std::unique_ptr<dmclean::kernel::DryRunBackend> dry;
  dmclean::kernel::IBlockBackend* backend = &dm;
  if (cfg.dry_run) {
    dry = std::make_unique<dmclean::kernel::DryRunBackend>(dm);
    backend = dry.get();
  }
  dmclean::util::log_debug("main", "backend=%s attempts=%d delay=%dms", backend->name(),
                           cfg.remove_attempts, cfg.retry_delay_ms);

  dmclean::app::Inspector inspector(*backend);
  dmclean::app::Releaser releaser(*backend, dmclean::app::RetryPolicy{
      cfg.remove_attempts, std::chrono::milliseconds(cfg.retry_delay_ms)});
  dmclean::app::Teardown teardown(inspector, releaser);

  auto report = teardown.run(target);

  if (!report.ok()) {
    dmclean::util::log_error("main", "%s (%s)", report.message.c_str(),
                             dmclean::model::to_string(report.error));
  } else if (report.outcome == Outcome::SkippedBusy) {
    dmclean::util::log_info("main", "%s is still in use; nothing removed", target.c_str());
  } else if (report.outcome == Outcome::SkippedMissing && report.mutated()) {
    dmclean::util::log_info("main", "%s vanished during the run; %zu snapshots removed, %zu dependencies released",
                            target.c_str(), report.removed.size(), report.released.size());
  } else if (report.outcome == Outcome::SkippedMissing) {
    dmclean::util::log_debug("main", "%s does not exist; nothing to do", target.c_str());
  } else if (report.outcome == Outcome::DeferredLiveSnapshot) {
    dmclean::util::log_info("main", "%s kept: a snapshot of it is still in use", target.c_str());
  }

  if (!report.release_failures.empty() || !report.unresolved.empty()) {
    dmclean::util::log_warn("main", "%zu dependencies left in place, %zu devices with unreadable dependencies",
                            report.release_failures.size(), report.unresolved.size());
  }
  dmclean::util::log_debug("main", "outcome=%s removed=%zu released=%zu vanished=%d busy=%d",
                           dmclean::model::to_string(report.outcome), report.removed.size(),
                           report.released.size(),
                           dmclean::util::race_count(dmclean::util::RaceKind::Vanished),
                           dmclean::util::race_count(dmclean::util::RaceKind::Busy));

  return dmclean::app::exit_code_for(report);
}
