#pragma once

#include <string>

namespace dmclean::app {

struct Config {
  int remove_attempts{5};
  int retry_delay_ms{200};
  bool dry_run{false};
  bool verbose{false};
  std::string dm_control{"/dev/mapper/control"};
};

// Resolve every key from TOML, then environment, then the compiled default.
Config load_config();

// DMCLEAN_CONFIG if set, otherwise /etc/dmclean/config.toml
std::string config_file_path();

// Environment variable helpers; DMCLEAN_X and dmclean_X are equivalent
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);
bool env_flag(const char* name, bool defv);

} // namespace dmclean::app
