#include "app/Config.hpp"
#include "util/Log.hpp"
#include "util/TomlReader.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>

namespace dmclean::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("DMCLEAN_", 0) == 0) {
    alt = std::string("dmclean_") + n.substr(8);
  } else if (n.rfind("dmclean_", 0) == 0) {
    alt = std::string("DMCLEAN_") + n.substr(8);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  try { return std::stoi(v); } catch (const std::exception&) { return defv; }
}

bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* p = getenv_compat("DMCLEAN_CONFIG")) return p;
  return "/etc/dmclean/config.toml";
}

Config load_config() {
  Config cfg;
  util::TomlReader toml;
  auto path = config_file_path();
  bool have_toml = toml.load(path);
  if (!have_toml && getenv_compat("DMCLEAN_CONFIG")) {
    util::log_warn("Config", "cannot read %s; using defaults", path.c_str());
  }

  auto int_key = [&](const char* section, const char* key, const char* env, int def) {
    if (have_toml && toml.has(section, key)) return toml.get_int(section, key, def);
    return getenv_int(env, def);
  };
  auto bool_key = [&](const char* section, const char* key, const char* env, bool def) {
    if (have_toml && toml.has(section, key)) return toml.get_bool(section, key, def);
    return env_flag(env, def);
  };

  cfg.remove_attempts = std::clamp(int_key("remove", "attempts", "DMCLEAN_REMOVE_ATTEMPTS", cfg.remove_attempts), 1, 50);
  cfg.retry_delay_ms = std::clamp(int_key("remove", "retry_delay_ms", "DMCLEAN_RETRY_DELAY_MS", cfg.retry_delay_ms), 0, 5000);
  cfg.dry_run = bool_key("remove", "dry_run", "DMCLEAN_DRY_RUN", cfg.dry_run);
  cfg.verbose = bool_key("log", "verbose", "DMCLEAN_VERBOSE", cfg.verbose);

  if (have_toml && toml.has("paths", "control")) {
    cfg.dm_control = toml.get_string("paths", "control", cfg.dm_control);
  } else if (const char* v = getenv_compat("DMCLEAN_DM_CONTROL")) {
    cfg.dm_control = v;
  }
  return cfg;
}

} // namespace dmclean::app
