#include "minitest.hpp"
#include "app/Config.hpp"
#include "util/TomlReader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

static std::string tmp_path(const char* suffix) {
  return (std::filesystem::temp_directory_path() /
          ("dmclean_test_config_" + std::string(suffix) + "_" + std::to_string(::getpid()) + ".toml")).string();
}

static void write_file(const std::string& path, const std::string& content) {
  std::ofstream f(path);
  f << content;
}

static void remove_file(const std::string& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

static void clear_env() {
  for (const char* n : {"DMCLEAN_CONFIG", "DMCLEAN_REMOVE_ATTEMPTS", "DMCLEAN_RETRY_DELAY_MS",
                        "DMCLEAN_DRY_RUN", "DMCLEAN_VERBOSE", "DMCLEAN_DM_CONTROL",
                        "dmclean_VERBOSE", "dmclean_REMOVE_ATTEMPTS"}) {
    unsetenv(n);
  }
}

TEST(toml_load_missing_file) {
  dmclean::util::TomlReader tr;
  ASSERT_FALSE(tr.load("/nonexistent/dmclean/config.toml"));
}

TEST(toml_sections_comments_quotes) {
  auto path = tmp_path("toml");
  write_file(path,
    "# dmclean settings\n"
    "[remove]\n"
    "attempts = 7   # per device\n"
    "dry_run = True\n"
    "\n"
    "[paths]\n"
    "control = \"/dev/mapper/control#2\"\n"
    "broken line without equals\n"
    "[log\n"
    "verbose = 1\n");
  dmclean::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_int("remove", "attempts"), 7);
  ASSERT_EQ(tr.get_bool("remove", "dry_run"), true);
  ASSERT_EQ(tr.get_string("paths", "control"), std::string("/dev/mapper/control#2"));
  // "[log" is not a section header, so verbose stays under [paths]
  ASSERT_TRUE(tr.has("paths", "verbose"));
  ASSERT_FALSE(tr.has("log", "verbose"));
  ASSERT_EQ(tr.get_int("remove", "missing", 42), 42);
  ASSERT_EQ(tr.get_bool("nosection", "x", true), true);
  remove_file(path);
}

TEST(toml_invalid_values_fall_back) {
  auto path = tmp_path("invalid");
  write_file(path, "[remove]\nattempts = many\ndry_run = maybe\n");
  dmclean::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_int("remove", "attempts", 5), 5);
  ASSERT_EQ(tr.get_bool("remove", "dry_run", false), false);
  remove_file(path);
}

TEST(config_defaults) {
  clear_env();
  setenv("DMCLEAN_CONFIG", "/nonexistent/dmclean.toml", 1);
  auto cfg = dmclean::app::load_config();
  ASSERT_EQ(cfg.remove_attempts, 5);
  ASSERT_EQ(cfg.retry_delay_ms, 200);
  ASSERT_FALSE(cfg.dry_run);
  ASSERT_FALSE(cfg.verbose);
  ASSERT_EQ(cfg.dm_control, std::string("/dev/mapper/control"));
  clear_env();
}

TEST(config_env_overrides_defaults) {
  clear_env();
  setenv("DMCLEAN_CONFIG", "/nonexistent/dmclean.toml", 1);
  setenv("DMCLEAN_REMOVE_ATTEMPTS", "9", 1);
  setenv("DMCLEAN_DRY_RUN", "1", 1);
  setenv("dmclean_VERBOSE", "yes", 1);
  setenv("DMCLEAN_DM_CONTROL", "/tmp/control", 1);
  auto cfg = dmclean::app::load_config();
  ASSERT_EQ(cfg.remove_attempts, 9);
  ASSERT_TRUE(cfg.dry_run);
  ASSERT_TRUE(cfg.verbose);
  ASSERT_EQ(cfg.dm_control, std::string("/tmp/control"));
  clear_env();
}

TEST(config_file_wins_over_env) {
  clear_env();
  auto path = tmp_path("precedence");
  write_file(path, "[remove]\nattempts = 3\nretry_delay_ms = 50\n[log]\nverbose = false\n");
  setenv("DMCLEAN_CONFIG", path.c_str(), 1);
  setenv("DMCLEAN_REMOVE_ATTEMPTS", "9", 1);
  setenv("DMCLEAN_VERBOSE", "1", 1);
  setenv("DMCLEAN_DRY_RUN", "1", 1);
  auto cfg = dmclean::app::load_config();
  ASSERT_EQ(cfg.remove_attempts, 3);
  ASSERT_EQ(cfg.retry_delay_ms, 50);
  ASSERT_FALSE(cfg.verbose);
  ASSERT_TRUE(cfg.dry_run); // not in the file, so env applies
  clear_env();
  remove_file(path);
}

TEST(config_clamps_ranges) {
  clear_env();
  auto path = tmp_path("clamp");
  write_file(path, "[remove]\nattempts = 0\nretry_delay_ms = 999999\n");
  setenv("DMCLEAN_CONFIG", path.c_str(), 1);
  auto cfg = dmclean::app::load_config();
  ASSERT_EQ(cfg.remove_attempts, 1);
  ASSERT_EQ(cfg.retry_delay_ms, 5000);
  clear_env();
  remove_file(path);
}
