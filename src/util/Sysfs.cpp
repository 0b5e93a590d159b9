#include "util/Sysfs.hpp"
#include "util/Races.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string_view>

namespace dmclean::util {

static std::string env_root(const char* name) {
  const char* env = std::getenv(name);
  if (env && *env) return std::string(env);
  return std::string();
}

static std::string remap(const std::string& abs, const char* prefix, const char* env) {
  std::string_view sv(abs), pre(prefix);
  if (sv.rfind(pre, 0) != 0) return abs;
  if (sv.size() > pre.size() && sv[pre.size()] != '/') return abs; // "/devices" is not under "/dev"
  auto root = env_root(env);
  if (root.empty()) return abs;
  std::filesystem::path p(root);
  p /= std::filesystem::path(abs.substr(1)); // drop leading '/'
  return p.string();
}

auto map_sys_path(const std::string& abs) -> std::string {
  return remap(abs, "/sys", "DMCLEAN_SYS_ROOT");
}

auto map_dev_path(const std::string& abs) -> std::string {
  return remap(abs, "/dev", "DMCLEAN_DEV_ROOT");
}

auto unmap_dev_path(const std::string& mapped) -> std::string {
  auto root = env_root("DMCLEAN_DEV_ROOT");
  if (root.empty()) return mapped;
  while (root.size() > 1 && root.back() == '/') root.pop_back();
  if (mapped.rfind(root, 0) != 0) return mapped;
  auto rest = mapped.substr(root.size());
  if (rest.empty() || rest[0] != '/') rest.insert(rest.begin(), '/');
  return rest;
}

auto read_file_string(const std::string& abs) -> std::optional<std::string> {
  std::ifstream in(map_sys_path(abs));
  if (!in) return std::nullopt;
  try {
    std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return s;
  } catch (const std::exception&) {
    // Device removed between open and read
    note_race(RaceKind::Vanished);
    return std::nullopt;
  }
}

auto block_path_for(unsigned maj, unsigned min) -> std::string {
  auto id = std::to_string(maj) + ":" + std::to_string(min);
  if (auto txt = read_file_string("/sys/dev/block/" + id + "/uevent")) {
    std::istringstream ss(*txt);
    std::string line;
    while (std::getline(ss, line)) {
      if (line.rfind("DEVNAME=", 0) == 0 && line.size() > 8) return "/dev/" + line.substr(8);
    }
  }
  return "/dev/block/" + id;
}

} // namespace dmclean::util
