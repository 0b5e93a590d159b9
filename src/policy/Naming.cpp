#include "policy/Naming.hpp"

#include <string_view>

namespace dmclean::policy {

using model::Classification;
using model::DeviceKind;
using model::NodeClass;

static constexpr std::string_view kMapperDir = "/mapper/";
static constexpr std::string_view kOriginPrefix = "origin-";
static constexpr std::string_view kSnapshotPrefix = "snapshot-";

// Splits "<dir>/mapper/<base>" into its directory (with trailing '/') and base.
static bool split_mapper(std::string_view path, std::string_view& dir, std::string_view& base) {
  auto slash = path.rfind('/');
  if (slash == std::string_view::npos) return false;
  dir = path.substr(0, slash + 1);
  base = path.substr(slash + 1);
  if (dir.size() < kMapperDir.size()) return false;
  return dir.substr(dir.size() - kMapperDir.size()) == kMapperDir && !base.empty();
}

static bool is_digit(char ch) { return ch >= '0' && ch <= '9'; }

// DM names may carry glob metacharacters; match them literally
static void append_glob_literal(std::string& out, std::string_view text) {
  for (char ch : text) {
    if (ch == '*' || ch == '?' || ch == '[' || ch == ']' || ch == '\\') out.push_back('\\');
    out.push_back(ch);
  }
}

auto classify(const std::string& path) -> Classification {
  Classification c;
  c.path = path;
  std::string_view dir, base;
  if (!split_mapper(path, dir, base)) return c;

  if (base.rfind(kSnapshotPrefix, 0) == 0) {
    auto rest = base.substr(kSnapshotPrefix.size());
    auto dash = rest.rfind('-');
    // X and N must both be non-empty
    if (dash == std::string_view::npos || dash == 0 || dash + 1 >= rest.size()) return c;
    c.kind = DeviceKind::Snapshot;
    c.origin_path.reserve(dir.size() + kOriginPrefix.size() + dash);
    c.origin_path.append(dir).append(kOriginPrefix).append(rest.substr(0, dash));
    return c;
  }

  if (base.rfind(kOriginPrefix, 0) == 0) {
    auto x = base.substr(kOriginPrefix.size());
    if (x.empty()) return c;
    c.kind = DeviceKind::Origin;
    append_glob_literal(c.sibling_glob, dir);
    c.sibling_glob.append(kSnapshotPrefix);
    append_glob_literal(c.sibling_glob, x);
    c.sibling_glob.append("-*");
    return c;
  }

  return c;
}

bool is_sibling_of(const std::string& origin_path, const std::string& candidate) {
  auto c = classify(candidate);
  return c.kind == DeviceKind::Snapshot && c.origin_path == origin_path;
}

auto node_class(const std::string& path) -> NodeClass {
  std::string_view sv(path);
  // /dev/loop-control is not a loop device
  if (sv.rfind("/dev/loop", 0) == 0 && sv.size() > 9 && is_digit(sv[9])) return NodeClass::Loop;
  if (sv.rfind("/dev/dm-", 0) == 0 && sv.size() > 8 && is_digit(sv[8])) return NodeClass::Dm;
  std::string_view dir, base;
  if (split_mapper(sv, dir, base) && base != "control") return NodeClass::Dm;
  return NodeClass::Other;
}

} // namespace dmclean::policy
