#include "minitest.hpp"
#include "policy/Naming.hpp"
#include <string>

using dmclean::model::DeviceKind;
using dmclean::model::NodeClass;
using dmclean::policy::classify;
using dmclean::policy::is_sibling_of;
using dmclean::policy::node_class;

TEST(naming_snapshot_pairs_with_origin) {
  auto c = classify("/dev/mapper/snapshot-vm1-3");
  ASSERT_TRUE(c.kind == DeviceKind::Snapshot);
  ASSERT_EQ(c.origin_path, std::string("/dev/mapper/origin-vm1"));
  ASSERT_TRUE(c.sibling_glob.empty());
}

TEST(naming_snapshot_drops_only_last_segment) {
  // Device-number style names: snapshot-<root dev:ino>-<cow dev:ino>
  auto c = classify("/dev/mapper/snapshot-fd01:1234-fd01:5678");
  ASSERT_TRUE(c.kind == DeviceKind::Snapshot);
  ASSERT_EQ(c.origin_path, std::string("/dev/mapper/origin-fd01:1234"));

  auto d = classify("/dev/mapper/snapshot-my-vm-7");
  ASSERT_TRUE(d.kind == DeviceKind::Snapshot);
  ASSERT_EQ(d.origin_path, std::string("/dev/mapper/origin-my-vm"));
}

TEST(naming_origin_derives_glob) {
  auto c = classify("/dev/mapper/origin-vm1");
  ASSERT_TRUE(c.kind == DeviceKind::Origin);
  ASSERT_EQ(c.sibling_glob, std::string("/dev/mapper/snapshot-vm1-*"));
  ASSERT_TRUE(c.origin_path.empty());
}

TEST(naming_keeps_directory_prefix) {
  auto c = classify("/tmp/root/dev/mapper/origin-x");
  ASSERT_TRUE(c.kind == DeviceKind::Origin);
  ASSERT_EQ(c.sibling_glob, std::string("/tmp/root/dev/mapper/snapshot-x-*"));
}

TEST(naming_origin_glob_escapes_metacharacters) {
  auto c = classify("/dev/mapper/origin-vm[1]");
  ASSERT_TRUE(c.kind == DeviceKind::Origin);
  ASSERT_EQ(c.sibling_glob, std::string("/dev/mapper/snapshot-vm\\[1\\]-*"));

  auto d = classify("/dev/mapper/origin-a*b?c\\d");
  ASSERT_EQ(d.sibling_glob, std::string("/dev/mapper/snapshot-a\\*b\\?c\\\\d-*"));
  ASSERT_TRUE(is_sibling_of("/dev/mapper/origin-vm[1]", "/dev/mapper/snapshot-vm[1]-2"));
}

TEST(naming_unknown_shapes) {
  const char* bad[] = {
    "", "/", "/dev/mapper/", "/dev/mapper/random-name", "/dev/mapper/origin-",
    "/dev/mapper/snapshot-", "/dev/mapper/snapshot-vm1", "/dev/mapper/snapshot--3",
    "/dev/mapper/snapshot-vm1-", "/dev/dm-3", "/dev/loop0", "/dev/origin-vm1",
    "origin-vm1", "/dev/mapperx/origin-vm1", "/dev/mapper/Origin-vm1",
  };
  for (const char* p : bad) {
    auto c = classify(p);
    if (c.kind != DeviceKind::Unknown) throw mini::AssertionError(std::string("expected unknown: ") + p);
  }
}

TEST(naming_total_on_odd_input) {
  std::string weird("/dev/mapper/snapshot-\0-\xff", 24);
  auto c = classify(weird);
  ASSERT_TRUE(c.kind == DeviceKind::Snapshot || c.kind == DeviceKind::Unknown);
  std::string long_name = "/dev/mapper/origin-" + std::string(4096, 'a');
  ASSERT_TRUE(classify(long_name).kind == DeviceKind::Origin);
}

TEST(naming_sibling_filter) {
  ASSERT_TRUE(is_sibling_of("/dev/mapper/origin-vm1", "/dev/mapper/snapshot-vm1-1"));
  ASSERT_TRUE(is_sibling_of("/dev/mapper/origin-vm1", "/dev/mapper/snapshot-vm1-abc"));
  // Matches the glob snapshot-vm1-* but belongs to origin-vm1-backup
  ASSERT_FALSE(is_sibling_of("/dev/mapper/origin-vm1", "/dev/mapper/snapshot-vm1-backup-3"));
  ASSERT_FALSE(is_sibling_of("/dev/mapper/origin-vm1", "/dev/mapper/origin-vm1"));
  ASSERT_FALSE(is_sibling_of("/dev/mapper/origin-vm1", "/other/mapper/snapshot-vm1-1"));
}

TEST(naming_node_class_dispatch) {
  ASSERT_TRUE(node_class("/dev/loop0") == NodeClass::Loop);
  ASSERT_TRUE(node_class("/dev/loop12") == NodeClass::Loop);
  ASSERT_TRUE(node_class("/dev/loop-control") == NodeClass::Other);
  ASSERT_TRUE(node_class("/dev/loop") == NodeClass::Other);
  ASSERT_TRUE(node_class("/dev/dm-4") == NodeClass::Dm);
  ASSERT_TRUE(node_class("/dev/dm-") == NodeClass::Other);
  ASSERT_TRUE(node_class("/dev/mapper/origin-vm1") == NodeClass::Dm);
  ASSERT_TRUE(node_class("/dev/mapper/control") == NodeClass::Other);
  ASSERT_TRUE(node_class("/dev/sda1") == NodeClass::Other);
  ASSERT_TRUE(node_class("/dev/block/7:0") == NodeClass::Other);
  ASSERT_TRUE(node_class("") == NodeClass::Other);
}
