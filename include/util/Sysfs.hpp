// Helpers for reading /sys and resolving /dev paths with optional root remap
#pragma once
#include <optional>
#include <string>

namespace dmclean::util {

// Map an absolute /sys path to an alternate root if DMCLEAN_SYS_ROOT is set
auto map_sys_path(const std::string& abs) -> std::string;

// Map an absolute /dev path to an alternate root if DMCLEAN_DEV_ROOT is set
auto map_dev_path(const std::string& abs) -> std::string;

// Inverse of map_dev_path: strip the DMCLEAN_DEV_ROOT prefix again.
auto unmap_dev_path(const std::string& mapped) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// Resolve a block device number to /dev/<DEVNAME> via /sys/dev/block/M:m/uevent.
// Falls back to /dev/block/M:m when sysfs has no entry.
auto block_path_for(unsigned maj, unsigned min) -> std::string;

} // namespace dmclean::util
