#include "kernel/DmBackend.hpp"
#include "util/Log.hpp"
#include "util/Races.hpp"
#include "util/Sysfs.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <glob.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <sys/sysmacros.h>
#include <unistd.h>

#include <linux/dm-ioctl.h>
#include <linux/loop.h>

namespace dmclean::kernel {

using model::DeviceState;
using model::PathType;
using model::RemoveStatus;
using util::log_debug;
using util::log_warn;

static constexpr const char* kComponent = "DmBackend";
static constexpr size_t kInitialBuffer = 16 * 1024;
static constexpr size_t kMaxBuffer = 1024 * 1024;

DmBackend::DmBackend(std::string control_path)
    : control_path_(std::move(control_path)) {}

DmBackend::~DmBackend() {
  if (control_fd_ >= 0) ::close(control_fd_);
}

uint64_t DmBackend::encode_dev(unsigned maj, unsigned min) {
  return (static_cast<uint64_t>(min) & 0xff) |
         (static_cast<uint64_t>(maj) << 8) |
         ((static_cast<uint64_t>(min) & ~0xffULL) << 12);
}

void DmBackend::decode_dev(uint64_t dev, unsigned& maj, unsigned& min) {
  maj = static_cast<unsigned>((dev & 0xfff00) >> 8);
  min = static_cast<unsigned>((dev & 0xff) | ((dev >> 12) & 0xfff00));
}

bool DmBackend::ensure_control() {
  if (control_fd_ >= 0) return true;
  auto mapped = util::map_dev_path(control_path_);
  control_fd_ = ::open(mapped.c_str(), O_RDWR | O_CLOEXEC);
  if (control_fd_ < 0) {
    util::log_error(kComponent, "cannot open %s: %s", mapped.c_str(), std::strerror(errno));
    return false;
  }
  return true;
}

bool DmBackend::device_number(const std::string& path, uint64_t& dev) const {
  struct stat st{};
  if (::stat(util::map_dev_path(path).c_str(), &st) != 0) return false;
  if (!S_ISBLK(st.st_mode)) return false;
  dev = encode_dev(major(st.st_rdev), minor(st.st_rdev));
  return true;
}

int DmBackend::dm_command(unsigned long cmd, uint64_t dev, dm_ioctl* buf, size_t buf_size) {
  if (!ensure_control()) return EIO;
  std::memset(buf, 0, sizeof(dm_ioctl));
  buf->version[0] = DM_VERSION_MAJOR;
  buf->version[1] = 0;
  buf->version[2] = 0;
  buf->data_size = static_cast<uint32_t>(buf_size);
  buf->data_start = sizeof(dm_ioctl);
  buf->dev = dev; // name and uuid empty: kernel looks the device up by number
  if (::ioctl(control_fd_, cmd, buf) < 0) return errno;
  return 0;
}

PathType DmBackend::path_type(const std::string& path) {
  struct stat st{};
  if (::stat(util::map_dev_path(path).c_str(), &st) != 0) {
    if (errno == ENOENT || errno == ENOTDIR) return PathType::Missing;
    log_warn(kComponent, "stat %s: %s", path.c_str(), std::strerror(errno));
    return PathType::Other;
  }
  return S_ISBLK(st.st_mode) ? PathType::BlockDevice : PathType::Other;
}

DeviceState DmBackend::state(const std::string& path) {
  uint64_t dev = 0;
  if (!device_number(path, dev)) return DeviceState::Missing;
  dm_ioctl io{};
  int err = dm_command(DM_DEV_STATUS, dev, &io, sizeof(io));
  if (err == ENXIO) {
    // Either removed since stat, or a block device that is not a DM node
    if (path_type(path) == PathType::Missing) {
      util::note_race(util::RaceKind::Vanished);
      return DeviceState::Missing;
    }
    log_warn(kComponent, "%s is not a device-mapper node; treating as busy", path.c_str());
    return DeviceState::Busy;
  }
  if (err != 0) {
    log_warn(kComponent, "DM_DEV_STATUS %s: %s; treating as busy", path.c_str(), std::strerror(err));
    return DeviceState::Busy;
  }
  log_debug(kComponent, "%s (%s) open_count=%d", path.c_str(), io.name, io.open_count);
  return io.open_count == 0 ? DeviceState::Idle : DeviceState::Busy;
}

std::optional<model::Dependencies> DmBackend::dependencies(const std::string& path) {
  uint64_t dev = 0;
  if (!device_number(path, dev)) return std::nullopt;

  for (size_t size = kInitialBuffer; size <= kMaxBuffer; size *= 2) {
    // uint64_t storage keeps dm_ioctl and the trailing dev array aligned
    std::vector<uint64_t> storage(size / sizeof(uint64_t));
    auto* io = reinterpret_cast<dm_ioctl*>(storage.data());
    int err = dm_command(DM_TABLE_DEPS, dev, io, size);
    if (err == ENXIO) {
      util::note_race(util::RaceKind::Vanished);
      return std::nullopt;
    }
    if (err != 0) {
      log_warn(kComponent, "DM_TABLE_DEPS %s: %s", path.c_str(), std::strerror(err));
      return model::Dependencies{{}, false};
    }
    if (io->flags & DM_BUFFER_FULL_FLAG) continue;

    const auto* deps = reinterpret_cast<const dm_target_deps*>(
        reinterpret_cast<const char*>(io) + io->data_start);
    model::Dependencies out;
    out.paths.reserve(deps->count);
    for (uint32_t i = 0; i < deps->count; ++i) {
      unsigned maj = 0, min = 0;
      decode_dev(deps->dev[i], maj, min);
      out.paths.push_back(util::block_path_for(maj, min));
    }
    return out;
  }
  log_warn(kComponent, "dependency list of %s does not fit in %zu bytes", path.c_str(), kMaxBuffer);
  return model::Dependencies{{}, false};
}

std::vector<std::string> DmBackend::glob(const std::string& pattern) {
  std::vector<std::string> out;
  glob_t g{};
  int rc = ::glob(util::map_dev_path(pattern).c_str(), 0, nullptr, &g);
  if (rc == 0) {
    for (size_t i = 0; i < g.gl_pathc; ++i) out.push_back(util::unmap_dev_path(g.gl_pathv[i]));
  } else if (rc != GLOB_NOMATCH) {
    log_warn(kComponent, "glob %s failed (%d)", pattern.c_str(), rc);
  }
  ::globfree(&g);
  std::sort(out.begin(), out.end());
  return out;
}

RemoveStatus DmBackend::remove_dm(const std::string& path) {
  uint64_t dev = 0;
  if (!device_number(path, dev)) return RemoveStatus::Gone;
  dm_ioctl io{};
  int err = dm_command(DM_DEV_REMOVE, dev, &io, sizeof(io));
  switch (err) {
    case 0: return RemoveStatus::Removed;
    case ENXIO: return RemoveStatus::Gone;
    case EBUSY: return RemoveStatus::Busy;
    default:
      log_warn(kComponent, "DM_DEV_REMOVE %s: %s", path.c_str(), std::strerror(err));
      return RemoveStatus::Failed;
  }
}

RemoveStatus DmBackend::detach_loop(const std::string& path) {
  auto mapped = util::map_dev_path(path);
  int fd = ::open(mapped.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    if (errno == ENOENT || errno == ENXIO) return RemoveStatus::Gone;
    log_warn(kComponent, "open %s: %s", path.c_str(), std::strerror(errno));
    return RemoveStatus::Failed;
  }
  RemoveStatus status = RemoveStatus::Removed;
  if (::ioctl(fd, LOOP_CLR_FD, 0) < 0) {
    int err = errno;
    switch (err) {
      case ENXIO: status = RemoveStatus::Gone; break;        // no backing file
      case ENOTTY:
      case EINVAL: status = RemoveStatus::NotManaged; break; // not a loop device
      case EBUSY: status = RemoveStatus::Busy; break;
      default:
        log_warn(kComponent, "LOOP_CLR_FD %s: %s", path.c_str(), std::strerror(err));
        status = RemoveStatus::Failed;
    }
  }
  ::close(fd);
  return status;
}

} // namespace dmclean::kernel
