#pragma once
#include "kernel/IBlockBackend.hpp"
#include <cstdint>
#include <string>

struct dm_ioctl;

namespace dmclean::kernel {

// Real backend: device-mapper ioctls on /dev/mapper/control and LOOP_CLR_FD.
// Devices are addressed by device number, so /dev/mapper/<name> symlinks and
// plain nodes both work.
class DmBackend : public IBlockBackend {
public:
  explicit DmBackend(std::string control_path = "/dev/mapper/control");
  ~DmBackend() override;
  DmBackend(const DmBackend&) = delete;
  DmBackend& operator=(const DmBackend&) = delete;

  [[nodiscard]] model::PathType path_type(const std::string& path) override;
  [[nodiscard]] model::DeviceState state(const std::string& path) override;
  [[nodiscard]] std::optional<model::Dependencies> dependencies(const std::string& path) override;
  [[nodiscard]] std::vector<std::string> glob(const std::string& pattern) override;
  [[nodiscard]] model::RemoveStatus remove_dm(const std::string& path) override;
  [[nodiscard]] model::RemoveStatus detach_loop(const std::string& path) override;
  [[nodiscard]] const char* name() const override { return "dm-ioctl"; }

  // Kernel "huge" dev_t encoding used in struct dm_ioctl and dm_target_deps
  [[nodiscard]] static uint64_t encode_dev(unsigned maj, unsigned min);
  static void decode_dev(uint64_t dev, unsigned& maj, unsigned& min);

private:
  bool ensure_control();
  // Resolves path to a block device number. False if missing or not a block node.
  bool device_number(const std::string& path, uint64_t& dev) const;
  // Issues cmd for dev into buf. Returns 0 or the errno.
  int dm_command(unsigned long cmd, uint64_t dev, dm_ioctl* buf, size_t buf_size);

  std::string control_path_;
  int control_fd_{-1};
};

} // namespace dmclean::kernel
