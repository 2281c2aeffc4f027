#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

#include "polling/pollster.hpp"

namespace pollagent {

//磁盘结构体
struct DiskStat {
  uint64_t reads{0}, writes{0}, sectors_read{0}, sectors_written{0};
  uint64_t read_time_ms{0}, write_time_ms{0}, io_in_progress{0};
};

using DiskStats = std::unordered_map<std::string, DiskStat>;

// 解析 /proc/diskstats 格式的文件，跳过 loop/ram 虚拟盘
bool read_disk_stats(const std::string& path, DiskStats* stats);

// 块设备累计读/写字节数，资源为设备名
class DiskPollster : public Pollster {
 public:
  enum class Direction { kRead, kWrite };

  explicit DiskPollster(Direction direction,
                        std::string proc_path = "/proc/diskstats")
      : _direction(direction), _proc_path(std::move(proc_path)) {}

  std::string default_discovery() const override { return "local_disks"; }
  PollStatus get_samples(const PollContext& context, PollCache* cache,
                         const std::vector<Resource>& resources,
                         std::vector<Sample>* samples) override;

  std::string meter_name() const;

 private:
  Direction _direction;
  std::string _proc_path;
};

}  // namespace pollagent
