#pragma once

#include <string>

#include "polling/discoverer.hpp"

namespace pollagent {

// 枚举 /proc/diskstats 中的块设备（不含 loop/ram）
class BlockDeviceDiscoverer : public Discoverer {
 public:
  explicit BlockDeviceDiscoverer(std::string proc_path = "/proc/diskstats")
      : _proc_path(std::move(proc_path)) {}

  bool discover(const PollContext& context, const std::string& param,
                std::vector<Resource>* resources) override;

 private:
  std::string _proc_path;
};

}  // namespace pollagent
