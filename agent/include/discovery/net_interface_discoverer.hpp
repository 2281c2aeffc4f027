#pragma once

#include <string>

#include "polling/discoverer.hpp"

namespace pollagent {

/**
 * 枚举 /sys/class/net 下的网卡（不含 lo）
 *
 * 参数非空时作为名字前缀过滤，如 local_interfaces://eth。
 */
class NetInterfaceDiscoverer : public Discoverer {
 public:
  explicit NetInterfaceDiscoverer(std::string sys_path = "/sys/class/net")
      : _sys_path(std::move(sys_path)) {}

  std::string group_id() const override { return "local_interfaces"; }
  bool discover(const PollContext& context, const std::string& param,
                std::vector<Resource>* resources) override;

 private:
  std::string _sys_path;
};

}  // namespace pollagent
