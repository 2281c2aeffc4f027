#pragma once

#include <string>
#include <vector>

#include "polling/resource.hpp"

namespace pollagent {

/// 资源发现插件接口
class Discoverer {
 public:
  Discoverer() {}
  virtual ~Discoverer() {}

  // 分区组 id；空串表示发现结果不需要在代理之间分区
  virtual std::string group_id() const { return ""; }

  // 按 param 枚举资源，失败返回 false
  virtual bool discover(const PollContext& context, const std::string& param,
                        std::vector<Resource>* resources) = 0;
};

}  // namespace pollagent
