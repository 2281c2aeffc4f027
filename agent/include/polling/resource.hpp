#pragma once

#include <any>
#include <string>
#include <unordered_map>
#include <vector>

#include "poll_agent.pb.h"

namespace pollagent {

// 资源标识；黑名单与分区都按该字符串比较
using Resource = std::string;

using Sample = pollagent::proto::Sample;

// 每个轮询周期新建，供同一周期内的 pollster 之间共享中间结果
using PollCache = std::unordered_map<std::string, std::any>;

// 每个轮询周期新建：discovery url -> 已解析出的资源
using DiscoveryCache = std::unordered_map<std::string, std::vector<Resource>>;

// 传给插件的调用上下文
struct PollContext {
  std::string agent_id;
  std::string hostname;
};

}  // namespace pollagent
