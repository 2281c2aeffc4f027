#pragma once

#include <string>
#include <tuple>
#include <vector>

#include "polling/pipeline.hpp"
#include "polling/resource.hpp"

namespace pollagent {

class AgentManager;

// (source, pollster) 组合的标识
struct PairingKey {
  std::string source_name;
  std::string pollster_name;

  bool operator<(const PairingKey& other) const {
    return std::tie(source_name, pollster_name) <
           std::tie(other.source_name, other.pollster_name);
  }
  bool operator==(const PairingKey& other) const {
    return source_name == other.source_name &&
           pollster_name == other.pollster_name;
  }
};

/**
 * 一个 (source, pollster) 组合在每个周期要轮询的资源
 *
 * 静态资源经分区协调器切分，动态资源来自 discovery，
 * 两者直接拼接，不去重。黑名单只增不减，由所属任务在
 * 永久性失败时追加，过滤也在任务中进行。
 */
class ResourceSet {
 public:
  explicit ResourceSet(AgentManager* manager);

  // 重复调用以最后一次为准
  void setup(const Pipeline& pipeline);

  // 静态分区结果 + 发现结果
  std::vector<Resource> get(DiscoveryCache* discovery_cache);

  const std::vector<Resource>& blacklist() const { return _blacklist; }
  bool is_blacklisted(const Resource& resource) const;
  void add_to_blacklist(const Resource& resource);

  const std::vector<Resource>& static_resources() const { return _resources; }
  const std::vector<std::string>& discovery() const { return _discovery; }

  static PairingKey key(const std::string& source_name,
                        const std::string& pollster_name) {
    return PairingKey{source_name, pollster_name};
  }

 private:
  AgentManager* _manager;
  std::vector<Resource> _resources;
  std::vector<std::string> _discovery;
  std::vector<Resource> _blacklist;
};

}  // namespace pollagent
