#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace pollagent {

// 一致性哈希环；相同成员集合在任何进程中得到相同的归属
class HashRing {
 public:
  explicit HashRing(const std::vector<std::string>& nodes,
                    int replicas = kDefaultReplicas);

  // key 归属的节点；环为空时返回空串
  std::string get_node(const std::string& key) const;

  static constexpr int kDefaultReplicas = 100;

 private:
  std::map<uint32_t, std::string> _ring;
};

}  // namespace pollagent
