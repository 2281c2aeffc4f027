#include "coordination/hash_ring.hpp"

#include <algorithm>
#include <format>

#include "util/utils.hpp"

namespace pollagent {

HashRing::HashRing(const std::vector<std::string>& nodes, int replicas) {
  // 先排序：哈希冲突时保留字典序最小的节点，结果与成员返回顺序无关
  std::vector<std::string> sorted(nodes);
  std::sort(sorted.begin(), sorted.end());
  for (const auto& node : sorted) {
    for (int r = 0; r < replicas; ++r) {
      _ring.emplace(fnv1a_32(std::format("{}-{}", node, r)), node);
    }
  }
}

std::string HashRing::get_node(const std::string& key) const {
  if (_ring.empty()) {
    return "";
  }
  auto it = _ring.lower_bound(fnv1a_32(key));
  if (it == _ring.end()) {
    it = _ring.begin();
  }
  return it->second;
}

}  // namespace pollagent
