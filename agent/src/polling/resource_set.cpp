#include "polling/resource_set.hpp"

#include <algorithm>

#include "polling/agent_manager.hpp"
#include "util/utils.hpp"

namespace pollagent {

ResourceSet::ResourceSet(AgentManager* manager) : _manager(manager) {}

void ResourceSet::setup(const Pipeline& pipeline) {
  _resources = pipeline.resources();
  _discovery = pipeline.discovery();
}

std::vector<Resource> ResourceSet::get(DiscoveryCache* discovery_cache) {
  std::vector<Resource> source_discovery;
  if (!_discovery.empty()) {
    source_discovery = _manager->discover(_discovery, discovery_cache);
  }

  std::vector<Resource> resources;
  if (!_resources.empty()) {
    // 组 id 取静态资源集合的哈希，同一集合的代理落在同一组
    std::string group =
        _manager->construct_group_id(hash_of_set(_resources));
    resources =
        _manager->partition_coordinator().extract_my_subset(group, _resources);
  }

  resources.insert(resources.end(), source_discovery.begin(),
                   source_discovery.end());
  return resources;
}

bool ResourceSet::is_blacklisted(const Resource& resource) const {
  return std::find(_blacklist.begin(), _blacklist.end(), resource) !=
         _blacklist.end();
}

void ResourceSet::add_to_blacklist(const Resource& resource) {
  if (!is_blacklisted(resource)) {
    _blacklist.push_back(resource);
  }
}

}  // namespace pollagent
