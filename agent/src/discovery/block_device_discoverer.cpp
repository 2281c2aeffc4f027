#include "discovery/block_device_discoverer.hpp"

#include <algorithm>

#include "pollsters/disk_pollster.hpp"

namespace pollagent {

bool BlockDeviceDiscoverer::discover(const PollContext& context,
                                     const std::string& param,
                                     std::vector<Resource>* resources) {
  DiskStats stats;
  if (!read_disk_stats(_proc_path, &stats)) {
    return false;
  }
  for (const auto& [name, stat] : stats) {
    resources->push_back(name);
  }
  std::sort(resources->begin(), resources->end());
  return true;
}

}  // namespace pollagent
