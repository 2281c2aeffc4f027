#include "discovery/net_interface_discoverer.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

#include "util/logging.hpp"

namespace pollagent {

bool NetInterfaceDiscoverer::discover(const PollContext& context,
                                      const std::string& param,
                                      std::vector<Resource>* resources) {
  std::error_code ec;
  std::filesystem::directory_iterator it(_sys_path, ec);
  if (ec) {
    agent_logger().error("Failed to list {}: {}", _sys_path, ec.message());
    return false;
  }
  for (const auto& entry : it) {
    std::string name = entry.path().filename().string();
    if (name == "lo") continue;
    if (!param.empty() && name.rfind(param, 0) != 0) continue;
    resources->push_back(name);
  }
  std::sort(resources->begin(), resources->end());
  return true;
}

}  // namespace pollagent
