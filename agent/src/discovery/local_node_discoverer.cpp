#include "discovery/local_node_discoverer.hpp"

namespace pollagent {

bool LocalNodeDiscoverer::discover(const PollContext& context,
                                   const std::string& param,
                                   std::vector<Resource>* resources) {
  if (context.hostname.empty()) {
    return false;
  }
  resources->push_back(context.hostname);
  return true;
}

}  // namespace pollagent
