#include "plugin/plugin_registry.hpp"

#include "util/logging.hpp"

namespace pollagent {

template <typename T, typename Factory>
std::vector<Extension<T>> PluginRegistry::load(
    const std::vector<Entry<T, Factory>>& entries, const std::string& ns) {
  std::vector<Extension<T>> extensions;
  for (const auto& entry : entries) {
    if (entry.ns != ns) {
      continue;
    }
    try {
      std::shared_ptr<T> obj = entry.factory();
      if (!obj) {
        agent_logger().error("Extension {} in {} produced no object, skipped",
                             entry.name, ns);
        continue;
      }
      extensions.push_back(Extension<T>{entry.name, std::move(obj)});
    } catch (const ExtensionLoadError& e) {
      agent_logger().error("Skip loading extension for {}: {}", entry.name,
                           e.what());
    } catch (const std::exception& e) {
      agent_logger().error("Failed to load extension {} in {}: {}", entry.name,
                           ns, e.what());
    }
  }
  agent_logger().info("Loaded {} extension(s) from namespace {}",
                      extensions.size(), ns);
  return extensions;
}

void PluginRegistry::register_pollster(const std::string& ns,
                                       const std::string& name,
                                       PollsterFactory factory) {
  _pollsters.push_back({ns, name, std::move(factory)});
}

void PluginRegistry::register_discoverer(const std::string& name,
                                         DiscovererFactory factory) {
  _discoverers.push_back({kDiscoveryNamespace, name, std::move(factory)});
}

std::vector<PollsterExtension> PluginRegistry::load_pollsters(
    const std::string& ns) const {
  return load(_pollsters, ns);
}

std::vector<DiscovererExtension> PluginRegistry::load_discoverers() const {
  return load(_discoverers, kDiscoveryNamespace);
}

}  // namespace pollagent
