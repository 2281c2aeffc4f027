#include <filesystem>
#include <memory>

#include "discovery/block_device_discoverer.hpp"
#include "discovery/local_node_discoverer.hpp"
#include "discovery/net_interface_discoverer.hpp"
#include "plugin/plugin_registry.hpp"
#include "pollsters/cpuload_pollster.hpp"
#include "pollsters/disk_pollster.hpp"
#include "pollsters/memory_pollster.hpp"
#include "pollsters/net_pollster.hpp"

namespace pollagent {

namespace {
constexpr char kComputeNamespace[] = "poll.compute";

// 数据源不存在（如非 Linux 系统）时插件不可加载
void require_path(const char* path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    throw ExtensionLoadError(std::string(path) + " is not available");
  }
}
}  // namespace

void register_builtin_plugins(PluginRegistry* registry) {
  registry->register_pollster(kComputeNamespace, "cpu.load", [] {
    require_path("/proc/loadavg");
    return std::make_shared<CpuLoadPollster>();
  });
  registry->register_pollster(kComputeNamespace, "memory.usage", [] {
    require_path("/proc/meminfo");
    return std::make_shared<MemoryPollster>();
  });
  registry->register_pollster(kComputeNamespace, "network.incoming.bytes", [] {
    require_path("/proc/net/dev");
    return std::make_shared<NetPollster>(NetPollster::Direction::kIncoming);
  });
  registry->register_pollster(kComputeNamespace, "network.outgoing.bytes", [] {
    require_path("/proc/net/dev");
    return std::make_shared<NetPollster>(NetPollster::Direction::kOutgoing);
  });
  registry->register_pollster(kComputeNamespace, "disk.read.bytes", [] {
    require_path("/proc/diskstats");
    return std::make_shared<DiskPollster>(DiskPollster::Direction::kRead);
  });
  registry->register_pollster(kComputeNamespace, "disk.write.bytes", [] {
    require_path("/proc/diskstats");
    return std::make_shared<DiskPollster>(DiskPollster::Direction::kWrite);
  });

  registry->register_discoverer("local_node", [] {
    return std::make_shared<LocalNodeDiscoverer>();
  });
  registry->register_discoverer("local_interfaces", [] {
    require_path("/sys/class/net");
    return std::make_shared<NetInterfaceDiscoverer>();
  });
  registry->register_discoverer("local_disks", [] {
    require_path("/proc/diskstats");
    return std::make_shared<BlockDeviceDiscoverer>();
  });
}

}  // namespace pollagent
