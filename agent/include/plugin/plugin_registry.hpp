#pragma once

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "polling/discoverer.hpp"
#include "polling/pollster.hpp"

namespace pollagent {

// 插件工厂抛出该异常表示插件在当前环境不可用，加载时跳过
class ExtensionLoadError : public std::runtime_error {
 public:
  explicit ExtensionLoadError(const std::string& msg)
      : std::runtime_error(msg) {}
};

// 已加载的具名插件
template <typename T>
struct Extension {
  std::string name;
  std::shared_ptr<T> obj;
};

using PollsterExtension = Extension<Pollster>;
using DiscovererExtension = Extension<Discoverer>;

constexpr char kDiscoveryNamespace[] = "discover";

/**
 * 插件注册表
 *
 * 按命名空间保存插件工厂，load 时逐个实例化。
 * 单个插件加载失败只记录日志并跳过，不影响其他插件。
 */
class PluginRegistry {
 public:
  using PollsterFactory = std::function<std::shared_ptr<Pollster>()>;
  using DiscovererFactory = std::function<std::shared_ptr<Discoverer>()>;

  PluginRegistry() = default;

  void register_pollster(const std::string& ns, const std::string& name,
                         PollsterFactory factory);
  void register_discoverer(const std::string& name, DiscovererFactory factory);

  // 实例化命名空间 ns（如 "poll.compute"）下的全部 pollster
  std::vector<PollsterExtension> load_pollsters(const std::string& ns) const;
  std::vector<DiscovererExtension> load_discoverers() const;

 private:
  template <typename T, typename Factory>
  struct Entry {
    std::string ns;
    std::string name;
    Factory factory;
  };

  template <typename T, typename Factory>
  static std::vector<Extension<T>> load(
      const std::vector<Entry<T, Factory>>& entries, const std::string& ns);

  std::vector<Entry<Pollster, PollsterFactory>> _pollsters;
  std::vector<Entry<Discoverer, DiscovererFactory>> _discoverers;
};

// 注册内置的 Linux 采样与发现插件
void register_builtin_plugins(PluginRegistry* registry);

}  // namespace pollagent
