#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "config/agent_config.hpp"
#include "coordination/coordination_backend.hpp"
#include "coordination/partition_coordinator.hpp"
#include "plugin/plugin_registry.hpp"
#include "polling/deadline_runner.hpp"
#include "polling/pipeline.hpp"
#include "polling/polling_task.hpp"
#include "polling/resource.hpp"
#include "polling/timer_group.hpp"

namespace pollagent {

// 同时配置了 pollster 列表与协调后端
class PollsterListForbidden : public std::runtime_error {
 public:
  PollsterListForbidden()
      : std::runtime_error(
            "It is forbidden to use pollster-list option of polling agent in "
            "case of using coordination between multiple agents. Please use "
            "either multiple agents being coordinated or polling list option "
            "for one polling agent.") {}
};

// 返回 [lo, hi] 内的随机整数
using RandomSource = std::function<int(int lo, int hi)>;

/**
 * 轮询代理的顶层调度器
 *
 * 加载插件，按轮询周期把 流水线 x pollster 组合成任务，
 * 加入分区组，并为每个周期注册一个带随机抖动的定时器。
 * 资源发现（discover）也由这里完成。
 */
class AgentManager {
 public:
  // 配置 pollster_list 的同时配置 backend_url 或传入 backend 时抛出 PollsterListForbidden
  AgentManager(AgentConfig config, const PluginRegistry& registry,
               std::shared_ptr<CoordinationBackend> backend,
               std::unique_ptr<TimerGroup> timers,
               RandomSource random = RandomSource());
  ~AgentManager();

  AgentManager(const AgentManager&) = delete;
  AgentManager& operator=(const AgentManager&) = delete;

  // 启动协调器、加入分区组并注册定时器
  void start(std::vector<PipelinePtr> pipelines);
  // 流水线变化后重建全部任务和定时器
  void reload(std::vector<PipelinePtr> pipelines);
  void stop();

  // 周期 -> 任务
  std::map<int, std::unique_ptr<PollingTask>> setup_polling_tasks(
      const std::vector<PipelinePtr>& pipelines);
  void join_partitioning_groups(const std::vector<PipelinePtr>& pipelines);

  // 定时器回调
  static void interval_task(PollingTask* task);

  // 解析 url 并调用对应发现插件；单个 url 失败不影响其他 url
  std::vector<Resource> discover(const std::vector<std::string>& discovery,
                                 DiscoveryCache* discovery_cache = nullptr);

  // 返回 {插件名, 参数}
  static std::pair<std::string, std::string> parse_discoverer(
      const std::string& url);

  // "<prefix>-<id>"；id 为空时返回空串
  std::string construct_group_id(const std::string& discovery_group_id) const;

  PartitionCoordinator& partition_coordinator() { return *_partition_coordinator; }
  const PollContext& context() const { return _context; }
  const AgentConfig& config() const { return _config; }
  const std::string& group_prefix() const { return _group_prefix; }
  std::chrono::milliseconds call_timeout() const;
  // 插件调用都经由这里，保证每个 key 同时只有一个调用
  DeadlineRunner& deadline_runner() { return *_deadline_runner; }

  const std::vector<PollsterExtension>& extensions() const { return _extensions; }
  const std::vector<DiscovererExtension>& discovery_extensions() const {
    return _discovery_extensions;
  }

  // 最近一次调度使用的抖动（秒）
  int delay_polling_time() const { return _delay_polling_time; }

 private:
  void schedule(std::vector<PipelinePtr> pipelines);
  std::shared_ptr<Discoverer> find_discoverer(const std::string& name) const;

  AgentConfig _config;
  PollContext _context;
  std::string _group_prefix;
  std::vector<PollsterExtension> _extensions;
  std::vector<DiscovererExtension> _discovery_extensions;
  std::unique_ptr<PartitionCoordinator> _partition_coordinator;
  std::unique_ptr<TimerGroup> _timers;
  RandomSource _random;
  std::unique_ptr<DeadlineRunner> _deadline_runner;

  std::mutex _mtx;  // 保护下面的调度状态
  std::vector<PipelinePtr> _pipelines;
  std::map<int, std::unique_ptr<PollingTask>> _polling_tasks;
  int _delay_polling_time{0};
};

}  // namespace pollagent
