#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "plugin/plugin_registry.hpp"
#include "polling/pipeline.hpp"
#include "polling/resource_set.hpp"
#include "publish/publish_context.hpp"

namespace pollagent {

class AgentManager;

/**
 * 轮询任务
 *
 * 聚合轮询周期相同的全部 (source, pollster) 组合，
 * 每个 source 一个发布上下文。由定时器周期性调用 poll_and_publish。
 */
class PollingTask {
 public:
  explicit PollingTask(AgentManager* manager);

  PollingTask(const PollingTask&) = delete;
  PollingTask& operator=(const PollingTask&) = delete;

  // 同一 source 重复添加同名 pollster 不会重复登记，但资源配置以最后一次为准
  void add(const PollsterExtension& pollster, const PipelinePtr& pipeline);

  // 轮询全部组合并发布；单个插件的失败不会向外抛出
  void poll_and_publish();

  std::vector<std::string> sources() const;
  std::vector<PollsterExtension> pollsters(const std::string& source_name) const;
  // 不存在时返回 nullptr
  ResourceSet* resource_set(const std::string& source_name,
                            const std::string& pollster_name);
  const PublishContext* publish_context(const std::string& source_name) const;

 private:
  void poll_pollster(const std::string& source_name,
                     const PollsterExtension& pollster, PollCache* cache,
                     DiscoveryCache* discovery_cache, PublishBatch* batch);

  AgentManager* _manager;
  // source -> pollster 名 -> pollster
  std::map<std::string, std::map<std::string, PollsterExtension>>
      _pollster_matches;
  std::map<std::string, std::unique_ptr<PublishContext>> _publishers;
  std::map<PairingKey, ResourceSet> _resources;
};

}  // namespace pollagent
