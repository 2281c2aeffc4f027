#include "polling/polling_task.hpp"

#include <algorithm>
#include <iterator>

#include "polling/agent_manager.hpp"
#include "polling/deadline_runner.hpp"
#include "util/logging.hpp"

namespace pollagent {

namespace {

// 一次 get_samples 调用的全部输出
struct PollOutcome {
  PollStatus status;
  std::vector<Sample> samples;
  PollCache cache;
};

}  // namespace

PollingTask::PollingTask(AgentManager* manager) : _manager(manager) {}

void PollingTask::add(const PollsterExtension& pollster,
                      const PipelinePtr& pipeline) {
  const std::string& source_name = pipeline->source().name;
  auto& publisher = _publishers[source_name];
  if (!publisher) {
    publisher = std::make_unique<PublishContext>(_manager->context());
  }
  publisher->add_pipelines({pipeline});

  _pollster_matches[source_name].emplace(pollster.name, pollster);

  auto key = ResourceSet::key(source_name, pollster.name);
  auto it = _resources.find(key);
  if (it == _resources.end()) {
    it = _resources.emplace(key, ResourceSet(_manager)).first;
  }
  it->second.setup(*pipeline);
}

void PollingTask::poll_and_publish() {
  PollCache cache;
  DiscoveryCache discovery_cache;
  for (const auto& [source_name, pollsters] : _pollster_matches) {
    // 离开作用域时 flush
    PublishBatch batch = _publishers.at(source_name)->open_batch();
    for (const auto& [name, pollster] : pollsters) {
      poll_pollster(source_name, pollster, &cache, &discovery_cache, &batch);
    }
  }
}

void PollingTask::poll_pollster(const std::string& source_name,
                                const PollsterExtension& pollster,
                                PollCache* cache,
                                DiscoveryCache* discovery_cache,
                                PublishBatch* batch) {
  auto& log = agent_logger();
  log.info("Polling pollster {} in the context of {}", pollster.name,
           source_name);

  ResourceSet& resources = _resources.at(ResourceSet::key(source_name, pollster.name));
  std::vector<Resource> candidates = resources.get(discovery_cache);
  // source 上的资源优先，没有时才用 pollster 自己的默认发现
  if (candidates.empty()) {
    std::string default_discovery = pollster.obj->default_discovery();
    if (!default_discovery.empty()) {
      candidates = _manager->discover({default_discovery}, discovery_cache);
    }
  }

  std::vector<Resource> targets;
  std::copy_if(candidates.begin(), candidates.end(), std::back_inserter(targets),
               [&resources](const Resource& r) {
                 return !resources.is_blacklisted(r);
               });
  if (targets.empty()) {
    log.info("Skip polling pollster {}, no resources found", pollster.name);
    return;
  }

  PollOutcome outcome;
  DeadlineRunner::Result result;
  try {
    result = _manager->deadline_runner().call<PollOutcome>(
        "poll:" + source_name + "/" + pollster.name,
        [obj = pollster.obj, context = _manager->context(), cache_copy = *cache,
         targets]() mutable {
          PollOutcome out;
          out.status = obj->get_samples(context, &cache_copy, targets,
                                        &out.samples);
          out.cache = std::move(cache_copy);
          return out;
        },
        &outcome);
  } catch (const std::exception& e) {
    log.warn("Continue after error from {}: {}", pollster.name, e.what());
    return;
  }

  if (result == DeadlineRunner::Result::kBusy) {
    log.warn("Skip polling pollster {}, previous call still running",
             pollster.name);
    return;
  }
  if (result == DeadlineRunner::Result::kTimedOut) {
    log.warn("Continue after error from {}: timed out after {} ms",
             pollster.name, _manager->call_timeout().count());
    return;
  }
  *cache = std::move(outcome.cache);

  switch (outcome.status.kind) {
    case PollStatus::Kind::kOk:
      batch->add(std::move(outcome.samples));
      break;
    case PollStatus::Kind::kPermanent:
      log.error("Prevent pollster {} for polling source {} anymore! "
                "Resource {} failed: {}",
                pollster.name, source_name, outcome.status.resource,
                outcome.status.message);
      resources.add_to_blacklist(outcome.status.resource);
      break;
    case PollStatus::Kind::kTransient:
      log.warn("Continue after error from {}: {}", pollster.name,
               outcome.status.message);
      break;
  }
}

std::vector<std::string> PollingTask::sources() const {
  std::vector<std::string> names;
  for (const auto& [source_name, pollsters] : _pollster_matches) {
    names.push_back(source_name);
  }
  return names;
}

std::vector<PollsterExtension> PollingTask::pollsters(
    const std::string& source_name) const {
  std::vector<PollsterExtension> result;
  auto it = _pollster_matches.find(source_name);
  if (it != _pollster_matches.end()) {
    for (const auto& [name, pollster] : it->second) {
      result.push_back(pollster);
    }
  }
  return result;
}

ResourceSet* PollingTask::resource_set(const std::string& source_name,
                                       const std::string& pollster_name) {
  auto it = _resources.find(ResourceSet::key(source_name, pollster_name));
  return it == _resources.end() ? nullptr : &it->second;
}

const PublishContext* PollingTask::publish_context(
    const std::string& source_name) const {
  auto it = _publishers.find(source_name);
  return it == _publishers.end() ? nullptr : it->second.get();
}

}  // namespace pollagent
