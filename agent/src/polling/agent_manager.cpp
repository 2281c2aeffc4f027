#include "polling/agent_manager.hpp"

#include <algorithm>
#include <cctype>
#include <random>
#include <set>

#include "util/logging.hpp"
#include "util/utils.hpp"

namespace pollagent {

namespace {

constexpr char kPollNamespacePrefix[] = "poll.";

// 一次 discover 调用的全部输出
struct DiscoveryOutcome {
  bool ok{false};
  std::vector<Resource> resources;
};

RandomSource default_random_source() {
  auto engine = std::make_shared<std::mt19937>(std::random_device{}());
  return [engine](int lo, int hi) {
    std::uniform_int_distribution<int> dist(lo, hi);
    return dist(*engine);
  };
}

bool is_scheme_char(char c) {
  // 内置发现插件名带下划线，如 local_interfaces
  return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' ||
         c == '.' || c == '_';
}

}  // namespace

AgentManager::AgentManager(AgentConfig config, const PluginRegistry& registry,
                           std::shared_ptr<CoordinationBackend> backend,
                           std::unique_ptr<TimerGroup> timers,
                           RandomSource random)
    : _config(std::move(config)),
      _timers(std::move(timers)),
      _random(random ? std::move(random) : default_random_source()) {
  // pollster 列表与多代理协调互斥，否则采样会重复或丢失
  if (!_config.pollster_list.empty() &&
      (!_config.backend_url.empty() || backend != nullptr)) {
    throw PollsterListForbidden();
  }

  for (const auto& ns : _config.namespaces) {
    for (auto& extension : registry.load_pollsters(kPollNamespacePrefix + ns)) {
      if (!_config.pollster_list.empty() &&
          !match_any_glob(extension.name, _config.pollster_list)) {
        continue;
      }
      _extensions.push_back(std::move(extension));
    }
  }
  _discovery_extensions = registry.load_discoverers();
  _deadline_runner = std::make_unique<DeadlineRunner>(call_timeout());

  _context = PollContext{_config.agent_id, get_hostname()};
  _partition_coordinator =
      std::make_unique<PartitionCoordinator>(std::move(backend), _config.agent_id);

  // 以命名空间作为分区组前缀的基础
  std::vector<std::string> namespaces(_config.namespaces);
  std::sort(namespaces.begin(), namespaces.end());
  for (const auto& ns : namespaces) {
    if (!_group_prefix.empty()) {
      _group_prefix += '-';
    }
    _group_prefix += ns;
  }
  if (!_config.group_prefix.empty()) {
    _group_prefix += '-' + _config.group_prefix;
  }

  agent_logger().info("AgentManager {} loaded {} pollster(s), {} discoverer(s)",
                      _config.agent_id, _extensions.size(),
                      _discovery_extensions.size());
}

AgentManager::~AgentManager() { stop(); }

std::chrono::milliseconds AgentManager::call_timeout() const {
  return std::chrono::milliseconds(
      static_cast<int64_t>(_config.poll_call_timeout) * 1000);
}

std::string AgentManager::construct_group_id(
    const std::string& discovery_group_id) const {
  if (discovery_group_id.empty()) {
    return "";
  }
  return _group_prefix + "-" + discovery_group_id;
}

void AgentManager::join_partitioning_groups(
    const std::vector<PipelinePtr>& pipelines) {
  std::set<std::string> groups;
  for (const auto& discoverer : _discovery_extensions) {
    std::string group = construct_group_id(discoverer.obj->group_id());
    if (!group.empty()) {
      groups.insert(group);
    }
  }
  // 每组静态资源各自成组
  for (const auto& pipeline : pipelines) {
    if (!pipeline->resources().empty()) {
      groups.insert(construct_group_id(hash_of_set(pipeline->resources())));
    }
  }

  // 不再需要的组要退出，否则同组的其他代理会把资源分给本代理
  for (const auto& joined : _partition_coordinator->joined_groups()) {
    if (groups.count(joined) == 0) {
      _partition_coordinator->leave_group(joined);
    }
  }
  for (const auto& group : groups) {
    _partition_coordinator->join_group(group);
  }
}

std::map<int, std::unique_ptr<PollingTask>> AgentManager::setup_polling_tasks(
    const std::vector<PipelinePtr>& pipelines) {
  std::map<int, std::unique_ptr<PollingTask>> polling_tasks;
  for (const auto& pipeline : pipelines) {
    for (const auto& pollster : _extensions) {
      if (!pipeline->support_meter(pollster.name)) {
        continue;
      }
      auto& task = polling_tasks[pipeline->interval()];
      if (!task) {
        task = std::make_unique<PollingTask>(this);
      }
      task->add(pollster, pipeline);
    }
  }
  return polling_tasks;
}

void AgentManager::start(std::vector<PipelinePtr> pipelines) {
  std::lock_guard<std::mutex> lock(_mtx);
  _partition_coordinator->start();
  schedule(std::move(pipelines));
}

void AgentManager::reload(std::vector<PipelinePtr> pipelines) {
  std::lock_guard<std::mutex> lock(_mtx);
  agent_logger().info("Reloading {} pipeline(s)", pipelines.size());
  // 先停掉定时器，确保没有回调仍在使用旧任务
  _timers->stop();
  _polling_tasks.clear();
  schedule(std::move(pipelines));
}

void AgentManager::stop() {
  std::lock_guard<std::mutex> lock(_mtx);
  if (_timers) {
    _timers->stop();
  }
  _polling_tasks.clear();
  if (_deadline_runner) {
    size_t pending = _deadline_runner->wait_idle(call_timeout());
    if (pending > 0) {
      agent_logger().warn("{} plugin call(s) still running after stop", pending);
    }
  }
  if (_partition_coordinator) {
    _partition_coordinator->stop();
  }
}

void AgentManager::schedule(std::vector<PipelinePtr> pipelines) {
  _pipelines = std::move(pipelines);
  join_partitioning_groups(_pipelines);
  _polling_tasks = setup_polling_tasks(_pipelines);

  // 协调启用时多等一个周期，让组成员稳定下来
  bool delay_start = _partition_coordinator->is_active();
  // 随机错开各代理的首次轮询
  _delay_polling_time =
      _random(0, std::max(0, _config.shuffle_time_before_polling_task));

  for (auto& [interval, task] : _polling_tasks) {
    int delay_time =
        delay_start ? interval + _delay_polling_time : _delay_polling_time;
    PollingTask* task_ptr = task.get();
    _timers->add_timer(std::chrono::seconds(interval),
                       std::chrono::seconds(delay_time),
                       [task_ptr] { interval_task(task_ptr); });
    agent_logger().info("Scheduled polling task every {}s, first run in {}s",
                        interval, delay_time);
  }

  PartitionCoordinator* coordinator = _partition_coordinator.get();
  _timers->add_timer(std::chrono::seconds(_config.heartbeat),
                     std::chrono::seconds(_config.heartbeat),
                     [coordinator] { coordinator->heartbeat(); });
}

void AgentManager::interval_task(PollingTask* task) {
  try {
    task->poll_and_publish();
  } catch (const std::exception& e) {
    agent_logger().error("Polling task failed: {}", e.what());
  }
}

std::pair<std::string, std::string> AgentManager::parse_discoverer(
    const std::string& url) {
  auto colon = url.find(':');
  if (colon != std::string::npos && colon > 0 &&
      std::isalpha(static_cast<unsigned char>(url[0])) &&
      std::all_of(url.begin(), url.begin() + colon, is_scheme_char)) {
    std::string scheme = url.substr(0, colon);
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    std::string param = url.substr(colon + 1);
    if (param.rfind("//", 0) == 0) {
      param.erase(0, 2);
    }
    return {scheme, param};
  }
  return {url, ""};
}

std::shared_ptr<Discoverer> AgentManager::find_discoverer(
    const std::string& name) const {
  for (const auto& extension : _discovery_extensions) {
    if (extension.name == name) {
      return extension.obj;
    }
  }
  return nullptr;
}

std::vector<Resource> AgentManager::discover(
    const std::vector<std::string>& discovery,
    DiscoveryCache* discovery_cache) {
  std::vector<Resource> resources;
  for (const auto& url : discovery) {
    if (discovery_cache != nullptr) {
      auto cached = discovery_cache->find(url);
      if (cached != discovery_cache->end()) {
        resources.insert(resources.end(), cached->second.begin(),
                         cached->second.end());
        continue;
      }
    }

    auto parsed = parse_discoverer(url);
    const std::string& name = parsed.first;
    std::string param = parsed.second;
    std::shared_ptr<Discoverer> discoverer = find_discoverer(name);
    if (!discoverer) {
      agent_logger().warn("Unknown discovery extension: {}", name);
      continue;
    }

    std::vector<Resource> partitioned;
    try {
      DiscoveryOutcome outcome;
      auto result = _deadline_runner->call<DiscoveryOutcome>(
          "discovery:" + url,
          [discoverer, context = _context, param]() {
            DiscoveryOutcome out;
            out.ok = discoverer->discover(context, param, &out.resources);
            return out;
          },
          &outcome);
      if (result == DeadlineRunner::Result::kBusy) {
        agent_logger().warn("Skip discovery {}, previous call still running", url);
      } else if (result == DeadlineRunner::Result::kTimedOut) {
        agent_logger().error("Discovery {} timed out after {} ms", url,
                             call_timeout().count());
      } else if (!outcome.ok) {
        agent_logger().error("Unable to discover resources from {}", url);
      } else {
        partitioned = _partition_coordinator->extract_my_subset(
            construct_group_id(discoverer->group_id()), outcome.resources);
      }
    } catch (const std::exception& e) {
      agent_logger().error("Unable to discover resources from {}: {}", url,
                           e.what());
    }

    resources.insert(resources.end(), partitioned.begin(), partitioned.end());
    // 失败也记入缓存，同一周期内不再重复调用
    if (discovery_cache != nullptr) {
      (*discovery_cache)[url] = std::move(partitioned);
    }
  }
  return resources;
}

}  // namespace pollagent
