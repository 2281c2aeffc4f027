#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <set>

#include "config/pipeline_loader.hpp"
#include "discovery/net_interface_discoverer.hpp"
#include "fakes.hpp"
#include "polling/agent_manager.hpp"
#include "util/utils.hpp"

using namespace pollagent;
using ::testing::ElementsAre;
using ::testing::UnorderedElementsAre;
using namespace std::chrono_literals;

namespace {

class AgentManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    _cpu = std::make_shared<fakes::ScriptedPollster>("cpu.util");
    _disk = std::make_shared<fakes::ScriptedPollster>("disk.read");
    _registry.register_pollster("poll.compute", "cpu.util", [this] { return _cpu; });
    _registry.register_pollster("poll.compute", "disk.read", [this] { return _disk; });
    _registry.register_pollster("poll.central", "image.size", [] {
      return std::make_shared<fakes::ScriptedPollster>("image.size");
    });

    _instances = std::make_shared<fakes::CountingDiscoverer>(
        std::vector<Resource>{"i1", "i2", "i3", "i4"}, "instances");
    _local = std::make_shared<fakes::CountingDiscoverer>(
        std::vector<Resource>{"node"});
    _registry.register_discoverer("instances", [this] { return _instances; });
    _registry.register_discoverer("local", [this] { return _local; });

    _publisher = std::make_shared<fakes::RecordingPublisher>();
  }

  std::unique_ptr<AgentManager> make_manager(
      AgentConfig config, std::shared_ptr<CoordinationBackend> backend = nullptr,
      fakes::ManualTimerGroup** timers = nullptr) {
    if (config.agent_id.empty()) {
      config.agent_id = "agent-a";
    }
    auto timer_group = std::make_unique<fakes::ManualTimerGroup>();
    if (timers != nullptr) {
      *timers = timer_group.get();
    }
    return std::make_unique<AgentManager>(config, _registry, std::move(backend),
                                          std::move(timer_group),
                                          fakes::max_random);
  }

  PluginRegistry _registry;
  std::shared_ptr<fakes::ScriptedPollster> _cpu;
  std::shared_ptr<fakes::ScriptedPollster> _disk;
  std::shared_ptr<fakes::CountingDiscoverer> _instances;
  std::shared_ptr<fakes::CountingDiscoverer> _local;
  std::shared_ptr<fakes::RecordingPublisher> _publisher;
};

std::vector<std::string> names_of(const std::vector<PollsterExtension>& extensions) {
  std::vector<std::string> names;
  for (const auto& extension : extensions) {
    names.push_back(extension.name);
  }
  return names;
}

TEST_F(AgentManagerTest, PollsterListWithBackendIsForbidden) {
  AgentConfig config;
  config.pollster_list = {"cpu.*"};
  config.backend_url = "grpc://127.0.0.1:50051";
  EXPECT_THROW(make_manager(config), PollsterListForbidden);

  config.pollster_list = {"*"};
  EXPECT_THROW(make_manager(config, std::make_shared<fakes::InMemoryBackend>()),
               PollsterListForbidden);
}

TEST_F(AgentManagerTest, PollsterListFiltersByGlob) {
  AgentConfig config;
  config.pollster_list = {"cpu.*"};
  auto manager = make_manager(config);
  EXPECT_THAT(names_of(manager->extensions()), ElementsAre("cpu.util"));
}

TEST_F(AgentManagerTest, LoadsPollstersFromAllNamespaces) {
  AgentConfig config;
  config.namespaces = {"compute", "central"};
  auto manager = make_manager(config);
  EXPECT_THAT(names_of(manager->extensions()),
              UnorderedElementsAre("cpu.util", "disk.read", "image.size"));
  EXPECT_EQ(manager->discovery_extensions().size(), 2u);
}

TEST_F(AgentManagerTest, GroupPrefixFromSortedNamespaces) {
  AgentConfig config;
  config.namespaces = {"compute", "central"};
  config.group_prefix = "site1";
  auto manager = make_manager(config);
  EXPECT_EQ(manager->group_prefix(), "central-compute-site1");
  EXPECT_EQ(manager->construct_group_id("instances"),
            "central-compute-site1-instances");
  EXPECT_EQ(manager->construct_group_id(""), "");
}

TEST_F(AgentManagerTest, ParseDiscoverer) {
  EXPECT_EQ(AgentManager::parse_discoverer("instances://"),
            std::make_pair(std::string("instances"), std::string("")));
  EXPECT_EQ(AgentManager::parse_discoverer("local_interfaces://eth"),
            std::make_pair(std::string("local_interfaces"), std::string("eth")));
  EXPECT_EQ(AgentManager::parse_discoverer("Endpoint:image"),
            std::make_pair(std::string("endpoint"), std::string("image")));
  EXPECT_EQ(AgentManager::parse_discoverer("local"),
            std::make_pair(std::string("local"), std::string("")));
}

TEST_F(AgentManagerTest, ParseDiscovererBuiltinNames) {
  EXPECT_EQ(AgentManager::parse_discoverer("local_node://"),
            std::make_pair(std::string("local_node"), std::string("")));
  EXPECT_EQ(AgentManager::parse_discoverer("local_disks://"),
            std::make_pair(std::string("local_disks"), std::string("")));
  EXPECT_EQ(AgentManager::parse_discoverer("local_interfaces://"),
            std::make_pair(std::string("local_interfaces"), std::string("")));
}

TEST_F(AgentManagerTest, ShippedPipelineDiscoveryResolves) {
  auto interfaces = std::make_shared<fakes::CountingDiscoverer>(
      std::vector<Resource>{"eth0"});
  auto disks = std::make_shared<fakes::CountingDiscoverer>(
      std::vector<Resource>{"sda"});
  _registry.register_discoverer("local_interfaces", [interfaces] { return interfaces; });
  _registry.register_discoverer("local_disks", [disks] { return disks; });
  auto manager = make_manager(AgentConfig());

  auto pipelines = load_pipelines(
      std::string(POLLAGENT_SOURCE_DIR) + "/etc/pipeline.yaml",
      [](const std::string& url) -> std::shared_ptr<Publisher> {
        return std::make_shared<fakes::RecordingPublisher>();
      });
  DiscoveryCache cache;
  std::vector<Resource> discovered;
  for (const auto& pipeline : pipelines) {
    if (pipeline->source().name == "io_source") {
      auto resources = manager->discover(pipeline->discovery(), &cache);
      discovered.insert(discovered.end(), resources.begin(), resources.end());
    }
  }

  EXPECT_THAT(discovered, ElementsAre("eth0", "sda"));
  EXPECT_EQ(interfaces->count(), 1);
  EXPECT_EQ(disks->count(), 1);
}

TEST_F(AgentManagerTest, InterfacePrefixReachesDiscoverer) {
  auto sys_net = std::filesystem::path(::testing::TempDir()) / "agent_manager_sys_net";
  std::filesystem::remove_all(sys_net);
  for (const char* name : {"eth0", "eth1", "lo", "wlan0"}) {
    std::filesystem::create_directories(sys_net / name);
  }
  _registry.register_discoverer("local_interfaces", [sys_net] {
    return std::make_shared<NetInterfaceDiscoverer>(sys_net.string());
  });
  auto manager = make_manager(AgentConfig());

  EXPECT_THAT(manager->discover({"local_interfaces://eth"}),
              ElementsAre("eth0", "eth1"));
  EXPECT_THAT(manager->discover({"local_interfaces://"}),
              ElementsAre("eth0", "eth1", "wlan0"));
  std::filesystem::remove_all(sys_net);
}

TEST_F(AgentManagerTest, UnknownDiscovererContributesNothing) {
  auto manager = make_manager(AgentConfig());
  DiscoveryCache cache;
  auto resources =
      manager->discover({"instance://", "local://", "instances://"}, &cache);
  EXPECT_THAT(resources, ElementsAre("node", "i1", "i2", "i3", "i4"));
  EXPECT_EQ(_local->count(), 1);
  EXPECT_EQ(cache.count("instance://"), 0u);
}

TEST_F(AgentManagerTest, DiscoverPassesParameter) {
  auto manager = make_manager(AgentConfig());
  manager->discover({"local://abc"});
  EXPECT_THAT(_local->params(), ElementsAre("abc"));
}

TEST_F(AgentManagerTest, DiscoveryCacheHitsSkipDiscoverer) {
  auto manager = make_manager(AgentConfig());
  DiscoveryCache cache;
  manager->discover({"local://"}, &cache);
  auto again = manager->discover({"local://"}, &cache);
  EXPECT_THAT(again, ElementsAre("node"));
  EXPECT_EQ(_local->count(), 1);
}

TEST_F(AgentManagerTest, TimedOutDiscoveryCachedAsEmpty) {
  AgentConfig config;
  config.poll_call_timeout = 1;
  auto manager = make_manager(config);
  _local->set_delay(1500ms);

  DiscoveryCache cache;
  auto resources = manager->discover({"local://", "instances://"}, &cache);
  EXPECT_THAT(resources, ElementsAre("i1", "i2", "i3", "i4"));
  ASSERT_EQ(cache.count("local://"), 1u);
  EXPECT_TRUE(cache.at("local://").empty());

  // 同一周期命中缓存
  manager->discover({"local://"}, &cache);
  EXPECT_EQ(_local->count(), 1);

  // 新周期里上一次调用仍在运行，不再启动新的调用
  DiscoveryCache next;
  EXPECT_TRUE(manager->discover({"local://"}, &next).empty());
  EXPECT_EQ(_local->count(), 1);

  ASSERT_EQ(manager->deadline_runner().wait_idle(3000ms), 0u);
  _local->set_delay(0ms);
  DiscoveryCache later;
  EXPECT_THAT(manager->discover({"local://"}, &later), ElementsAre("node"));
  EXPECT_EQ(_local->count(), 2);
}

TEST_F(AgentManagerTest, StopWaitsForPendingCalls) {
  AgentConfig config;
  config.poll_call_timeout = 1;
  auto manager = make_manager(config);
  _local->set_delay(1500ms);

  manager->discover({"local://"});
  EXPECT_EQ(manager->deadline_runner().in_flight(), 1u);
  manager->stop();
  EXPECT_EQ(manager->deadline_runner().in_flight(), 0u);
}

TEST_F(AgentManagerTest, PollingTasksGroupedByInterval) {
  auto manager = make_manager(AgentConfig());
  auto tasks = manager->setup_polling_tasks({
      fakes::make_pipeline("fast", 60, {"r1"}, {}, _publisher, {"cpu.*"}),
      fakes::make_pipeline("slow", 600, {"r1"}, {}, _publisher, {"!cpu.*"}),
      fakes::make_pipeline("fast2", 60, {"r1"}, {}, _publisher, {"disk.*"}),
  });

  ASSERT_EQ(tasks.size(), 2u);
  EXPECT_THAT(tasks.at(60)->sources(), ElementsAre("fast", "fast2"));
  EXPECT_THAT(names_of(tasks.at(60)->pollsters("fast")), ElementsAre("cpu.util"));
  EXPECT_THAT(names_of(tasks.at(600)->pollsters("slow")), ElementsAre("disk.read"));
}

TEST_F(AgentManagerTest, ScheduleWithoutCoordinationUsesJitterOnly) {
  AgentConfig config;
  config.shuffle_time_before_polling_task = 7;
  config.heartbeat = 3;
  fakes::ManualTimerGroup* timers = nullptr;
  auto manager = make_manager(config, nullptr, &timers);

  manager->start({fakes::make_pipeline("src1", 60, {"r1"}, {}, _publisher)});

  EXPECT_EQ(manager->delay_polling_time(), 7);
  ASSERT_EQ(timers->timers.size(), 2u);
  EXPECT_EQ(timers->timers[0].interval, std::chrono::seconds(60));
  EXPECT_EQ(timers->timers[0].initial_delay, std::chrono::seconds(7));
  // 心跳定时器
  EXPECT_EQ(timers->timers[1].interval, std::chrono::seconds(3));
}

TEST_F(AgentManagerTest, ScheduleWithCoordinationWaitsOneInterval) {
  AgentConfig config;
  config.shuffle_time_before_polling_task = 5;
  fakes::ManualTimerGroup* timers = nullptr;
  auto backend = std::make_shared<fakes::InMemoryBackend>();
  auto manager = make_manager(config, backend, &timers);

  manager->start({fakes::make_pipeline("src1", 60, {"r1"}, {}, _publisher),
                  fakes::make_pipeline("src2", 300, {"r1"}, {}, _publisher)});

  ASSERT_EQ(timers->timers.size(), 3u);
  EXPECT_EQ(timers->timers[0].initial_delay, std::chrono::seconds(65));
  EXPECT_EQ(timers->timers[1].initial_delay, std::chrono::seconds(305));
}

TEST_F(AgentManagerTest, TimerCallbackPollsAndPublishes) {
  fakes::ManualTimerGroup* timers = nullptr;
  auto manager = make_manager(AgentConfig(), nullptr, &timers);
  manager->start({fakes::make_pipeline("src1", 60, {"r1", "r2"}, {}, _publisher,
                                       {"cpu.*"})});

  timers->fire(0);
  ASSERT_EQ(_cpu->calls().size(), 1u);
  EXPECT_THAT(_cpu->calls()[0], ElementsAre("r1", "r2"));
  EXPECT_EQ(_publisher->records().size(), 1u);
  EXPECT_TRUE(_disk->calls().empty());
}

TEST_F(AgentManagerTest, HeartbeatTimerReachesBackend) {
  fakes::ManualTimerGroup* timers = nullptr;
  auto backend = std::make_shared<fakes::InMemoryBackend>();
  auto manager = make_manager(AgentConfig(), backend, &timers);
  manager->start({});

  ASSERT_EQ(timers->timers.size(), 1u);
  timers->fire(0);
  EXPECT_EQ(backend->heartbeats, 1);
}

TEST_F(AgentManagerTest, JoinsDiscoveryAndStaticGroups) {
  auto backend = std::make_shared<fakes::InMemoryBackend>();
  auto manager = make_manager(AgentConfig(), backend);
  std::vector<Resource> statics{"r2", "r1"};
  manager->start({fakes::make_pipeline("src1", 60, statics, {}, _publisher)});

  EXPECT_THAT(manager->partition_coordinator().joined_groups(),
              UnorderedElementsAre("compute-instances",
                                   "compute-" + hash_of_set(statics)));
  EXPECT_EQ(backend->members("compute-instances"),
            std::set<std::string>{"agent-a"});
}

TEST_F(AgentManagerTest, ReloadLeavesStaleGroupsAndReschedules) {
  fakes::ManualTimerGroup* timers = nullptr;
  auto backend = std::make_shared<fakes::InMemoryBackend>();
  auto manager = make_manager(AgentConfig(), backend, &timers);
  manager->start({fakes::make_pipeline("src1", 60, {"r1"}, {}, _publisher)});
  std::string old_group = "compute-" + hash_of_set({"r1"});
  EXPECT_EQ(backend->members(old_group), std::set<std::string>{"agent-a"});

  manager->reload({fakes::make_pipeline("src1", 120, {"r9"}, {}, _publisher)});

  EXPECT_EQ(timers->stops, 1);
  ASSERT_EQ(timers->timers.size(), 2u);
  EXPECT_EQ(timers->timers[0].interval, std::chrono::seconds(120));
  EXPECT_TRUE(backend->members(old_group).empty());
  EXPECT_EQ(backend->members("compute-" + hash_of_set({"r9"})),
            std::set<std::string>{"agent-a"});
}

TEST_F(AgentManagerTest, StopLeavesGroups) {
  auto backend = std::make_shared<fakes::InMemoryBackend>();
  auto manager = make_manager(AgentConfig(), backend);
  manager->start({});
  ASSERT_FALSE(backend->members("compute-instances").empty());

  manager->stop();
  EXPECT_TRUE(backend->members("compute-instances").empty());
  EXPECT_EQ(backend->stops, 1);
  EXPECT_FALSE(manager->partition_coordinator().is_started());
}

TEST_F(AgentManagerTest, TwoAgentsSplitDiscoveredResources) {
  auto cluster = std::make_shared<fakes::InMemoryCluster>();
  auto backend_a = std::make_shared<fakes::InMemoryBackend>(cluster);
  auto backend_b = std::make_shared<fakes::InMemoryBackend>(cluster);
  AgentConfig config_a, config_b;
  config_a.agent_id = "agent-a";
  config_b.agent_id = "agent-b";
  auto manager_a = make_manager(config_a, backend_a);
  auto manager_b = make_manager(config_b, backend_b);
  manager_a->start({});
  manager_b->start({});

  auto mine_a = manager_a->discover({"instances://"});
  auto mine_b = manager_b->discover({"instances://"});
  std::multiset<Resource> merged(mine_a.begin(), mine_a.end());
  merged.insert(mine_b.begin(), mine_b.end());
  EXPECT_EQ(merged, (std::multiset<Resource>{"i1", "i2", "i3", "i4"}));
}

TEST_F(AgentManagerTest, TwoAgentsSplitStaticResources) {
  auto cluster = std::make_shared<fakes::InMemoryCluster>();
  auto backend_a = std::make_shared<fakes::InMemoryBackend>(cluster);
  auto backend_b = std::make_shared<fakes::InMemoryBackend>(cluster);
  AgentConfig config_a, config_b;
  config_a.agent_id = "agent-a";
  config_b.agent_id = "agent-b";
  auto manager_a = make_manager(config_a, backend_a);
  auto manager_b = make_manager(config_b, backend_b);

  std::vector<Resource> all{"r1", "r2", "r3", "r4"};
  auto pipeline = fakes::make_pipeline("src1", 60, all, {}, _publisher);
  manager_a->start({pipeline});
  manager_b->start({pipeline});

  auto task_a = manager_a->setup_polling_tasks({pipeline});
  auto task_b = manager_b->setup_polling_tasks({pipeline});
  DiscoveryCache cache_a, cache_b;
  auto mine_a = task_a.at(60)->resource_set("src1", "cpu.util")->get(&cache_a);
  auto mine_b = task_b.at(60)->resource_set("src1", "cpu.util")->get(&cache_b);

  std::multiset<Resource> merged(mine_a.begin(), mine_a.end());
  merged.insert(mine_b.begin(), mine_b.end());
  EXPECT_EQ(merged, std::multiset<Resource>(all.begin(), all.end()));
}

}  // namespace
