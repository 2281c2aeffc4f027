#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "config/agent_config.hpp"
#include "util/logging.hpp"

using namespace pollagent;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace {

bool parse(std::vector<const char*> args, AgentConfig* config, std::string* error) {
  args.insert(args.begin(), "pollagent-agent");
  return parse_agent_args(static_cast<int>(args.size()), args.data(), config, error);
}

TEST(AgentConfigTest, Defaults) {
  AgentConfig config;
  std::string error;
  ASSERT_TRUE(parse({}, &config, &error)) << error;
  EXPECT_EQ(config.pipeline_cfg_file, "pipeline.yaml");
  EXPECT_THAT(config.namespaces, ElementsAre("compute"));
  EXPECT_TRUE(config.pollster_list.empty());
  EXPECT_TRUE(config.backend_url.empty());
  EXPECT_EQ(config.heartbeat, 1);
  EXPECT_EQ(config.shuffle_time_before_polling_task, 0);
  EXPECT_EQ(config.poll_call_timeout, 0);
  EXPECT_EQ(config.agent_id, default_agent_id());
  EXPECT_EQ(config.log_dir, kDefaultAgentLogDir);
}

TEST(AgentConfigTest, ParsesAllOptions) {
  AgentConfig config;
  std::string error;
  ASSERT_TRUE(parse({"--pipeline=/etc/pollagent/pipeline.yaml",
                     "--namespaces=compute,central",
                     "--pollster-list=cpu.*,memory.*",
                     "--group-prefix=site1",
                     "--backend-url=grpc://manager:50051",
                     "--heartbeat=5",
                     "--shuffle-time=10",
                     "--poll-timeout=30",
                     "--refresh-pipeline=60",
                     "--agent-id=agent-7",
                     "--log-dir=/var/log/pollagent"},
                    &config, &error))
      << error;
  EXPECT_EQ(config.pipeline_cfg_file, "/etc/pollagent/pipeline.yaml");
  EXPECT_THAT(config.namespaces, ElementsAre("compute", "central"));
  EXPECT_THAT(config.pollster_list, ElementsAre("cpu.*", "memory.*"));
  EXPECT_EQ(config.group_prefix, "site1");
  EXPECT_EQ(config.backend_url, "grpc://manager:50051");
  EXPECT_EQ(config.heartbeat, 5);
  EXPECT_EQ(config.shuffle_time_before_polling_task, 10);
  EXPECT_EQ(config.poll_call_timeout, 30);
  EXPECT_EQ(config.refresh_pipeline_interval, 60);
  EXPECT_EQ(config.agent_id, "agent-7");
  EXPECT_EQ(config.log_dir, "/var/log/pollagent");
}

TEST(AgentConfigTest, RejectsBadArguments) {
  std::vector<std::vector<const char*>> cases = {
      {"--unknown=1"},
      {"--heartbeat"},
      {"positional"},
      {"--heartbeat=abc"},
      {"--heartbeat=0"},
      {"--shuffle-time=-1"},
      {"--poll-timeout=5s"},
      {"--namespaces=,"},
  };
  for (const auto& args : cases) {
    AgentConfig config;
    std::string error;
    EXPECT_FALSE(parse(args, &config, &error)) << args[0];
    EXPECT_FALSE(error.empty()) << args[0];
  }
}

TEST(AgentConfigTest, HelpPrintsUsage) {
  AgentConfig config;
  std::string error;
  EXPECT_FALSE(parse({"--help"}, &config, &error));
  EXPECT_THAT(error, HasSubstr("--backend-url"));
}

}  // namespace
