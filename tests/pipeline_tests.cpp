#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>

#include "config/pipeline_loader.hpp"
#include "fakes.hpp"

using namespace pollagent;
using ::testing::ElementsAre;

namespace {

constexpr char kPipelineYaml[] = R"(
sources:
  - name: host_source
    interval: 60
    meters: ["cpu.*", "memory.usage"]
    discovery: ["local_node"]
    sinks: [log_sink, rpc_sink]
  - name: net_source
    interval: 300
    meters: ["!network.outgoing.*"]
    resources: [eth0, eth1]
    sinks: [log_sink]
sinks:
  - name: log_sink
    publishers: ["log://"]
  - name: rpc_sink
    publishers: ["test://a", "test://b"]
)";

class PipelineLoaderTest : public ::testing::Test {
 protected:
  PublisherFactory factory() {
    return [this](const std::string& url) -> std::shared_ptr<Publisher> {
      _urls.push_back(url);
      if (url.rfind("log://", 0) == 0 || url.rfind("test://", 0) == 0) {
        return std::make_shared<fakes::RecordingPublisher>();
      }
      return nullptr;
    };
  }

  std::vector<std::string> _urls;
};

TEST_F(PipelineLoaderTest, OnePipelinePerSourceAndSink) {
  auto pipelines = parse_pipelines(std::string(kPipelineYaml), factory());
  ASSERT_EQ(pipelines.size(), 3u);
  EXPECT_EQ(pipelines[0]->name(), "host_source:log_sink");
  EXPECT_EQ(pipelines[1]->name(), "host_source:rpc_sink");
  EXPECT_EQ(pipelines[2]->name(), "net_source:log_sink");

  EXPECT_EQ(pipelines[0]->interval(), 60);
  EXPECT_THAT(pipelines[0]->discovery(), ElementsAre("local_node"));
  EXPECT_TRUE(pipelines[0]->resources().empty());
  EXPECT_THAT(pipelines[2]->resources(), ElementsAre("eth0", "eth1"));
  EXPECT_THAT(pipelines[1]->sink().publishers, ElementsAre("test://a", "test://b"));
  EXPECT_THAT(_urls, ElementsAre("log://", "test://a", "test://b", "log://"));
}

TEST_F(PipelineLoaderTest, LoadFromFile) {
  auto path = std::filesystem::path(::testing::TempDir()) / "pipeline_test.yaml";
  {
    std::ofstream out(path);
    out << kPipelineYaml;
  }
  EXPECT_EQ(load_pipelines(path.string(), factory()).size(), 3u);
  std::filesystem::remove(path);
}

TEST_F(PipelineLoaderTest, MissingFileThrows) {
  EXPECT_THROW(load_pipelines("/nonexistent/pipeline.yaml", factory()),
               PipelineException);
}

TEST_F(PipelineLoaderTest, InvalidDefinitionsThrow) {
  const char* invalid[] = {
      "sources: []\n",
      "sinks: []\n",
      "sources: {}\nsinks: []\n",
      "sources:\n  - interval: 60\n    sinks: [s]\nsinks:\n  - name: s\n",
      "sources:\n  - name: a\n    sinks: [s]\nsinks:\n  - name: s\n",
      "sources:\n  - name: a\n    interval: 0\n    sinks: [s]\nsinks:\n  - name: s\n",
      "sources:\n  - name: a\n    interval: 60\nsinks:\n  - name: s\n",
      "sources:\n  - name: a\n    interval: 60\n    sinks: [x]\nsinks:\n  - name: s\n",
      "sources:\n  - name: a\n    interval: 60\n    sinks: [s]\n"
      "  - name: a\n    interval: 60\n    sinks: [s]\nsinks:\n  - name: s\n",
      "sources:\n  - name: a\n    interval: 60\n    sinks: [s]\n"
      "sinks:\n  - name: s\n  - name: s\n",
      "sources:\n  - name: a\n    interval: 60\n    sinks: [s]\n"
      "sinks:\n  - name: s\n    publishers: [\"kafka://x\"]\n",
      "sources:\n  - name: a\n    interval: 60\n    meters: cpu\n    sinks: [s]\n"
      "sinks:\n  - name: s\n",
      "sources:\n  - name: a\n    interval: sixty\n    sinks: [s]\nsinks:\n  - name: s\n",
      "sources: [\n",
  };
  for (const char* text : invalid) {
    EXPECT_THROW(parse_pipelines(std::string(text), factory()), PipelineException)
        << text;
  }
}

TEST(SourceTest, MeterMatching) {
  Source source;
  source.meters = {"cpu.*", "!cpu.load"};
  EXPECT_TRUE(source.support_meter("cpu.util"));
  EXPECT_FALSE(source.support_meter("cpu.load"));
  EXPECT_FALSE(source.support_meter("memory.usage"));

  source.meters = {"!disk.*"};
  EXPECT_TRUE(source.support_meter("cpu.load"));
  EXPECT_FALSE(source.support_meter("disk.read.bytes"));

  source.meters = {};
  EXPECT_TRUE(source.support_meter("anything"));
}

TEST(PipelineTest, PublishesOnlySupportedSamples) {
  auto publisher = std::make_shared<fakes::RecordingPublisher>();
  auto pipeline =
      fakes::make_pipeline("src1", 60, {}, {}, publisher, {"cpu.*"});

  std::vector<Sample> samples(2);
  samples[0].set_name("cpu.load");
  samples[1].set_name("memory.usage");
  pipeline->publish_samples(PollContext{"agent-a", "host"}, samples);

  auto records = publisher->records();
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].source, "src1");
  ASSERT_EQ(records[0].samples.size(), 1u);
  EXPECT_EQ(records[0].samples[0].name(), "cpu.load");

  std::vector<Sample> unsupported(1);
  unsupported[0].set_name("disk.read.bytes");
  pipeline->publish_samples(PollContext{"agent-a", "host"}, unsupported);
  EXPECT_EQ(publisher->records().size(), 1u);
}

TEST(PipelineTest, PublisherFailureDoesNotStopOthers) {
  class ThrowingPublisher : public Publisher {
   public:
    bool publish(const PollContext&, const std::string&,
                 const std::vector<Sample>&) override {
      throw std::runtime_error("unreachable");
    }
  };
  auto failing = std::make_shared<fakes::RecordingPublisher>();
  failing->result = false;
  auto recording = std::make_shared<fakes::RecordingPublisher>();

  Source source;
  source.name = "src1";
  source.interval = 60;
  source.sinks = {"sink"};
  Pipeline pipeline(source, Sink{"sink", {}},
                    {std::make_shared<ThrowingPublisher>(), failing, recording});

  std::vector<Sample> samples(1);
  samples[0].set_name("cpu.load");
  EXPECT_NO_THROW(pipeline.publish_samples(PollContext{"agent-a", "host"}, samples));
  EXPECT_EQ(failing->records().size(), 1u);
  EXPECT_EQ(recording->records().size(), 1u);
}

TEST(PublisherTest, MakePublisherByScheme) {
  EXPECT_NE(make_publisher("log://"), nullptr);
  EXPECT_NE(make_publisher("grpc://127.0.0.1:50051"), nullptr);
  EXPECT_EQ(make_publisher("grpc://"), nullptr);
  EXPECT_EQ(make_publisher("kafka://broker"), nullptr);
}

}  // namespace
