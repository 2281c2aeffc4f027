#include "config/pipeline_loader.hpp"

#include <format>
#include <map>
#include <set>

#include "util/logging.hpp"

namespace pollagent {

namespace {

std::vector<std::string> read_string_list(const YAML::Node& node,
                                          const std::string& key,
                                          const std::string& owner) {
  std::vector<std::string> values;
  const YAML::Node list = node[key];
  if (!list || list.IsNull()) {
    return values;
  }
  if (!list.IsSequence()) {
    throw PipelineException(
        std::format("{}: '{}' must be a list", owner, key));
  }
  for (const auto& item : list) {
    values.push_back(item.as<std::string>());
  }
  return values;
}

std::string read_name(const YAML::Node& node, const char* kind) {
  const YAML::Node name = node["name"];
  if (!name || !name.IsScalar() || name.as<std::string>().empty()) {
    throw PipelineException(std::format("{} without a name", kind));
  }
  return name.as<std::string>();
}

Source parse_source(const YAML::Node& node) {
  Source source;
  source.name = read_name(node, "source");
  std::string owner = "source " + source.name;

  const YAML::Node interval = node["interval"];
  if (!interval) {
    throw PipelineException(owner + ": missing interval");
  }
  source.interval = interval.as<int>();
  if (source.interval <= 0) {
    throw PipelineException(
        std::format("{}: interval must be positive, got {}", owner,
                    source.interval));
  }

  source.meters = read_string_list(node, "meters", owner);
  source.resources = read_string_list(node, "resources", owner);
  source.discovery = read_string_list(node, "discovery", owner);
  source.sinks = read_string_list(node, "sinks", owner);
  if (source.sinks.empty()) {
    throw PipelineException(owner + ": no sinks");
  }
  return source;
}

Sink parse_sink(const YAML::Node& node) {
  Sink sink;
  sink.name = read_name(node, "sink");
  sink.publishers = read_string_list(node, "publishers", "sink " + sink.name);
  return sink;
}

}  // namespace

std::vector<PipelinePtr> parse_pipelines(const YAML::Node& root,
                                         const PublisherFactory& factory) {
  if (!root.IsMap() || !root["sources"] || !root["sinks"]) {
    throw PipelineException("pipeline definition needs 'sources' and 'sinks'");
  }
  if (!root["sources"].IsSequence() || !root["sinks"].IsSequence()) {
    throw PipelineException("'sources' and 'sinks' must be lists");
  }

  try {
    std::map<std::string, Sink> sinks;
    for (const auto& node : root["sinks"]) {
      Sink sink = parse_sink(node);
      if (sinks.count(sink.name) > 0) {
        throw PipelineException("duplicated sink name: " + sink.name);
      }
      sinks.emplace(sink.name, std::move(sink));
    }

    std::set<std::string> source_names;
    std::vector<PipelinePtr> pipelines;
    for (const auto& node : root["sources"]) {
      Source source = parse_source(node);
      if (!source_names.insert(source.name).second) {
        throw PipelineException("duplicated source name: " + source.name);
      }
      for (const auto& sink_name : source.sinks) {
        auto it = sinks.find(sink_name);
        if (it == sinks.end()) {
          throw PipelineException(std::format(
              "source {} refers to undefined sink {}", source.name, sink_name));
        }
        std::vector<std::shared_ptr<Publisher>> publishers;
        for (const auto& url : it->second.publishers) {
          auto publisher = factory(url);
          if (!publisher) {
            throw PipelineException(std::format(
                "sink {}: unsupported publisher {}", sink_name, url));
          }
          publishers.push_back(std::move(publisher));
        }
        pipelines.push_back(
            std::make_shared<const Pipeline>(source, it->second, publishers));
      }
    }
    return pipelines;
  } catch (const YAML::Exception& e) {
    throw PipelineException(std::string("invalid pipeline definition: ") +
                            e.what());
  }
}

std::vector<PipelinePtr> parse_pipelines(const std::string& text,
                                         const PublisherFactory& factory) {
  YAML::Node root;
  try {
    root = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw PipelineException(std::string("invalid pipeline definition: ") +
                            e.what());
  }
  return parse_pipelines(root, factory);
}

std::vector<PipelinePtr> load_pipelines(const std::string& path,
                                        const PublisherFactory& factory) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw PipelineException(
        std::format("failed to load pipeline file {}: {}", path, e.what()));
  }
  auto pipelines = parse_pipelines(root, factory);
  agent_logger().info("Loaded {} pipeline(s) from {}", pipelines.size(), path);
  return pipelines;
}

}  // namespace pollagent
