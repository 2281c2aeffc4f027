#pragma once

#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "polling/pipeline.hpp"
#include "publish/publisher.hpp"

namespace pollagent {

/**
 * 流水线定义加载
 *
 * sources:
 *   - name: host_source
 *     interval: 60
 *     meters: ["cpu.*"]
 *     resources: []
 *     discovery: []
 *     sinks: [host_sink]
 * sinks:
 *   - name: host_sink
 *     publishers: ["log://"]
 *
 * 每个 (source, 其引用的 sink) 生成一条流水线。格式错误抛出 PipelineException。
 */
std::vector<PipelinePtr> parse_pipelines(const YAML::Node& root,
                                         const PublisherFactory& factory);
std::vector<PipelinePtr> parse_pipelines(const std::string& text,
                                         const PublisherFactory& factory);
std::vector<PipelinePtr> load_pipelines(const std::string& path,
                                        const PublisherFactory& factory);

}  // namespace pollagent
