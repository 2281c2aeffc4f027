#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "polling/resource.hpp"
#include "publish/publisher.hpp"

namespace pollagent {

// 流水线配置错误
class PipelineException : public std::runtime_error {
 public:
  explicit PipelineException(const std::string& msg)
      : std::runtime_error(msg) {}
};

struct Source {
  std::string name;
  int interval{0};                   // 秒
  std::vector<std::string> meters;   // 通配符，"!" 前缀表示排除
  std::vector<Resource> resources;   // 静态资源
  std::vector<std::string> discovery;
  std::vector<std::string> sinks;

  // 排除优先；只有排除项时默认接受
  bool support_meter(const std::string& meter_name) const;
};

struct Sink {
  std::string name;
  std::vector<std::string> publishers;  // 发布器 url
};

/**
 * 一个 source 与一个 sink 的组合
 *
 * 加载后只读，以 shared_ptr<const Pipeline> 在任务之间共享。
 */
class Pipeline {
 public:
  Pipeline(Source source, Sink sink,
           std::vector<std::shared_ptr<Publisher>> publishers);

  const Source& source() const { return _source; }
  const Sink& sink() const { return _sink; }

  std::string name() const { return _source.name + ":" + _sink.name; }
  int interval() const { return _source.interval; }
  const std::vector<Resource>& resources() const { return _source.resources; }
  const std::vector<std::string>& discovery() const {
    return _source.discovery;
  }
  bool support_meter(const std::string& meter_name) const {
    return _source.support_meter(meter_name);
  }

  // 过滤出本 source 接受的采样，交给每个发布器
  void publish_samples(const PollContext& context,
                       const std::vector<Sample>& samples) const;

 private:
  Source _source;
  Sink _sink;
  std::vector<std::shared_ptr<Publisher>> _publishers;
};

using PipelinePtr = std::shared_ptr<const Pipeline>;

}  // namespace pollagent
