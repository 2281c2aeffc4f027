#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "polling/resource.hpp"

namespace pollagent {

/// 采样发布接口
class Publisher {
 public:
  Publisher() {}
  virtual ~Publisher() {}

  // 发布 source 在本周期的采样，失败返回 false
  virtual bool publish(const PollContext& context, const std::string& source,
                       const std::vector<Sample>& samples) = 0;
};

// 把采样逐条写入代理日志（log://）
class LogPublisher : public Publisher {
 public:
  LogPublisher() {}
  bool publish(const PollContext& context, const std::string& source,
               const std::vector<Sample>& samples) override;
};

using PublisherFactory =
    std::function<std::shared_ptr<Publisher>(const std::string& url)>;

// 按 url 创建发布器：log:// 或 grpc://host:port；未知 scheme 返回 nullptr
std::shared_ptr<Publisher> make_publisher(const std::string& url);

}  // namespace pollagent
