#pragma once

#include <string>
#include <vector>

#include "polling/resource.hpp"

namespace pollagent {

// 一次采样调用的结果
struct PollStatus {
  enum class Kind { kOk, kPermanent, kTransient };

  Kind kind{Kind::kOk};
  Resource resource;  // kPermanent 时为失效的资源
  std::string message;

  bool ok() const { return kind == Kind::kOk; }

  static PollStatus Ok() { return PollStatus{}; }
  static PollStatus Permanent(Resource resource, std::string message) {
    return PollStatus{Kind::kPermanent, std::move(resource), std::move(message)};
  }
  static PollStatus Transient(std::string message) {
    return PollStatus{Kind::kTransient, Resource{}, std::move(message)};
  }
};

/// 采样插件接口
class Pollster {
 public:
  Pollster() {}
  virtual ~Pollster() {}

  // 未配置资源时使用的 discovery url，空串表示没有
  virtual std::string default_discovery() const { return ""; }

  // 对 resources 采样，结果追加到 samples
  virtual PollStatus get_samples(const PollContext& context, PollCache* cache,
                                 const std::vector<Resource>& resources,
                                 std::vector<Sample>* samples) = 0;
};

}  // namespace pollagent
