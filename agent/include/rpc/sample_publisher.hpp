#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <string>
#include <vector>

#include "poll_agent.grpc.pb.h"
#include "poll_agent.pb.h"
#include "publish/publisher.hpp"

namespace pollagent {

/**
 * 采样推送器
 *
 * 把一个 source 在本周期的采样打包成 SampleBatch，
 * 通过 gRPC 推送给管理者服务器（grpc://host:port）。
 */
class SamplePublisher : public Publisher {
 public:
  explicit SamplePublisher(const std::string& manager_address,
                           int deadline_seconds = 5);

  bool publish(const PollContext& context, const std::string& source,
               const std::vector<Sample>& samples) override;

  // 获取管理者地址
  const std::string& get_manager_address() const { return _manager_address; }

 private:
  std::string _manager_address;
  int _deadline_seconds;
  std::unique_ptr<pollagent::proto::SampleCollector::Stub> _stub;
};

}  // namespace pollagent
