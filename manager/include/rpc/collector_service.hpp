#pragma once

#include <grpcpp/server_context.h>
#include <grpcpp/support/status.h>

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>

#include "poll_agent.grpc.pb.h"
#include "poll_agent.pb.h"

namespace pollagent {

struct BatchData {
  pollagent::proto::SampleBatch batch;
  std::chrono::system_clock::time_point timestamp;
};

// (agent_id, source) -> 最近一批采样
using BatchKey = std::pair<std::string, std::string>;

using batch_received_callback_t =
    std::function<void(const pollagent::proto::SampleBatch&)>;

// gRPC 采样接收服务 - 接收代理推送的采样批次
class SampleCollectorServiceImpl : public pollagent::proto::SampleCollector::Service {
 public:
  SampleCollectorServiceImpl() = default;
  virtual ~SampleCollectorServiceImpl() = default;

  ::grpc::Status PublishSamples(::grpc::ServerContext* context,
                                const ::pollagent::proto::SampleBatch* request,
                                ::google::protobuf::Empty* response) override;

  void set_batch_received_callback(batch_received_callback_t callback) {
    _callback = std::move(callback);
  }

  std::map<BatchKey, BatchData> get_all_batches();

  bool get_batch(const std::string& agent_id, const std::string& source,
                 BatchData* data);

 private:
  std::mutex _mtx;
  std::map<BatchKey, BatchData> _batches;
  batch_received_callback_t _callback;
};

}  // namespace pollagent
