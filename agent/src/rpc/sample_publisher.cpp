#include "rpc/sample_publisher.hpp"

#include <chrono>

#include "util/logging.hpp"

namespace pollagent {

SamplePublisher::SamplePublisher(const std::string& manager_address,
                                 int deadline_seconds)
    : _manager_address(manager_address), _deadline_seconds(deadline_seconds) {
  // 创建 gRPC channel 和 stub
  auto channel = grpc::CreateChannel(manager_address,
                                     grpc::InsecureChannelCredentials());
  _stub = pollagent::proto::SampleCollector::NewStub(channel);
}

bool SamplePublisher::publish(const PollContext& context,
                              const std::string& source,
                              const std::vector<Sample>& samples) {
  pollagent::proto::SampleBatch batch;
  batch.set_agent_id(context.agent_id);
  batch.set_source(source);
  for (const auto& sample : samples) {
    *batch.add_samples() = sample;
  }

  grpc::ClientContext client_context;
  client_context.set_deadline(std::chrono::system_clock::now() +
                              std::chrono::seconds(_deadline_seconds));
  google::protobuf::Empty response;

  grpc::Status status =
      _stub->PublishSamples(&client_context, batch, &response);
  if (status.ok()) {
    agent_logger().debug("Pushed {} sample(s) of {} to {}", samples.size(),
                         source, _manager_address);
    return true;
  }
  agent_logger().error("Push to {} failed: {}", _manager_address,
                       status.error_message());
  return false;
}

}  // namespace pollagent
