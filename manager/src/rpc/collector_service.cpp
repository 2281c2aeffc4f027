#include "rpc/collector_service.hpp"

#include "manager_logging.hpp"

namespace pollagent {

::grpc::Status SampleCollectorServiceImpl::PublishSamples(
    ::grpc::ServerContext* context,
    const ::pollagent::proto::SampleBatch* request,
    ::google::protobuf::Empty* response) {
  if (!request) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "Empty request");
  }
  if (request->agent_id().empty()) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "Missing agent id");
  }

  {
    std::lock_guard<std::mutex> lock(_mtx);
    _batches[{request->agent_id(), request->source()}] = {
        *request, std::chrono::system_clock::now()};
  }

  manager_logger().debug("Received {} samples from {} ({})",
                         request->samples_size(), request->agent_id(),
                         request->source());

  if (_callback) {
    _callback(*request);
  }
  return grpc::Status::OK;
}

std::map<BatchKey, BatchData> SampleCollectorServiceImpl::get_all_batches() {
  std::lock_guard<std::mutex> lock(_mtx);
  return _batches;
}

bool SampleCollectorServiceImpl::get_batch(const std::string& agent_id,
                                           const std::string& source,
                                           BatchData* data) {
  std::lock_guard<std::mutex> lock(_mtx);
  auto it = _batches.find({agent_id, source});
  if (it == _batches.end()) {
    return false;
  }
  *data = it->second;
  return true;
}

}  // namespace pollagent
