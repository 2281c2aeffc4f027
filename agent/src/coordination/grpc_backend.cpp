#include "coordination/grpc_backend.hpp"

#include <chrono>

#include "util/logging.hpp"

namespace pollagent {

namespace {
constexpr char kGrpcScheme[] = "grpc://";
}  // namespace

GrpcCoordinationBackend::GrpcCoordinationBackend(const std::string& address,
                                                 int deadline_seconds)
    : _address(address), _deadline_seconds(deadline_seconds) {}

std::shared_ptr<GrpcCoordinationBackend> GrpcCoordinationBackend::from_url(
    const std::string& backend_url) {
  if (backend_url.rfind(kGrpcScheme, 0) != 0) {
    return nullptr;
  }
  std::string address = backend_url.substr(sizeof(kGrpcScheme) - 1);
  if (address.empty()) {
    return nullptr;
  }
  return std::make_shared<GrpcCoordinationBackend>(address);
}

void GrpcCoordinationBackend::set_deadline(grpc::ClientContext* context) const {
  context->set_deadline(std::chrono::system_clock::now() +
                        std::chrono::seconds(_deadline_seconds));
}

bool GrpcCoordinationBackend::check(const grpc::Status& status,
                                    const char* what) const {
  if (status.ok()) {
    return true;
  }
  agent_logger().error("Coordination {} on {} failed: {}", what, _address,
                       status.error_message());
  return false;
}

bool GrpcCoordinationBackend::start(const std::string& member_id) {
  if (!_stub) {
    _channel = grpc::CreateChannel(_address, grpc::InsecureChannelCredentials());
    _stub = pollagent::proto::Coordination::NewStub(_channel);
  }
  // 用一次心跳确认后端可达
  return heartbeat(member_id);
}

void GrpcCoordinationBackend::stop() {
  _stub.reset();
  _channel.reset();
}

bool GrpcCoordinationBackend::join_group(const std::string& group_id,
                                         const std::string& member_id) {
  if (!_stub) {
    return false;
  }
  pollagent::proto::GroupRequest request;
  request.set_group_id(group_id);
  request.set_member_id(member_id);
  google::protobuf::Empty response;
  grpc::ClientContext context;
  set_deadline(&context);
  return check(_stub->JoinGroup(&context, request, &response), "JoinGroup");
}

bool GrpcCoordinationBackend::leave_group(const std::string& group_id,
                                          const std::string& member_id) {
  if (!_stub) {
    return false;
  }
  pollagent::proto::GroupRequest request;
  request.set_group_id(group_id);
  request.set_member_id(member_id);
  google::protobuf::Empty response;
  grpc::ClientContext context;
  set_deadline(&context);
  return check(_stub->LeaveGroup(&context, request, &response), "LeaveGroup");
}

bool GrpcCoordinationBackend::get_members(const std::string& group_id,
                                          std::vector<std::string>* members) {
  if (!_stub) {
    return false;
  }
  pollagent::proto::GroupRequest request;
  request.set_group_id(group_id);
  pollagent::proto::GroupMembers response;
  grpc::ClientContext context;
  set_deadline(&context);
  if (!check(_stub->GetMembers(&context, request, &response), "GetMembers")) {
    return false;
  }
  members->assign(response.members().begin(), response.members().end());
  return true;
}

bool GrpcCoordinationBackend::heartbeat(const std::string& member_id) {
  if (!_stub) {
    return false;
  }
  pollagent::proto::MemberRequest request;
  request.set_member_id(member_id);
  google::protobuf::Empty response;
  grpc::ClientContext context;
  set_deadline(&context);
  return check(_stub->Heartbeat(&context, request, &response), "Heartbeat");
}

}  // namespace pollagent
