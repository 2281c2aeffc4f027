#include "rpc/coordination_service.hpp"

#include "manager_logging.hpp"

namespace pollagent {

namespace {

::grpc::Status check_group_request(const ::pollagent::proto::GroupRequest* request,
                                   bool need_member) {
  if (!request) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "Empty request");
  }
  if (request->group_id().empty()) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "Missing group id");
  }
  if (need_member && request->member_id().empty()) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "Missing member id");
  }
  return grpc::Status::OK;
}

}  // namespace

::grpc::Status CoordinationServiceImpl::JoinGroup(
    ::grpc::ServerContext* context,
    const ::pollagent::proto::GroupRequest* request,
    ::google::protobuf::Empty* response) {
  auto status = check_group_request(request, true);
  if (!status.ok()) {
    return status;
  }
  _groups->join(request->group_id(), request->member_id());
  return grpc::Status::OK;
}

::grpc::Status CoordinationServiceImpl::LeaveGroup(
    ::grpc::ServerContext* context,
    const ::pollagent::proto::GroupRequest* request,
    ::google::protobuf::Empty* response) {
  auto status = check_group_request(request, true);
  if (!status.ok()) {
    return status;
  }
  _groups->leave(request->group_id(), request->member_id());
  return grpc::Status::OK;
}

::grpc::Status CoordinationServiceImpl::Heartbeat(
    ::grpc::ServerContext* context,
    const ::pollagent::proto::MemberRequest* request,
    ::google::protobuf::Empty* response) {
  if (!request || request->member_id().empty()) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "Missing member id");
  }
  _groups->heartbeat(request->member_id());
  manager_logger().debug("Heartbeat from: {}", request->member_id());
  return grpc::Status::OK;
}

::grpc::Status CoordinationServiceImpl::GetMembers(
    ::grpc::ServerContext* context,
    const ::pollagent::proto::GroupRequest* request,
    ::pollagent::proto::GroupMembers* response) {
  auto status = check_group_request(request, false);
  if (!status.ok()) {
    return status;
  }
  for (const auto& member : _groups->members(request->group_id())) {
    response->add_members(member);
  }
  return grpc::Status::OK;
}

}  // namespace pollagent
