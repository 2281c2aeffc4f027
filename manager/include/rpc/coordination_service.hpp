#pragma once

#include <grpcpp/server_context.h>
#include <grpcpp/support/status.h>

#include "group_manager.hpp"
#include "poll_agent.grpc.pb.h"
#include "poll_agent.pb.h"

namespace pollagent {

// gRPC 协调服务 - 代理通过它加入/离开分区组并上报心跳
class CoordinationServiceImpl : public pollagent::proto::Coordination::Service {
 public:
  explicit CoordinationServiceImpl(GroupManager* groups) : _groups(groups) {}
  virtual ~CoordinationServiceImpl() = default;

  ::grpc::Status JoinGroup(::grpc::ServerContext* context,
                           const ::pollagent::proto::GroupRequest* request,
                           ::google::protobuf::Empty* response) override;

  ::grpc::Status LeaveGroup(::grpc::ServerContext* context,
                            const ::pollagent::proto::GroupRequest* request,
                            ::google::protobuf::Empty* response) override;

  ::grpc::Status Heartbeat(::grpc::ServerContext* context,
                           const ::pollagent::proto::MemberRequest* request,
                           ::google::protobuf::Empty* response) override;

  ::grpc::Status GetMembers(::grpc::ServerContext* context,
                            const ::pollagent::proto::GroupRequest* request,
                            ::pollagent::proto::GroupMembers* response) override;

 private:
  GroupManager* _groups;
};

}  // namespace pollagent
