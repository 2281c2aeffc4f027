#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <string>
#include <vector>

#include "coordination/coordination_backend.hpp"
#include "poll_agent.grpc.pb.h"

namespace pollagent {

// 通过 gRPC 访问管理者上的 Coordination 服务
class GrpcCoordinationBackend : public CoordinationBackend {
 public:
  explicit GrpcCoordinationBackend(const std::string& address,
                                   int deadline_seconds = 5);

  // 解析 grpc://host:port，非法时返回 nullptr
  static std::shared_ptr<GrpcCoordinationBackend> from_url(
      const std::string& backend_url);

  bool start(const std::string& member_id) override;
  void stop() override;

  bool join_group(const std::string& group_id,
                  const std::string& member_id) override;
  bool leave_group(const std::string& group_id,
                   const std::string& member_id) override;
  bool get_members(const std::string& group_id,
                   std::vector<std::string>* members) override;
  bool heartbeat(const std::string& member_id) override;

  const std::string& address() const { return _address; }

 private:
  void set_deadline(grpc::ClientContext* context) const;
  bool check(const grpc::Status& status, const char* what) const;

  std::string _address;
  int _deadline_seconds;
  std::shared_ptr<grpc::Channel> _channel;
  std::unique_ptr<pollagent::proto::Coordination::Stub> _stub;
};

}  // namespace pollagent
