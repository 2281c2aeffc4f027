#pragma once

#include <string>
#include <vector>

namespace pollagent {

/// 分区组成员管理后端接口，所有调用失败时返回 false
class CoordinationBackend {
 public:
  CoordinationBackend() {}
  virtual ~CoordinationBackend() {}

  virtual bool start(const std::string& member_id) = 0;
  virtual void stop() = 0;

  virtual bool join_group(const std::string& group_id,
                          const std::string& member_id) = 0;
  virtual bool leave_group(const std::string& group_id,
                           const std::string& member_id) = 0;
  virtual bool get_members(const std::string& group_id,
                           std::vector<std::string>* members) = 0;
  virtual bool heartbeat(const std::string& member_id) = 0;
};

}  // namespace pollagent
