#pragma once

#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "coordination/coordination_backend.hpp"
#include "polling/resource.hpp"

namespace pollagent {

/**
 * 分区协调器
 *
 * 多个代理加入同一个分区组后，对同一资源列表各自只取哈希环上
 * 归属自己的那一部分，保证全体代理之间不重不漏。
 * 未配置后端时不做分区。所有方法线程安全。
 */
class PartitionCoordinator {
 public:
  // backend 为空表示未启用协调
  PartitionCoordinator(std::shared_ptr<CoordinationBackend> backend,
                       std::string member_id);
  ~PartitionCoordinator();

  PartitionCoordinator(const PartitionCoordinator&) = delete;
  PartitionCoordinator& operator=(const PartitionCoordinator&) = delete;

  void start();
  // 退出全部已加入的组并断开后端
  void stop();

  bool is_active() const { return _backend != nullptr; }
  bool is_started() const;

  // 断线时先尝试重连
  void heartbeat();

  void join_group(const std::string& group_id);
  void leave_group(const std::string& group_id);

  // 返回 items 中归属本成员的子集；group_id 为空或未启用协调时原样返回
  std::vector<Resource> extract_my_subset(const std::string& group_id,
                                          const std::vector<Resource>& items);

  const std::string& member_id() const { return _member_id; }
  std::set<std::string> joined_groups() const;

 private:
  bool start_locked();
  bool join_group_locked(const std::string& group_id);
  bool fetch_members_locked(const std::string& group_id,
                            std::vector<std::string>* members);

  std::shared_ptr<CoordinationBackend> _backend;
  std::string _member_id;

  mutable std::mutex _mtx;
  bool _started{false};
  std::set<std::string> _groups;
};

}  // namespace pollagent
