#include "coordination/partition_coordinator.hpp"

#include <algorithm>

#include "coordination/hash_ring.hpp"
#include "util/logging.hpp"

namespace pollagent {

PartitionCoordinator::PartitionCoordinator(
    std::shared_ptr<CoordinationBackend> backend, std::string member_id)
    : _backend(std::move(backend)), _member_id(std::move(member_id)) {}

PartitionCoordinator::~PartitionCoordinator() { stop(); }

void PartitionCoordinator::start() {
  if (!_backend) {
    return;
  }
  std::lock_guard<std::mutex> lock(_mtx);
  start_locked();
}

bool PartitionCoordinator::start_locked() {
  if (_started) {
    return true;
  }
  if (!_backend->start(_member_id)) {
    agent_logger().error("Error connecting to coordination backend as {}",
                         _member_id);
    return false;
  }
  _started = true;
  agent_logger().info("Coordination backend started, member id {}",
                      _member_id);
  return true;
}

void PartitionCoordinator::stop() {
  if (!_backend) {
    return;
  }
  std::lock_guard<std::mutex> lock(_mtx);
  if (!_started) {
    return;
  }
  for (const auto& group : _groups) {
    if (!_backend->leave_group(group, _member_id)) {
      agent_logger().warn("Failed to leave group {}", group);
    }
  }
  _groups.clear();
  _backend->stop();
  _started = false;
}

bool PartitionCoordinator::is_started() const {
  std::lock_guard<std::mutex> lock(_mtx);
  return _started;
}

void PartitionCoordinator::heartbeat() {
  if (!_backend) {
    return;
  }
  std::lock_guard<std::mutex> lock(_mtx);
  if (!_started && !start_locked()) {
    return;
  }
  if (!_backend->heartbeat(_member_id)) {
    agent_logger().error("Error sending a heartbeat to coordination backend");
  }
}

void PartitionCoordinator::join_group(const std::string& group_id) {
  if (!_backend || group_id.empty()) {
    return;
  }
  std::lock_guard<std::mutex> lock(_mtx);
  join_group_locked(group_id);
}

bool PartitionCoordinator::join_group_locked(const std::string& group_id) {
  if (!_started) {
    return false;
  }
  agent_logger().info("Joining partitioning group {}", group_id);
  if (!_backend->join_group(group_id, _member_id)) {
    agent_logger().error("Error joining partitioning group {}", group_id);
    return false;
  }
  _groups.insert(group_id);
  return true;
}

void PartitionCoordinator::leave_group(const std::string& group_id) {
  if (!_backend || group_id.empty()) {
    return;
  }
  std::lock_guard<std::mutex> lock(_mtx);
  if (_groups.erase(group_id) == 0 || !_started) {
    return;
  }
  if (!_backend->leave_group(group_id, _member_id)) {
    agent_logger().warn("Failed to leave group {}", group_id);
  }
}

bool PartitionCoordinator::fetch_members_locked(
    const std::string& group_id, std::vector<std::string>* members) {
  members->clear();
  if (!_backend->get_members(group_id, members)) {
    agent_logger().error(
        "Error getting group membership info from coordination backend");
    return false;
  }
  return true;
}

std::vector<Resource> PartitionCoordinator::extract_my_subset(
    const std::string& group_id, const std::vector<Resource>& items) {
  if (group_id.empty() || !_backend) {
    return items;
  }

  std::lock_guard<std::mutex> lock(_mtx);
  if (_groups.count(group_id) == 0) {
    join_group_locked(group_id);
  }

  std::vector<std::string> members;
  if (!fetch_members_locked(group_id, &members)) {
    return {};
  }
  auto is_member = [this](const std::vector<std::string>& m) {
    return std::find(m.begin(), m.end(), _member_id) != m.end();
  };
  if (!is_member(members)) {
    agent_logger().warn(
        "Cannot extract tasks because agent failed to join group {} "
        "properly. Rejoining group.",
        group_id);
    join_group_locked(group_id);
    if (!fetch_members_locked(group_id, &members)) {
      return {};
    }
    if (!is_member(members)) {
      agent_logger().error("Member {} is still not in group {}, skipping",
                           _member_id, group_id);
      return {};
    }
  }

  HashRing ring(members);
  std::vector<Resource> mine;
  for (const auto& item : items) {
    if (ring.get_node(item) == _member_id) {
      mine.push_back(item);
    }
  }
  agent_logger().debug("Group {}: {} member(s), {} of {} item(s) are mine",
                       group_id, members.size(), mine.size(), items.size());
  return mine;
}

std::set<std::string> PartitionCoordinator::joined_groups() const {
  std::lock_guard<std::mutex> lock(_mtx);
  return _groups;
}

}  // namespace pollagent
