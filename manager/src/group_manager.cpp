#include "group_manager.hpp"

#include <algorithm>

#include "manager_logging.hpp"

namespace pollagent {

GroupManager::GroupManager(std::chrono::seconds member_timeout)
    : _member_timeout(member_timeout), _running(false) {}

GroupManager::~GroupManager() {
  stop();
}

void GroupManager::start() {
  if (_running) {
    return;
  }
  _running = true;
  _thread = std::make_unique<std::thread>(&GroupManager::process_for_loop, this);
}

void GroupManager::stop() {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    _running = false;
  }
  _cv.notify_all();
  if (_thread && _thread->joinable()) {
    _thread->join();
  }
}

void GroupManager::process_for_loop() {
  auto period = std::max(_member_timeout / 2, std::chrono::seconds(1));
  std::unique_lock<std::mutex> lock(_mtx);
  while (_running) {
    _cv.wait_for(lock, period, [this] { return !_running; });
    if (!_running) break;
    lock.unlock();
    expire_stale(Clock::now());
    lock.lock();
  }
}

void GroupManager::join(const std::string& group_id,
                        const std::string& member_id) {
  std::lock_guard<std::mutex> lock(_mtx);
  bool added = _groups[group_id].insert(member_id).second;
  _last_seen[member_id] = Clock::now();
  if (added) {
    manager_logger().info("Member {} joined group {}", member_id, group_id);
  }
}

void GroupManager::leave(const std::string& group_id,
                         const std::string& member_id) {
  std::lock_guard<std::mutex> lock(_mtx);
  _last_seen[member_id] = Clock::now();
  auto it = _groups.find(group_id);
  if (it == _groups.end() || it->second.erase(member_id) == 0) {
    return;
  }
  manager_logger().info("Member {} left group {}", member_id, group_id);
  if (it->second.empty()) {
    _groups.erase(it);
  }
}

void GroupManager::heartbeat(const std::string& member_id) {
  std::lock_guard<std::mutex> lock(_mtx);
  _last_seen[member_id] = Clock::now();
}

std::vector<std::string> GroupManager::members(const std::string& group_id) {
  std::lock_guard<std::mutex> lock(_mtx);
  auto it = _groups.find(group_id);
  if (it == _groups.end()) {
    return {};
  }
  return std::vector<std::string>(it->second.begin(), it->second.end());
}

std::vector<std::string> GroupManager::groups() {
  std::lock_guard<std::mutex> lock(_mtx);
  std::vector<std::string> names;
  for (const auto& [group_id, members] : _groups) {
    names.push_back(group_id);
  }
  return names;
}

std::vector<std::string> GroupManager::expire_stale(Clock::time_point now) {
  std::vector<std::string> expired;
  std::lock_guard<std::mutex> lock(_mtx);
  for (auto it = _last_seen.begin(); it != _last_seen.end();) {
    if (now - it->second > _member_timeout) {
      manager_logger().info("Removing stale member: {}", it->first);
      expired.push_back(it->first);
      it = _last_seen.erase(it);
    } else {
      ++it;
    }
  }
  for (const auto& member_id : expired) {
    for (auto group = _groups.begin(); group != _groups.end();) {
      group->second.erase(member_id);
      if (group->second.empty()) {
        group = _groups.erase(group);
      } else {
        ++group;
      }
    }
  }
  return expired;
}

}  // namespace pollagent
