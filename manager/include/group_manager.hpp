#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace pollagent {

// 管理分区组成员（心跳超时的成员会被移出所有组）
class GroupManager {
 public:
  using Clock = std::chrono::steady_clock;

  explicit GroupManager(std::chrono::seconds member_timeout = std::chrono::seconds(30));
  ~GroupManager();

  // 启动后台清理线程
  void start();
  void stop();

  void join(const std::string& group_id, const std::string& member_id);
  void leave(const std::string& group_id, const std::string& member_id);
  void heartbeat(const std::string& member_id);

  // 按 id 排序的成员列表
  std::vector<std::string> members(const std::string& group_id);
  std::vector<std::string> groups();

  // 移出 now 之前 member_timeout 内没有心跳的成员，返回被移出的成员
  std::vector<std::string> expire_stale(Clock::time_point now);

 private:
  void process_for_loop();

  std::chrono::seconds _member_timeout;
  std::mutex _mtx;
  std::map<std::string, std::set<std::string>> _groups;
  std::map<std::string, Clock::time_point> _last_seen;

  std::condition_variable _cv;
  std::atomic<bool> _running;
  std::unique_ptr<std::thread> _thread;
};

}  // namespace pollagent
