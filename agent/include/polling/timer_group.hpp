#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace pollagent {

/// 周期定时器调度接口
class TimerGroup {
 public:
  TimerGroup() {}
  virtual ~TimerGroup() {}

  // 先等待 initial_delay，之后每隔 interval 调用一次 callback
  virtual void add_timer(std::chrono::seconds interval,
                         std::chrono::seconds initial_delay,
                         std::function<void()> callback) = 0;

  // 停止并清空全部定时器，之后可以重新 add_timer
  virtual void stop() = 0;
};

// 每个定时器一个线程
class ThreadTimerGroup : public TimerGroup {
 public:
  ThreadTimerGroup() = default;
  ~ThreadTimerGroup() override;

  void add_timer(std::chrono::seconds interval,
                 std::chrono::seconds initial_delay,
                 std::function<void()> callback) override;
  void stop() override;

  size_t size() const;

 private:
  void run_for_loop(std::chrono::seconds interval,
                    std::chrono::seconds initial_delay,
                    std::function<void()> callback);
  // 等待 duration，期间被 stop 唤醒返回 false
  bool wait_for(std::chrono::seconds duration);

  mutable std::mutex _mtx;
  std::condition_variable _cv;
  bool _stopping{false};
  std::vector<std::unique_ptr<std::thread>> _threads;
};

}  // namespace pollagent
