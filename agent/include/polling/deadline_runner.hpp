#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace pollagent {

/**
 * 带超时的插件调用
 *
 * timeout 为 0 时在当前线程直接执行。否则在独立线程中执行，调用者最多等待 timeout。
 * 超时的调用继续在后台运行，结束前同一 key 的新调用直接返回 kBusy，
 * 因此每个 key 最多只有一个线程。所有线程都登记在册，wait_idle 和析构时 join。
 * fn 只能持有自己的数据副本；fn 抛出的异常原样传给调用者。
 */
class DeadlineRunner {
 public:
  enum class Result { kDone, kTimedOut, kBusy };

  explicit DeadlineRunner(std::chrono::milliseconds timeout);
  ~DeadlineRunner();

  DeadlineRunner(const DeadlineRunner&) = delete;
  DeadlineRunner& operator=(const DeadlineRunner&) = delete;

  // 返回 kDone 时结果写入 result
  template <typename R>
  Result call(const std::string& key, std::function<R()> fn, R* result);

  std::chrono::milliseconds timeout() const { return _timeout; }
  // 尚未结束的调用数（包括已超时的）
  size_t in_flight() const;
  bool busy(const std::string& key) const;
  // 最多等待 grace，join 已结束的线程，返回仍在运行的调用数
  size_t wait_idle(std::chrono::milliseconds grace);

 private:
  struct Worker {
    uint64_t id{0};
    bool done{false};
    std::thread thread;
  };

  // key 已有未结束的调用时返回 0
  uint64_t launch(const std::string& key, std::function<void()> body);
  void mark_done(const std::string& key, uint64_t id);
  // 回收本次调用的线程
  void retire(const std::string& key, uint64_t id);
  // 调用者持锁；取出已结束的线程，由调用者在锁外 join
  void take_finished(std::vector<std::thread>* finished);

  std::chrono::milliseconds _timeout;
  mutable std::mutex _mtx;
  std::condition_variable _cv;
  uint64_t _next_id{1};
  std::map<std::string, Worker> _workers;
};

template <typename R>
DeadlineRunner::Result DeadlineRunner::call(const std::string& key,
                                            std::function<R()> fn, R* result) {
  if (_timeout.count() <= 0) {
    *result = fn();
    return Result::kDone;
  }

  auto promise = std::make_shared<std::promise<R>>();
  std::future<R> future = promise->get_future();
  uint64_t id = launch(key, [promise, fn = std::move(fn)]() {
    try {
      promise->set_value(fn());
    } catch (...) {
      promise->set_exception(std::current_exception());
    }
  });
  if (id == 0) {
    return Result::kBusy;
  }

  if (future.wait_for(_timeout) != std::future_status::ready) {
    return Result::kTimedOut;
  }
  retire(key, id);
  *result = future.get();
  return Result::kDone;
}

}  // namespace pollagent
