#include "polling/deadline_runner.hpp"

#include <utility>

#include "util/logging.hpp"

namespace pollagent {

DeadlineRunner::DeadlineRunner(std::chrono::milliseconds timeout)
    : _timeout(timeout) {}

DeadlineRunner::~DeadlineRunner() {
  std::vector<std::thread> threads;
  {
    std::lock_guard<std::mutex> lock(_mtx);
    for (auto& [key, worker] : _workers) {
      if (!worker.done) {
        agent_logger().warn("Waiting for pending call {} to return", key);
      }
      threads.push_back(std::move(worker.thread));
    }
    _workers.clear();
  }
  for (auto& thread : threads) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

uint64_t DeadlineRunner::launch(const std::string& key,
                                std::function<void()> body) {
  std::vector<std::thread> finished;
  uint64_t id = 0;
  {
    std::lock_guard<std::mutex> lock(_mtx);
    take_finished(&finished);
    if (_workers.count(key) == 0) {
      id = _next_id++;
      Worker& worker = _workers[key];
      worker.id = id;
      // 持锁创建线程，mark_done 一定发生在线程登记之后
      worker.thread = std::thread([this, key, id, body = std::move(body)]() {
        body();
        mark_done(key, id);
      });
    }
  }
  for (auto& thread : finished) {
    thread.join();
  }
  return id;
}

void DeadlineRunner::mark_done(const std::string& key, uint64_t id) {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    auto it = _workers.find(key);
    if (it != _workers.end() && it->second.id == id) {
      it->second.done = true;
    }
  }
  _cv.notify_all();
}

void DeadlineRunner::retire(const std::string& key, uint64_t id) {
  std::thread thread;
  {
    std::lock_guard<std::mutex> lock(_mtx);
    auto it = _workers.find(key);
    if (it == _workers.end() || it->second.id != id) {
      // 已被其他调用回收
      return;
    }
    thread = std::move(it->second.thread);
    _workers.erase(it);
  }
  if (thread.joinable()) {
    thread.join();
  }
}

void DeadlineRunner::take_finished(std::vector<std::thread>* finished) {
  for (auto it = _workers.begin(); it != _workers.end();) {
    if (it->second.done) {
      finished->push_back(std::move(it->second.thread));
      it = _workers.erase(it);
    } else {
      ++it;
    }
  }
}

size_t DeadlineRunner::in_flight() const {
  std::lock_guard<std::mutex> lock(_mtx);
  size_t count = 0;
  for (const auto& [key, worker] : _workers) {
    if (!worker.done) {
      ++count;
    }
  }
  return count;
}

bool DeadlineRunner::busy(const std::string& key) const {
  std::lock_guard<std::mutex> lock(_mtx);
  auto it = _workers.find(key);
  return it != _workers.end() && !it->second.done;
}

size_t DeadlineRunner::wait_idle(std::chrono::milliseconds grace) {
  std::vector<std::thread> finished;
  size_t pending = 0;
  {
    std::unique_lock<std::mutex> lock(_mtx);
    _cv.wait_for(lock, grace, [this] {
      for (const auto& [key, worker] : _workers) {
        if (!worker.done) return false;
      }
      return true;
    });
    take_finished(&finished);
    pending = _workers.size();
  }
  for (auto& thread : finished) {
    thread.join();
  }
  return pending;
}

}  // namespace pollagent
