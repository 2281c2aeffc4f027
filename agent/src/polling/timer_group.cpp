#include "polling/timer_group.hpp"

namespace pollagent {

ThreadTimerGroup::~ThreadTimerGroup() { stop(); }

void ThreadTimerGroup::add_timer(std::chrono::seconds interval,
                                 std::chrono::seconds initial_delay,
                                 std::function<void()> callback) {
  std::lock_guard<std::mutex> lock(_mtx);
  _threads.push_back(std::make_unique<std::thread>(
      &ThreadTimerGroup::run_for_loop, this, interval, initial_delay,
      std::move(callback)));
}

void ThreadTimerGroup::stop() {
  std::vector<std::unique_ptr<std::thread>> threads;
  {
    std::lock_guard<std::mutex> lock(_mtx);
    _stopping = true;
    threads.swap(_threads);
  }
  _cv.notify_all();
  for (auto& thread : threads) {
    if (thread->joinable()) {
      thread->join();
    }
  }
  std::lock_guard<std::mutex> lock(_mtx);
  _stopping = false;
}

size_t ThreadTimerGroup::size() const {
  std::lock_guard<std::mutex> lock(_mtx);
  return _threads.size();
}

bool ThreadTimerGroup::wait_for(std::chrono::seconds duration) {
  std::unique_lock<std::mutex> lock(_mtx);
  return !_cv.wait_for(lock, duration, [this] { return _stopping; });
}

void ThreadTimerGroup::run_for_loop(std::chrono::seconds interval,
                                    std::chrono::seconds initial_delay,
                                    std::function<void()> callback) {
  if (!wait_for(initial_delay)) {
    return;
  }
  while (true) {
    callback();
    if (!wait_for(interval)) {
      return;
    }
  }
}

}  // namespace pollagent
