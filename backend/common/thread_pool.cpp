#include "common/thread_pool.hpp"

namespace common {

ThreadPool::ThreadPool(unsigned int size) {
  _poolSize = size < 1 ? 2 : size;
  _threads.reserve(_poolSize);

  for (size_t i = 0; i < _poolSize; i++) {
    _threads.emplace_back([this]() { workerLoop(); });
  }
}

ThreadPool::~ThreadPool() {
  _stop.store(true, std::memory_order_release);
  _cv.notify_all();
  // jthread joins on destruction
  _threads.clear();
}

size_t ThreadPool::pending() const {
  std::lock_guard<std::mutex> lock{_mtx};
  return _tasks.size();
}

void ThreadPool::workerLoop() {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock{_mtx};
      _cv.wait(lock, [this]() -> bool {
        return _stop.load(std::memory_order_acquire) || !_tasks.empty();
      });

      // only leave once the backlog is drained
      if (_stop.load(std::memory_order_acquire) && _tasks.empty()) {
        break;
      }

      task = std::move(_tasks.front());
      _tasks.pop();
    }
    task();
  }
}

} // namespace common
