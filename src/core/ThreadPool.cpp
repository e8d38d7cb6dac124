#include "core/ThreadPool.hpp"

namespace dnspub::core {

ThreadPool::ThreadPool(int iSize) {
  int iThreads = iSize > 0 ? iSize : static_cast<int>(std::thread::hardware_concurrency());
  if (iThreads <= 0) iThreads = 1;

  _vWorkers.reserve(static_cast<size_t>(iThreads));
  for (int i = 0; i < iThreads; ++i) {
    _vWorkers.emplace_back([this]() { workerLoop(); });
  }
}

ThreadPool::~ThreadPool() {
  shutdown();
}

void ThreadPool::workerLoop() {
  while (true) {
    std::packaged_task<void()> task;
    {
      std::unique_lock<std::mutex> lock(_mtx);
      _cv.wait(lock, [this]() { return _bStopping || !_qTasks.empty(); });
      if (_qTasks.empty()) {
        return;  // stopping and drained
      }
      task = std::move(_qTasks.front());
      _qTasks.pop();
    }
    // Exceptions are captured in the task's future.
    task();
  }
}

void ThreadPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    _bStopping = true;
  }
  _cv.notify_all();

  for (auto& thread : _vWorkers) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

}  // namespace dnspub::core
