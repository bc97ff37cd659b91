#include "geomap/ThreadPool.hpp"

namespace geomap {

ThreadPool::ThreadPool(size_t threads) : m_stopping(false) {
  if (threads == 0) {
    threads = 1;
  }
  m_workers.reserve(threads);
  for (size_t i = 0; i < threads; i++) {
    m_workers.emplace_back([this]() { workerLoop(); });
  }
}

ThreadPool::~ThreadPool() {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stopping = true;
  }
  m_condition.notify_all();
  for (auto &worker : m_workers) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

void ThreadPool::workerLoop() {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(m_mutex);
      m_condition.wait(lock,
                       [this]() { return m_stopping || !m_tasks.empty(); });
      if (m_tasks.empty()) {
        return;
      }
      task = std::move(m_tasks.front());
      m_tasks.pop();
    }
    // packaged_task stores exceptions in the future
    task();
  }
}

} // namespace geomap
