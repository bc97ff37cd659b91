#ifndef GEOMAP_THREAD_POOL_HPP
#define GEOMAP_THREAD_POOL_HPP

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace geomap {

/**
 * @brief Fixed-size worker pool
 *
 * Tasks run in submission order on the first free worker. The destructor
 * finishes every queued task before joining; there is no cancellation.
 */
class ThreadPool {
public:
  explicit ThreadPool(size_t threads);
  ~ThreadPool();

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  template <typename F>
  std::future<typename std::invoke_result<F>::type> submit(F &&task) {
    using Result = typename std::invoke_result<F>::type;

    auto packaged =
        std::make_shared<std::packaged_task<Result()>>(std::forward<F>(task));
    std::future<Result> future = packaged->get_future();
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      if (m_stopping) {
        throw std::runtime_error("ThreadPool is shutting down");
      }
      m_tasks.emplace([packaged]() { (*packaged)(); });
    }
    m_condition.notify_one();
    return future;
  }

  size_t size() const { return m_workers.size(); }

private:
  void workerLoop();

  std::vector<std::thread> m_workers;
  std::queue<std::function<void()>> m_tasks;
  std::mutex m_mutex;
  std::condition_variable m_condition;
  bool m_stopping;
};

} // namespace geomap

#endif // GEOMAP_THREAD_POOL_HPP
