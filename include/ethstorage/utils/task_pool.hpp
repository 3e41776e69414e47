#ifndef ETHSTORAGE_UTILS_TASK_POOL_HPP
#define ETHSTORAGE_UTILS_TASK_POOL_HPP

#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <boost/asio/thread_pool.hpp>

namespace ethstorage::utils {

// Fixed-width worker pool; at most `concurrency` tasks run at once.
// The first exception thrown by a task is kept and rethrown by wait().
class TaskPool {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit TaskPool(std::size_t concurrency);
  ~TaskPool();

  TaskPool(const TaskPool&) = delete;
  TaskPool& operator=(const TaskPool&) = delete;


  // ---- TASK CONTROL METHODS ----
  void submit(std::function<void()> task);
  // Blocks until every submitted task finished; the pool cannot be reused
  void wait();


  // ---- QUERY METHODS ----
  std::size_t concurrency() const { return concurrency_; }
  std::size_t completed() const { return completed_.load(); }

  // Hardware parallelism clamped to [min_workers, max_workers]
  static std::size_t default_concurrency(std::size_t min_workers, std::size_t max_workers);

private:
  std::size_t concurrency_;
  std::unique_ptr<boost::asio::thread_pool> pool_;
  std::atomic<std::size_t> completed_{0};
  std::mutex error_mutex_;
  std::exception_ptr first_error_;
  bool joined_ = false;
};

} // namespace ethstorage::utils

#endif // ETHSTORAGE_UTILS_TASK_POOL_HPP
