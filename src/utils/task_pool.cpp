#include "ethstorage/utils/task_pool.hpp"
#include <boost/asio/post.hpp>
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <stdexcept>
#include <thread>

namespace ethstorage::utils {

TaskPool::TaskPool(std::size_t concurrency)
  : concurrency_(std::max<std::size_t>(concurrency, 1))
  , pool_(std::make_unique<boost::asio::thread_pool>(concurrency_)) {
  BOOST_LOG_TRIVIAL(debug) << "TaskPool: Started with " << concurrency_ << " worker(s)";
}

TaskPool::~TaskPool() {
  if (!joined_) {
    pool_->join();
  }
}

void TaskPool::submit(std::function<void()> task) {
  if (joined_) {
    throw std::logic_error("TaskPool: submit after wait");
  }
  boost::asio::post(*pool_, [this, task = std::move(task)]() {
    try {
      task();
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "TaskPool: Task failed: " << e.what();
      std::lock_guard<std::mutex> lock(error_mutex_);
      if (!first_error_) {
        first_error_ = std::current_exception();
      }
    }
    completed_.fetch_add(1);
  });
}

void TaskPool::wait() {
  if (!joined_) {
    pool_->join();
    joined_ = true;
  }
  std::lock_guard<std::mutex> lock(error_mutex_);
  if (first_error_) {
    std::exception_ptr error = first_error_;
    first_error_ = nullptr;
    std::rethrow_exception(error);
  }
}

std::size_t TaskPool::default_concurrency(std::size_t min_workers, std::size_t max_workers) {
  std::size_t hardware = std::thread::hardware_concurrency();
  if (hardware == 0) {
    hardware = min_workers;
  }
  return std::clamp(hardware, min_workers, max_workers);
}

} // namespace ethstorage::utils
