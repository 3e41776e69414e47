#ifndef ETHSTORAGE_UTILS_ORDERED_BUFFER_HPP
#define ETHSTORAGE_UTILS_ORDERED_BUFFER_HPP

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>

namespace ethstorage::utils {

// Accepts items tagged with an index in any order and hands them to the
// sink strictly in ascending index order. After each push the longest
// contiguous run starting at the next expected index is flushed.
// The sink runs under the buffer lock and must not push back into it.
template <typename T>
class OrderedBuffer {
public:
  using Sink = std::function<void(std::size_t, T&&)>;

  // ---- CONSTRUCTOR ----
  OrderedBuffer(std::size_t first_index, Sink sink)
    : next_(first_index)
    , sink_(std::move(sink)) {}


  // ---- BUFFER CONTROL METHODS ----
  // Stores the item and flushes what became contiguous; returns the count flushed
  std::size_t push(std::size_t index, T item) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index < next_ || pending_.count(index) != 0) {
      throw std::logic_error("OrderedBuffer: index " + std::to_string(index) + " delivered twice");
    }
    pending_.emplace(index, std::move(item));

    std::size_t flushed = 0;
    auto it = pending_.find(next_);
    while (it != pending_.end()) {
      sink_(it->first, std::move(it->second));
      pending_.erase(it);
      ++next_;
      ++flushed;
      it = pending_.find(next_);
    }
    return flushed;
  }


  // ---- QUERY METHODS ----
  // Index the sink expects next
  std::size_t next_index() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_;
  }

  // Items held back waiting for a gap to fill
  std::size_t pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
  }

private:
  mutable std::mutex mutex_;
  std::size_t next_;
  std::map<std::size_t, T> pending_;
  Sink sink_;
};

} // namespace ethstorage::utils

#endif // ETHSTORAGE_UTILS_ORDERED_BUFFER_HPP
