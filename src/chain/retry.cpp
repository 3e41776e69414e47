#include "ethstorage/chain/retry.hpp"
#include <algorithm>
#include <random>
#include <thread>

namespace ethstorage::chain {

RetryPolicy::RetryPolicy(RetryOptions options)
  : options_(std::move(options)) {}

std::chrono::milliseconds RetryPolicy::compute_delay(std::size_t attempt) const {
  double delay = static_cast<double>(options_.base_delay.count());
  const double cap = static_cast<double>(options_.max_delay.count());
  for (std::size_t i = 0; i < attempt && delay < cap; ++i) {
    delay *= 2;
  }
  delay = std::min(delay, cap);

  thread_local std::mt19937 rng{std::random_device{}()};
  std::uniform_real_distribution<double> dist(-1.0, 1.0);
  double jittered = delay + delay * options_.jitter * dist(rng);
  return std::chrono::milliseconds(static_cast<int64_t>(std::max(jittered, 0.0)));
}

void RetryPolicy::throw_exhausted(const std::string& operation, std::size_t attempts, ErrorType type,
                                  const std::string& message, std::exception_ptr cause) const {
  BOOST_LOG_TRIVIAL(error) << "RetryPolicy: " << operation << " gave up after " << attempts
                           << " attempts (last error type: " << to_string(type) << ")";
  throw RetryExhaustedError(attempts, type, message, std::move(cause));
}

void RetryPolicy::sleep(std::chrono::milliseconds delay) const {
  if (options_.sleep) {
    options_.sleep(delay);
  } else {
    std::this_thread::sleep_for(delay);
  }
}

} // namespace ethstorage::chain
