#ifndef ETHSTORAGE_CHAIN_RETRY_HPP
#define ETHSTORAGE_CHAIN_RETRY_HPP

#include <array>
#include <chrono>
#include <functional>
#include <string>
#include <boost/log/trivial.hpp>
#include "ethstorage/chain/rpc_error.hpp"
#include "ethstorage/errors.hpp"

namespace ethstorage::chain {

struct RetryOptions {
  std::size_t total_retries = 5;
  std::chrono::milliseconds base_delay{100};
  std::chrono::milliseconds max_delay{5000};
  // Jitter as a fraction of the delay, applied in both directions
  double jitter = 0.2;
  // Per-class budgets indexed by ErrorType
  std::array<std::size_t, 8> type_retries{5, 3, 3, 5, 2, 2, 0, 1};
  // Defaults to std::this_thread::sleep_for
  std::function<void(std::chrono::milliseconds)> sleep;
};

// Wraps every remote call: classifies failures, backs off exponentially
// per class and gives up when the class or global budget runs out.
class RetryPolicy {
public:
  explicit RetryPolicy(RetryOptions options = RetryOptions());

  template <typename Fn>
  auto run(Fn&& fn, const std::string& operation) const -> decltype(fn()) {
    std::array<std::size_t, 8> type_counts{};
    std::size_t attempts = 0;

    while (true) {
      ErrorType type = ErrorType::Unknown;
      std::string message;
      std::exception_ptr cause;
      try {
        return fn();
      } catch (const EthStorageError&) {
        // Library-level failures are final
        throw;
      } catch (const RpcError& e) {
        type = e.type();
        message = e.what();
        cause = std::current_exception();
      } catch (const std::exception& e) {
        type = classify("", std::nullopt, std::nullopt, e.what());
        message = e.what();
        cause = std::current_exception();
      }

      ++attempts;
      if (type == ErrorType::Client) {
        BOOST_LOG_TRIVIAL(error) << "RetryPolicy: " << operation << " failed with non-retryable error: " << message;
        throw NonRetryableError(message, type, cause);
      }

      std::size_t& count = type_counts[static_cast<std::size_t>(type)];
      ++count;
      if (count > options_.type_retries[static_cast<std::size_t>(type)] ||
          attempts > options_.total_retries) {
        throw_exhausted(operation, attempts, type, message, cause);
      }

      std::chrono::milliseconds delay = compute_delay(count - 1);
      BOOST_LOG_TRIVIAL(warning) << "RetryPolicy: " << operation << " failed (" << to_string(type)
                                 << "), retry " << count << " in " << delay.count() << "ms: " << message;
      sleep(delay);
    }
  }

  // base * 2^attempt, capped, with jitter; never negative
  std::chrono::milliseconds compute_delay(std::size_t attempt) const;

  const RetryOptions& options() const { return options_; }

private:
  [[noreturn]] void throw_exhausted(const std::string& operation, std::size_t attempts, ErrorType type,
                                    const std::string& message, std::exception_ptr cause) const;
  void sleep(std::chrono::milliseconds delay) const;

  RetryOptions options_;
};

} // namespace ethstorage::chain

#endif // ETHSTORAGE_CHAIN_RETRY_HPP
