#ifndef ETHSTORAGE_CHAIN_RPC_ERROR_HPP
#define ETHSTORAGE_CHAIN_RPC_ERROR_HPP

#include <cstdint>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <boost/system/error_code.hpp>

namespace ethstorage::chain {

// Failure classes driving retry budgets
enum class ErrorType {
  Socket,
  Network,
  Timeout,
  RateLimit,
  Server,
  RpcServer,
  Client,
  Unknown
};

const char* to_string(ErrorType type);

// Classification rules shared by RpcError and foreign exceptions
ErrorType classify(const std::string& code, std::optional<int64_t> rpc_code,
                   std::optional<int> http_status, const std::string& message);

// Remote call failure, classified once on construction
class RpcError : public std::runtime_error {
public:
  // ---- CONSTRUCTORS ----
  // code is the symbolic transport code ("ECONNRESET"), empty if none
  RpcError(const std::string& message,
           const std::string& code = "",
           std::optional<int64_t> rpc_code = std::nullopt,
           std::optional<int> http_status = std::nullopt);
  // Maps socket and resolver errors onto the symbolic codes
  explicit RpcError(const boost::system::error_code& ec);


  // ---- ACCESSORS ----
  ErrorType type() const { return type_; }
  const std::string& code() const { return code_; }
  std::optional<int64_t> rpc_code() const { return rpc_code_; }
  std::optional<int> http_status() const { return http_status_; }
  bool retryable() const { return type_ != ErrorType::Client; }

private:
  std::string code_;
  std::optional<int64_t> rpc_code_;
  std::optional<int> http_status_;
  ErrorType type_;
};

// Thrown straight away for errors that must not be retried
class NonRetryableError : public std::runtime_error {
public:
  NonRetryableError(const std::string& message, ErrorType type, std::exception_ptr cause)
    : std::runtime_error("Non-retryable error: " + message + " (type: " + to_string(type) + ")")
    , type_(type)
    , cause_(std::move(cause)) {}

  ErrorType type() const { return type_; }
  const std::exception_ptr& cause() const { return cause_; }

private:
  ErrorType type_;
  std::exception_ptr cause_;
};

// Retry budget spent; keeps the last failure
class RetryExhaustedError : public std::runtime_error {
public:
  RetryExhaustedError(std::size_t attempts, ErrorType last_type,
                      const std::string& last_message, std::exception_ptr cause)
    : std::runtime_error("Retry failed after " + std::to_string(attempts) +
                         " attempts (last error type: " + to_string(last_type) + "): " + last_message)
    , attempts_(attempts)
    , last_type_(last_type)
    , cause_(std::move(cause)) {}

  std::size_t attempts() const { return attempts_; }
  ErrorType last_type() const { return last_type_; }
  const std::exception_ptr& cause() const { return cause_; }

private:
  std::size_t attempts_;
  ErrorType last_type_;
  std::exception_ptr cause_;
};

} // namespace ethstorage::chain

#endif // ETHSTORAGE_CHAIN_RPC_ERROR_HPP
