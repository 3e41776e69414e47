#include "ethstorage/chain/rpc_error.hpp"
#include <boost/asio/error.hpp>
#include <algorithm>
#include <array>
#include <cctype>

namespace ethstorage::chain {

namespace {

std::string to_lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

bool contains(const std::string& haystack, const char* needle) {
  return haystack.find(needle) != std::string::npos;
}

std::string symbolic_code(const boost::system::error_code& ec) {
  namespace error = boost::asio::error;
  if (ec == error::connection_reset)    return "ECONNRESET";
  if (ec == error::connection_refused)  return "ECONNREFUSED";
  if (ec == error::broken_pipe)         return "EPIPE";
  if (ec == error::connection_aborted)  return "ECONNABORTED";
  if (ec == error::timed_out)           return "ETIMEDOUT";
  if (ec == error::host_not_found)      return "ENOTFOUND";
  if (ec == error::host_unreachable)    return "EHOSTUNREACH";
  if (ec == error::network_unreachable) return "ENETUNREACH";
  return "";
}

} // namespace

const char* to_string(ErrorType type) {
  switch (type) {
    case ErrorType::Socket:    return "SOCKET";
    case ErrorType::Network:   return "NETWORK";
    case ErrorType::Timeout:   return "TIMEOUT";
    case ErrorType::RateLimit: return "RATE_LIMIT";
    case ErrorType::Server:    return "SERVER";
    case ErrorType::RpcServer: return "RPC_SERVER";
    case ErrorType::Client:    return "CLIENT";
    case ErrorType::Unknown:   return "UNKNOWN";
  }
  return "UNKNOWN";
}

ErrorType classify(const std::string& code, std::optional<int64_t> rpc_code,
                   std::optional<int> http_status, const std::string& message) {
  static const std::array<const char*, 4> socket_codes{"ECONNRESET", "ECONNREFUSED", "EPIPE", "ECONNABORTED"};
  static const std::array<const char*, 4> network_codes{"ETIMEDOUT", "ENOTFOUND", "EHOSTUNREACH", "ENETUNREACH"};

  for (const char* c : socket_codes) {
    if (code == c) return ErrorType::Socket;
  }
  for (const char* c : network_codes) {
    if (code == c) return ErrorType::Network;
  }

  const std::string lowered = to_lower(message);
  if (contains(lowered, "timeout") || contains(lowered, "timed out")) {
    return ErrorType::Timeout;
  }
  if (http_status == 429 || rpc_code == 429 || contains(lowered, "rate limit")) {
    return ErrorType::RateLimit;
  }
  if (rpc_code && (*rpc_code == -32000 || *rpc_code == -32603 ||
                   *rpc_code == -32601 || *rpc_code == -32600)) {
    return ErrorType::RpcServer;
  }
  if (http_status) {
    if (*http_status >= 500) return ErrorType::Server;
    if (*http_status >= 400) return ErrorType::Client;
  }
  return ErrorType::Unknown;
}

RpcError::RpcError(const std::string& message, const std::string& code,
                   std::optional<int64_t> rpc_code, std::optional<int> http_status)
  : std::runtime_error(message)
  , code_(code)
  , rpc_code_(rpc_code)
  , http_status_(http_status)
  , type_(classify(code, rpc_code, http_status, message)) {}

RpcError::RpcError(const boost::system::error_code& ec)
  : RpcError(ec.message(), symbolic_code(ec)) {}

} // namespace ethstorage::chain
