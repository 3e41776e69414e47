#ifndef ETHSTORAGE_ERRORS_HPP
#define ETHSTORAGE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace ethstorage {

class EthStorageError : public std::runtime_error {
public:
  explicit EthStorageError(const std::string& message)
    : std::runtime_error(message) {}
};

// Missing, oversized or otherwise invalid key or data
class ValidationError : public EthStorageError {
public:
  explicit ValidationError(const std::string& message)
    : EthStorageError("Validation error: " + message) {}
};

// Requested mode unsupported by the deployed contract, or version mismatch
class CapabilityError : public EthStorageError {
public:
  explicit CapabilityError(const std::string& message)
    : EthStorageError("Capability error: " + message) {}
};

// Transaction was mined but reverted
class TransactionFailure : public EthStorageError {
public:
  TransactionFailure(const std::string& tx_hash, const std::string& message)
    : EthStorageError("Transaction failure: " + message + " (tx " + tx_hash + ")")
    , tx_hash_(tx_hash) {}

  const std::string& tx_hash() const { return tx_hash_; }

private:
  std::string tx_hash_;
};

} // namespace ethstorage

#endif // ETHSTORAGE_ERRORS_HPP
