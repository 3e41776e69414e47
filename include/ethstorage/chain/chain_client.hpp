#ifndef ETHSTORAGE_CHAIN_CHAIN_CLIENT_HPP
#define ETHSTORAGE_CHAIN_CHAIN_CLIENT_HPP

#include <cstdint>
#include <optional>
#include <string>
#include "ethstorage/chain/types.hpp"

namespace ethstorage::chain {

// Connection to one ledger endpoint, optionally bound to a signing identity.
// Implementations report transport failures as RpcError.
class ChainClient {
public:
  virtual ~ChainClient() = default;

  virtual uint64_t chain_id() = 0;
  // Address of the signing identity; empty for a read-only client
  virtual std::optional<Address> signer_address() const = 0;

  virtual uint64_t pending_nonce(const Address& address) = 0;
  virtual FeeData fee_data() = 0;
  virtual Wei latest_excess_blob_gas() = 0;
  virtual uint64_t estimate_gas(const TransactionRequest& tx) = 0;

  // Signs and broadcasts; assigns the next nonce itself when tx.nonce is unset.
  // Returns the transaction hash.
  virtual std::string send_transaction(const TransactionRequest& tx) = 0;
  // Blocks until the transaction is mined
  virtual TransactionReceipt wait_for_receipt(const std::string& tx_hash) = 0;
};

} // namespace ethstorage::chain

#endif // ETHSTORAGE_CHAIN_CHAIN_CLIENT_HPP
