#ifndef ETHSTORAGE_TX_UPLOADER_HPP
#define ETHSTORAGE_TX_UPLOADER_HPP

#include <memory>
#include <mutex>
#include <string>
#include "ethstorage/chain/chain_client.hpp"
#include "ethstorage/chain/retry.hpp"

namespace ethstorage::tx {

struct TransactionResult {
  std::string hash;
  // Execution gas plus blob gas actually paid
  Wei cost = 0;
  bool success = false;
};

// Submits transactions for one signing identity
class Uploader {
public:
  // ---- CONSTRUCTOR ----
  explicit Uploader(std::shared_ptr<chain::ChainClient> client,
                    chain::RetryPolicy retry = chain::RetryPolicy());


  // ---- SUBMISSION ----
  // Sends as-is, leaving the nonce to the client
  std::string send_tx(const chain::TransactionRequest& tx);
  // Sends under the identity lock. With confirm_nonce the pending nonce is
  // read inside the lock immediately before the send.
  std::string send_tx_locked(chain::TransactionRequest tx, bool confirm_nonce);


  // ---- SETTLEMENT ----
  // Waits for mining and reports cost and status
  TransactionResult get_transaction_result(const std::string& tx_hash);
  // send_tx_locked followed by get_transaction_result
  TransactionResult submit_and_wait(chain::TransactionRequest tx, bool confirm_nonce);

  // Signing address; throws ValidationError on a read-only client
  Address signer() const;

private:
  std::shared_ptr<chain::ChainClient> client_;
  chain::RetryPolicy retry_;
  std::mutex send_mutex_;
};

} // namespace ethstorage::tx

#endif // ETHSTORAGE_TX_UPLOADER_HPP
