#ifndef ETHSTORAGE_TX_TRANSACTION_BUILDER_HPP
#define ETHSTORAGE_TX_TRANSACTION_BUILDER_HPP

#include <memory>
#include <optional>
#include <vector>
#include "ethstorage/chain/chain_client.hpp"
#include "ethstorage/chain/retry.hpp"
#include "ethstorage/kzg/commitment_engine.hpp"

namespace ethstorage::tx {

// Assembles blob-carrying transactions and the fee inputs they need.
// Every node call goes through the retry policy.
class TransactionBuilder {
public:
  // ---- CONSTRUCTOR ----
  TransactionBuilder(std::shared_ptr<chain::ChainClient> client,
                     std::shared_ptr<kzg::CommitmentEngine> engine,
                     chain::RetryPolicy retry = chain::RetryPolicy());


  // ---- FEE HELPERS ----
  // Blob gas price from the latest excess blob gas, with the 10% margin
  Wei blob_gas_price();
  chain::FeeData fee_data();
  // Node estimate padded by 10%
  uint64_t estimate_gas(const chain::TransactionRequest& tx);


  // ---- ASSEMBLY ----
  // Attaches blobs, commitments, proofs and versioned hashes, sets the blob
  // fee cap when unset and applies the gas increase to all fee fields.
  // Supplied commitments are reused only when they match the blob count.
  chain::TransactionRequest build_blob_tx(chain::TransactionRequest base,
                                          std::vector<blob::Blob> blobs,
                                          const std::optional<std::vector<kzg::Commitment>>& commitments = std::nullopt,
                                          uint32_t gas_increase_pct = 0);

  // Scales the execution fee fields from fresh fee data; no-op for pct 0
  void apply_gas_increase(chain::TransactionRequest& tx, uint32_t gas_increase_pct);

  const std::shared_ptr<kzg::CommitmentEngine>& engine() const { return engine_; }

private:
  std::shared_ptr<chain::ChainClient> client_;
  std::shared_ptr<kzg::CommitmentEngine> engine_;
  chain::RetryPolicy retry_;
};

} // namespace ethstorage::tx

#endif // ETHSTORAGE_TX_TRANSACTION_BUILDER_HPP
