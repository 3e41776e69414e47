#include "ethstorage/tx/transaction_builder.hpp"
#include "ethstorage/tx/fee.hpp"
#include <boost/log/trivial.hpp>
#include <stdexcept>

namespace ethstorage::tx {

TransactionBuilder::TransactionBuilder(std::shared_ptr<chain::ChainClient> client,
                                       std::shared_ptr<kzg::CommitmentEngine> engine,
                                       chain::RetryPolicy retry)
  : client_(std::move(client))
  , engine_(std::move(engine))
  , retry_(std::move(retry)) {
  if (!client_ || !engine_) {
    throw std::invalid_argument("TransactionBuilder: client and commitment engine are required");
  }
}

//==============================================
// FEE HELPERS
//==============================================

Wei TransactionBuilder::blob_gas_price() {
  Wei excess = retry_.run([this]() { return client_->latest_excess_blob_gas(); }, "latest_excess_blob_gas");
  Wei price = blob_gas_price_with_margin(excess);
  BOOST_LOG_TRIVIAL(debug) << "TransactionBuilder: Blob gas price " << price << " at excess " << excess;
  return price;
}

chain::FeeData TransactionBuilder::fee_data() {
  return retry_.run([this]() { return client_->fee_data(); }, "fee_data");
}

uint64_t TransactionBuilder::estimate_gas(const chain::TransactionRequest& tx) {
  uint64_t limit = retry_.run([this, &tx]() { return client_->estimate_gas(tx); }, "estimate_gas");
  return limit * 11 / 10;
}

//==============================================
// ASSEMBLY
//==============================================

void TransactionBuilder::apply_gas_increase(chain::TransactionRequest& tx, uint32_t gas_increase_pct) {
  if (gas_increase_pct == 0) {
    return;
  }
  chain::FeeData fees = fee_data();
  tx.max_fee_per_gas = increase_by_pct(fees.max_fee_per_gas, gas_increase_pct);
  tx.max_priority_fee_per_gas = increase_by_pct(fees.max_priority_fee_per_gas, gas_increase_pct);
  BOOST_LOG_TRIVIAL(debug) << "TransactionBuilder: Raised execution fees by " << gas_increase_pct << "%";
}

chain::TransactionRequest TransactionBuilder::build_blob_tx(chain::TransactionRequest base,
                                                            std::vector<blob::Blob> blobs,
                                                            const std::optional<std::vector<kzg::Commitment>>& commitments,
                                                            uint32_t gas_increase_pct) {
  if (blobs.empty()) {
    throw std::invalid_argument("TransactionBuilder: blob transaction needs at least one blob");
  }
  if (blobs.size() > blob::BLOB_COUNT_LIMIT) {
    throw std::invalid_argument("TransactionBuilder: at most " + std::to_string(blob::BLOB_COUNT_LIMIT) +
                                " blobs fit in one transaction");
  }

  if (gas_increase_pct > 0) {
    apply_gas_increase(base, gas_increase_pct);
    base.max_fee_per_blob_gas = increase_by_pct(blob_gas_price(), gas_increase_pct);
  }
  if (!base.max_fee_per_blob_gas) {
    base.max_fee_per_blob_gas = blob_gas_price();
  }

  std::vector<kzg::Commitment> full_commitments;
  if (commitments && commitments->size() == blobs.size()) {
    full_commitments = *commitments;
  } else {
    full_commitments = engine_->commit_batch(blobs);
  }
  std::vector<kzg::Proof> proofs = engine_->prove_batch(blobs, full_commitments);

  base.blob_versioned_hashes.clear();
  for (const auto& commitment : full_commitments) {
    base.blob_versioned_hashes.push_back(kzg::CommitmentEngine::versioned_hash(commitment));
  }

  base.type = chain::BLOB_TX_TYPE;
  base.commitments = std::move(full_commitments);
  base.proofs = std::move(proofs);
  base.blobs = std::move(blobs);

  BOOST_LOG_TRIVIAL(debug) << "TransactionBuilder: Built blob transaction with " << base.blobs.size()
                           << " blob(s), max fee per blob gas " << *base.max_fee_per_blob_gas;
  return base;
}

} // namespace ethstorage::tx
