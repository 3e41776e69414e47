#include "ethstorage/tx/uploader.hpp"
#include "ethstorage/errors.hpp"
#include <boost/log/trivial.hpp>
#include <stdexcept>

namespace ethstorage::tx {

Uploader::Uploader(std::shared_ptr<chain::ChainClient> client, chain::RetryPolicy retry)
  : client_(std::move(client))
  , retry_(std::move(retry)) {
  if (!client_) {
    throw std::invalid_argument("Uploader: chain client is required");
  }
}

Address Uploader::signer() const {
  auto address = client_->signer_address();
  if (!address) {
    throw ValidationError("private key is required for this operation");
  }
  return *address;
}

std::string Uploader::send_tx(const chain::TransactionRequest& tx) {
  std::string hash = retry_.run([this, &tx]() { return client_->send_transaction(tx); }, "send_transaction");
  BOOST_LOG_TRIVIAL(info) << "Uploader: Sent transaction " << hash;
  return hash;
}

std::string Uploader::send_tx_locked(chain::TransactionRequest tx, bool confirm_nonce) {
  std::lock_guard<std::mutex> lock(send_mutex_);
  if (confirm_nonce) {
    const Address from = signer();
    tx.nonce = retry_.run([this, &from]() { return client_->pending_nonce(from); }, "pending_nonce");
    BOOST_LOG_TRIVIAL(debug) << "Uploader: Confirmed nonce " << *tx.nonce << " for " << from;
  }
  std::string hash = retry_.run([this, &tx]() { return client_->send_transaction(tx); }, "send_transaction");
  BOOST_LOG_TRIVIAL(info) << "Uploader: Sent transaction " << hash;
  return hash;
}

TransactionResult Uploader::get_transaction_result(const std::string& tx_hash) {
  chain::TransactionReceipt receipt =
    retry_.run([this, &tx_hash]() { return client_->wait_for_receipt(tx_hash); }, "wait_for_receipt");

  TransactionResult result;
  result.hash = tx_hash;
  result.success = receipt.success;
  result.cost = receipt.effective_gas_price * receipt.gas_used +
                receipt.blob_gas_price * receipt.blob_gas_used;

  if (result.success) {
    BOOST_LOG_TRIVIAL(info) << "Uploader: Transaction " << tx_hash << " mined, cost " << result.cost;
  } else {
    BOOST_LOG_TRIVIAL(error) << "Uploader: Transaction " << tx_hash << " failed on chain";
  }
  return result;
}

TransactionResult Uploader::submit_and_wait(chain::TransactionRequest tx, bool confirm_nonce) {
  std::string hash = send_tx_locked(std::move(tx), confirm_nonce);
  return get_transaction_result(hash);
}

} // namespace ethstorage::tx
