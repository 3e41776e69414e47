#ifndef ETHSTORAGE_TESTS_FAKES_HPP
#define ETHSTORAGE_TESTS_FAKES_HPP

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include "ethstorage/chain/chain_binding.hpp"
#include "ethstorage/chain/retry.hpp"
#include "ethstorage/crypto/hash.hpp"
#include "ethstorage/kzg/commitment_backend.hpp"

namespace ethstorage::test {

inline void quiet_logging() {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= boost::log::trivial::error);
}

inline Bytes to_bytes(const std::string& text) {
  return Bytes(text.begin(), text.end());
}

inline std::string to_text(const Bytes& bytes) {
  return std::string(bytes.begin(), bytes.end());
}

// Content whose bytes differ from position to position
inline Bytes make_content(std::size_t size, uint8_t seed = 7) {
  Bytes data(size);
  for (std::size_t i = 0; i < size; ++i) {
    data[i] = static_cast<uint8_t>((i * 31 + seed + (i >> 8)) & 0xFF);
  }
  return data;
}

// Retry policy that never sleeps
inline chain::RetryPolicy fast_retry() {
  chain::RetryOptions options;
  options.sleep = [](std::chrono::milliseconds) {};
  return chain::RetryPolicy(options);
}

//==============================================
// COMMITMENT BACKEND
//==============================================

struct BackendStats {
  std::atomic<int> constructed{0};
  std::atomic<int> released{0};
  std::atomic<int> commitments{0};
  std::atomic<int> proofs{0};
};

// Hash-derived stand-in for the KZG primitive
class FakeBackend : public kzg::CommitmentBackend {
public:
  explicit FakeBackend(std::shared_ptr<BackendStats> stats) : stats_(std::move(stats)) {
    stats_->constructed.fetch_add(1);
  }

  kzg::Commitment blob_to_commitment(const blob::Blob& blob) override {
    stats_->commitments.fetch_add(1);
    return commitment_of(blob);
  }

  kzg::Proof compute_blob_proof(const blob::Blob&, const kzg::Commitment& commitment) override {
    stats_->proofs.fetch_add(1);
    return proof_of(commitment);
  }

  bool verify_blob_proof(const blob::Blob& blob, const kzg::Commitment& commitment,
                         const kzg::Proof& proof) override {
    return commitment == commitment_of(blob) && proof == proof_of(commitment);
  }

  void release() override {
    if (!released_.exchange(true)) {
      stats_->released.fetch_add(1);
    }
  }

  static kzg::Commitment commitment_of(const blob::Blob& blob) {
    Hash32 digest = crypto::sha256(blob.data(), blob.size());
    Hash32 tail = crypto::sha256(digest.data(), digest.size());
    kzg::Commitment out{};
    std::memcpy(out.data(), digest.data(), 32);
    std::memcpy(out.data() + 32, tail.data(), 16);
    return out;
  }

  static kzg::Proof proof_of(const kzg::Commitment& commitment) {
    Hash32 digest = crypto::sha256(commitment.data(), commitment.size());
    kzg::Proof out{};
    out.fill(0xAB);
    std::memcpy(out.data(), digest.data(), 32);
    return out;
  }

private:
  std::shared_ptr<BackendStats> stats_;
  std::atomic<bool> released_{false};
};

inline kzg::BackendFactory fake_backend_factory(std::shared_ptr<BackendStats> stats) {
  return [stats]() -> std::unique_ptr<kzg::CommitmentBackend> {
    return std::make_unique<FakeBackend>(stats);
  };
}

//==============================================
// CHAIN CLIENT
//==============================================

// Single-identity ledger: nonces count sent transactions, every
// transaction is mined at once unless listed in failing_hashes
class FakeChainClient : public chain::ChainClient {
public:
  explicit FakeChainClient(std::optional<Address> signer = Address("0x00000000000000000000000000000000000000a1"),
                           uint64_t chain_id = 11155111)
    : signer_(std::move(signer))
    , chain_id_(chain_id) {}

  uint64_t chain_id() override { return chain_id_; }
  std::optional<Address> signer_address() const override { return signer_; }

  uint64_t pending_nonce(const Address&) override {
    uint64_t nonce;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      nonce = next_nonce_;
    }
    // Widens the window between reading and using the nonce
    if (nonce_delay.count() > 0) {
      std::this_thread::sleep_for(nonce_delay);
    }
    return nonce;
  }

  chain::FeeData fee_data() override {
    fee_calls.fetch_add(1);
    return fees;
  }

  Wei latest_excess_blob_gas() override { return excess_blob_gas; }

  uint64_t estimate_gas(const chain::TransactionRequest& tx) override {
    std::lock_guard<std::mutex> lock(mutex_);
    estimated.push_back(tx);
    return gas_estimate;
  }

  std::string send_transaction(const chain::TransactionRequest& tx) override {
    if (on_send) {
      on_send(tx);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    chain::TransactionRequest copy = tx;
    if (!copy.nonce) {
      copy.nonce = next_nonce_;
    }
    ++next_nonce_;
    std::string hash = "0xtx" + std::to_string(sent.size());
    sent.push_back(copy);
    sent_hashes.push_back(hash);
    return hash;
  }

  chain::TransactionReceipt wait_for_receipt(const std::string& tx_hash) override {
    chain::TransactionReceipt receipt;
    receipt.hash = tx_hash;
    std::lock_guard<std::mutex> lock(mutex_);
    receipt.success = failing_hashes.count(tx_hash) == 0;
    receipt.gas_used = 21000;
    receipt.effective_gas_price = 2;
    for (std::size_t i = 0; i < sent_hashes.size(); ++i) {
      if (sent_hashes[i] == tx_hash) {
        receipt.blob_gas_used = sent[i].blobs.size() * blob::BLOB_SIZE;
      }
    }
    receipt.blob_gas_price = 1;
    return receipt;
  }

  std::vector<chain::TransactionRequest> sent_snapshot() {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent;
  }

  std::vector<chain::TransactionRequest> estimated_snapshot() {
    std::lock_guard<std::mutex> lock(mutex_);
    return estimated;
  }

  void fail_hash(const std::string& hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_hashes.insert(hash);
  }

  chain::FeeData fees{Wei(100), Wei(10), Wei(50)};
  Wei excess_blob_gas = 0;
  uint64_t gas_estimate = 100000;
  std::chrono::milliseconds nonce_delay{0};
  std::function<void(const chain::TransactionRequest&)> on_send;
  std::atomic<int> fee_calls{0};

private:
  std::optional<Address> signer_;
  uint64_t chain_id_;
  std::mutex mutex_;
  uint64_t next_nonce_ = 0;
  std::vector<chain::TransactionRequest> sent;
  std::vector<std::string> sent_hashes;
  std::vector<chain::TransactionRequest> estimated;
  std::set<std::string> failing_hashes;
};

//==============================================
// CONTRACTS
//==============================================

// Write calls are encoded as readable text in TransactionRequest::data
inline std::string call_of(const chain::TransactionRequest& tx) {
  return to_text(tx.data);
}

inline std::string join_ids(const std::vector<uint64_t>& ids) {
  std::string out;
  for (std::size_t i = 0; i < ids.size(); ++i) {
    if (i > 0) out += ",";
    out += std::to_string(ids[i]);
  }
  return out;
}

class FakeStorageContract : public chain::StorageContract {
public:
  explicit FakeStorageContract(Address address = "0x00000000000000000000000000000000000000d1")
    : address_(std::move(address)) {}

  Address address() const override { return address_; }

  std::string contract_version() override { return version; }
  bool is_blob_mode_supported() override { return blob_supported; }

  chain::UploadInfo get_upload_info(const std::string& name) override {
    std::lock_guard<std::mutex> lock(mutex_);
    chain::UploadInfo info;
    info.cost_per_chunk = cost_per_chunk;
    auto it = files.find(name);
    if (it != files.end()) {
      info.mode = it->second.mode;
      info.chunk_count = it->second.hashes.size();
    }
    return info;
  }

  uint64_t count_chunks(const std::string& name) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files.find(name);
    return it == files.end() ? 0 : it->second.chunks.size();
  }

  std::vector<uint64_t> count_chunks_batch(const std::vector<std::string>& names) override {
    std::vector<uint64_t> counts;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& name : names) {
      auto it = files.find(name);
      counts.push_back(it == files.end() ? 0 : it->second.hashes.size());
    }
    return counts;
  }

  std::vector<Hash32> get_chunk_hashes_batch(const std::vector<chain::FileChunks>& request) override {
    hash_calls.fetch_add(1);
    std::vector<Hash32> out;
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t ids = 0;
    for (const auto& file : request) {
      ids += file.chunk_ids.size();
      auto it = files.find(file.name);
      for (uint64_t id : file.chunk_ids) {
        Hash32 hash{};
        if (it != files.end() && id < it->second.hashes.size()) {
          hash = it->second.hashes[id];
        }
        out.push_back(hash);
      }
    }
    largest_hash_page = std::max(largest_hash_page, ids);
    return out;
  }

  Bytes read_chunk(const std::string& name, uint64_t chunk_id) override {
    if (on_read) {
      on_read(chunk_id);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files.find(name);
    if (it == files.end() || chunk_id >= it->second.chunks.size()) {
      throw chain::RpcError("execution reverted", "", -32000);
    }
    return it->second.chunks[chunk_id];
  }

  Wei upfront_payment() override { return cost_per_chunk; }

  chain::TransactionRequest write_chunks_by_blobs(const std::string& name,
                                                  const std::vector<uint64_t>& chunk_ids,
                                                  const std::vector<uint64_t>& chunk_sizes,
                                                  const Wei& value) override {
    return record("writeChunks:" + name + ":" + join_ids(chunk_ids) + ":" + join_ids(chunk_sizes), value);
  }

  chain::TransactionRequest write_chunk_by_calldata(const std::string& name, uint64_t chunk_id,
                                                    const Bytes& data, const Wei& value) override {
    return record("writeChunk:" + name + ":" + std::to_string(chunk_id) + ":" + std::to_string(data.size()), value);
  }

  chain::TransactionRequest truncate(const std::string& name, uint64_t chunk_count) override {
    return record("truncate:" + name + ":" + std::to_string(chunk_count), 0);
  }

  chain::TransactionRequest remove(const std::string& name) override {
    return record("remove:" + name, 0);
  }

  chain::TransactionRequest set_default(const std::string& name) override {
    return record("setDefault:" + name, 0);
  }

  // Stored state of one file
  struct File {
    chain::StorageMode mode = chain::StorageMode::Blob;
    std::vector<Hash32> hashes;
    std::vector<Bytes> chunks;
  };

  void put_file(const std::string& name, File file) {
    std::lock_guard<std::mutex> lock(mutex_);
    files[name] = std::move(file);
  }

  std::vector<std::string> calls_snapshot() {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls;
  }

  std::string version = "1.0.0";
  bool blob_supported = true;
  Wei cost_per_chunk = 1000;
  std::atomic<int> hash_calls{0};
  std::size_t largest_hash_page = 0;
  std::function<void(uint64_t)> on_read;

private:
  chain::TransactionRequest record(const std::string& call, const Wei& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    calls.push_back(call);
    chain::TransactionRequest tx;
    tx.to = address_;
    tx.data = to_bytes(call);
    tx.value = value;
    return tx;
  }

  Address address_;
  std::mutex mutex_;
  std::map<std::string, File> files;
  std::vector<std::string> calls;
};

class FakeKvContract : public chain::KvContract {
public:
  Address address() const override { return "0x00000000000000000000000000000000000000e1"; }

  Wei upfront_payment() override { return upfront; }

  chain::TransactionRequest put_blob(const Hash32& key, uint64_t blob_index, uint64_t length,
                                     const Wei& value) override {
    chain::TransactionRequest tx;
    tx.to = address();
    tx.data = to_bytes("putBlob:" + crypto::to_hex(key) + ":" + std::to_string(blob_index) + ":" +
                       std::to_string(length));
    tx.value = value;
    return tx;
  }

  chain::TransactionRequest put_blobs(const std::vector<Hash32>& keys, const std::vector<uint64_t>& blob_indexes,
                                      const std::vector<uint64_t>& lengths, const Wei& value) override {
    chain::TransactionRequest tx;
    tx.to = address();
    tx.data = to_bytes("putBlobs:" + std::to_string(keys.size()) + ":" + join_ids(blob_indexes) + ":" +
                       join_ids(lengths));
    tx.value = value;
    return tx;
  }

  uint64_t size(const Hash32& key, const Address& from) override {
    last_from = from;
    auto it = stored.find(key);
    return it == stored.end() ? 0 : it->second.size();
  }

  Bytes get(const Hash32& key, blob::DecodeType decode_type, uint64_t offset, uint64_t length,
            const Address& from) override {
    last_from = from;
    last_decode_type = decode_type;
    const Bytes& data = stored.at(key);
    return Bytes(data.begin() + offset, data.begin() + offset + length);
  }

  Wei upfront = 500;
  std::map<Hash32, Bytes> stored;
  Address last_from;
  blob::DecodeType last_decode_type = blob::DecodeType::RawData;
};

//==============================================
// BINDING
//==============================================

class FakeBinding : public chain::ChainBinding {
public:
  std::shared_ptr<chain::ChainClient> connect(const std::string& rpc,
                                              const std::optional<std::string>& private_key) override {
    connections.emplace_back(rpc, private_key.has_value());
    if (private_key) {
      return signer;
    }
    return reader_client;
  }

  std::shared_ptr<chain::StorageContract> flat_directory(const Address& address,
                                                         std::shared_ptr<chain::ChainClient> client) override {
    bound_addresses.push_back(address);
    return client == signer ? std::static_pointer_cast<chain::StorageContract>(directory_writer)
                            : std::static_pointer_cast<chain::StorageContract>(directory_reader);
  }

  std::shared_ptr<chain::KvContract> key_value(const Address& address,
                                               std::shared_ptr<chain::ChainClient> client) override {
    bound_addresses.push_back(address);
    return client == signer ? kv_writer : kv_reader;
  }

  std::shared_ptr<FakeChainClient> signer = std::make_shared<FakeChainClient>();
  std::shared_ptr<FakeChainClient> reader_client = std::make_shared<FakeChainClient>(std::nullopt);
  std::shared_ptr<FakeStorageContract> directory_writer = std::make_shared<FakeStorageContract>();
  std::shared_ptr<FakeStorageContract> directory_reader = directory_writer;
  std::shared_ptr<FakeKvContract> kv_writer = std::make_shared<FakeKvContract>();
  std::shared_ptr<FakeKvContract> kv_reader = kv_writer;
  std::vector<std::pair<std::string, bool>> connections;
  std::vector<Address> bound_addresses;
};

} // namespace ethstorage::test

#endif // ETHSTORAGE_TESTS_FAKES_HPP
