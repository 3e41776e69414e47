#ifndef ETHSTORAGE_KV_KEY_VALUE_STORE_HPP
#define ETHSTORAGE_KV_KEY_VALUE_STORE_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "ethstorage/blob/blob.hpp"
#include "ethstorage/chain/chain_binding.hpp"
#include "ethstorage/chain/retry.hpp"
#include "ethstorage/config/sdk_config.hpp"
#include "ethstorage/kzg/commitment_engine.hpp"
#include "ethstorage/tx/transaction_builder.hpp"
#include "ethstorage/tx/uploader.hpp"

namespace ethstorage::kv {

// Versioned hash accepted by gas estimation in place of a real blob
constexpr const char* DUMMY_VERSIONED_COMMITMENT_HASH =
  "0x01f32ebe6ad26adca597cdb198f041f5d96fc197e3de72e299e86fbf1f5817c8";

struct WriteResult {
  std::string hash = "0x";
  bool success = false;
};

// Single-blob values stored under string keys. Each value must fit the
// compact capacity of one blob.
class KeyValueStore {
public:
  // Parts wired from a configuration; writer parts are null when read-only
  struct Components {
    std::shared_ptr<chain::KvContract> writer;
    std::shared_ptr<chain::KvContract> reader;
    std::shared_ptr<kzg::CommitmentEngine> engine;
    std::shared_ptr<tx::TransactionBuilder> builder;
    std::shared_ptr<tx::Uploader> uploader;
  };

  // ---- CONSTRUCTION ----
  // Resolves the contract address from the chain id when none is configured
  static std::unique_ptr<KeyValueStore> create(const config::SdkConfig& config,
                                               chain::ChainBinding& binding,
                                               kzg::BackendFactory backend);
  explicit KeyValueStore(Components components, chain::RetryPolicy retry = chain::RetryPolicy());
  ~KeyValueStore();


  // ---- OPERATIONS ----
  CostEstimate estimate_cost(const std::string& key, const Bytes& data);
  // Transaction failures are logged and reported as success == false
  WriteResult write(const std::string& key, const Bytes& data);
  // One transaction carrying up to BLOB_COUNT_LIMIT independent values
  WriteResult write_blobs(const std::vector<std::string>& keys, const std::vector<Bytes>& values);
  // `from` is used only when no signing identity is configured
  Bytes read(const std::string& key,
             blob::DecodeType decode_type = blob::DecodeType::OptimismCompact,
             const std::optional<Address>& from = std::nullopt);

  // Releases the commitment backend
  void close();

  // keccak256 of the UTF-8 key
  static Hash32 content_key(const std::string& key);

private:
  static void check_data(const Bytes& data);
  void require_writer() const;

  Components parts_;
  chain::RetryPolicy retry_;
};

} // namespace ethstorage::kv

#endif // ETHSTORAGE_KV_KEY_VALUE_STORE_HPP
