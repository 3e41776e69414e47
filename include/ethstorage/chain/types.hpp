#ifndef ETHSTORAGE_CHAIN_TYPES_HPP
#define ETHSTORAGE_CHAIN_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "ethstorage/blob/blob.hpp"
#include "ethstorage/kzg/commitment_backend.hpp"
#include "ethstorage/types.hpp"

namespace ethstorage::chain {

constexpr uint8_t BLOB_TX_TYPE = 3;

// How a flat directory stores a file's chunks
enum class StorageMode : uint8_t {
  Undefined = 0,
  Calldata = 1,
  Blob = 2
};

const char* storage_mode_to_string(StorageMode mode);
// Maps the contract's numeric mode; unknown values are rejected
StorageMode storage_mode_from_int(uint64_t value);

struct FeeData {
  Wei max_fee_per_gas = 0;
  Wei max_priority_fee_per_gas = 0;
  Wei gas_price = 0;
};

// Unsigned transaction; the client signs it and fills unset fields
struct TransactionRequest {
  std::optional<uint64_t> chain_id;
  std::optional<uint64_t> nonce;
  Address to;
  Bytes data;
  Wei value = 0;
  std::optional<uint64_t> gas_limit;
  std::optional<Wei> max_fee_per_gas;
  std::optional<Wei> max_priority_fee_per_gas;
  std::optional<Wei> max_fee_per_blob_gas;
  uint8_t type = 2;

  // Blob sidecar, populated by the transaction builder
  std::vector<blob::Blob> blobs;
  std::vector<kzg::Commitment> commitments;
  std::vector<kzg::Proof> proofs;
  std::vector<kzg::VersionedHash> blob_versioned_hashes;

  bool has_blobs() const { return !blobs.empty(); }
};

struct TransactionReceipt {
  std::string hash;
  bool success = false;
  uint64_t gas_used = 0;
  Wei effective_gas_price = 0;
  uint64_t blob_gas_used = 0;
  Wei blob_gas_price = 0;
};

// What the directory contract holds for one file
struct UploadInfo {
  StorageMode mode = StorageMode::Undefined;
  uint64_t chunk_count = 0;
  Wei cost_per_chunk = 0;
};

// Key of a batched hash lookup
struct FileChunks {
  std::string name;
  std::vector<uint64_t> chunk_ids;
};

} // namespace ethstorage::chain

#endif // ETHSTORAGE_CHAIN_TYPES_HPP
