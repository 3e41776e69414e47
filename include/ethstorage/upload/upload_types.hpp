#ifndef ETHSTORAGE_UPLOAD_UPLOAD_TYPES_HPP
#define ETHSTORAGE_UPLOAD_UPLOAD_TYPES_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "ethstorage/chain/types.hpp"
#include "ethstorage/types.hpp"

namespace ethstorage::upload {

struct UploadRequest {
  std::string key;
  Bytes content;
  chain::StorageMode mode = chain::StorageMode::Blob;
  uint32_t gas_increase_pct = 0;
  // Remote hashes fetched earlier; skips one round of lookups
  std::optional<std::vector<Hash32>> chunk_hashes;
  // Sequential submission with the nonce read right before each send
  bool confirm_nonce = false;
};

// Same inputs as an upload, without callbacks
struct EstimateRequest {
  std::string key;
  Bytes content;
  chain::StorageMode mode = chain::StorageMode::Blob;
  uint32_t gas_increase_pct = 0;
  std::optional<std::vector<Hash32>> chunk_hashes;
};

struct UploadResult {
  uint64_t total_chunks = 0;
  uint64_t total_bytes = 0;
  // Storage payment sent with the writes
  Wei total_cost = 0;
  // Gas and blob gas paid, from the receipts
  Wei total_gas_cost = 0;
};

// Progress arrives in ascending unit order; last_index is the last chunk
// id of the unit and written is false for units left untouched
struct UploadCallback {
  std::function<void(uint64_t last_index, uint64_t total_chunks, bool written)> on_progress;
  std::function<void(const std::string& error)> on_fail;
  std::function<void(const UploadResult& result)> on_finish;
};

// Terminal state of one upload; error set when on_fail fired
struct UploadOutcome {
  UploadResult result;
  std::optional<std::string> error;

  bool ok() const { return !error.has_value(); }
};

} // namespace ethstorage::upload

#endif // ETHSTORAGE_UPLOAD_UPLOAD_TYPES_HPP
