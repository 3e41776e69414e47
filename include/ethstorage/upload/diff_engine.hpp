#ifndef ETHSTORAGE_UPLOAD_DIFF_ENGINE_HPP
#define ETHSTORAGE_UPLOAD_DIFF_ENGINE_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "ethstorage/chain/retry.hpp"
#include "ethstorage/chain/storage_contract.hpp"
#include "ethstorage/tx/uploader.hpp"

namespace ethstorage::upload {

// Chunk ids per hash lookup, bounded by the node's read gas ceiling
constexpr std::size_t MAX_CHUNKS_PER_CALL = 120;
constexpr std::size_t HASH_FETCH_CONCURRENCY = 5;

// Hashes recorded on chain for one key, indexed by chunk id
struct RemoteChunkState {
  uint64_t chunk_count = 0;
  std::vector<Hash32> hashes;
};

// Compares local chunk hashes with the ones the directory contract holds
class DiffEngine {
public:
  // ---- CONSTRUCTOR ----
  DiffEngine(std::shared_ptr<chain::StorageContract> contract,
             chain::RetryPolicy retry = chain::RetryPolicy(),
             std::size_t concurrency = HASH_FETCH_CONCURRENCY);


  // ---- REMOTE STATE ----
  // Hashes for files whose chunk counts are already known
  std::map<std::string, std::vector<Hash32>> fetch_hashes(
      const std::vector<std::pair<std::string, uint64_t>>& files);
  // Looks up chunk counts first, then the hashes
  std::map<std::string, std::vector<Hash32>> fetch_hashes(const std::vector<std::string>& names);
  RemoteChunkState fetch_remote_state(const std::string& name, uint64_t chunk_count);


  // ---- COMPARISON ----
  // True only for an in-range index whose remote hash equals the local one
  static bool chunk_unchanged(const std::vector<Hash32>& remote, uint64_t index, const Hash32& local);
  // True when every hash of the batch starting at first_index is unchanged
  static bool batch_unchanged(const std::vector<Hash32>& remote, uint64_t first_index,
                              const std::vector<Hash32>& local);
  // Per-chunk flag, true where an upload is needed
  static std::vector<bool> changed_chunks(const std::vector<Hash32>& remote,
                                          const std::vector<Hash32>& local);


  // ---- SHRINKING ----
  // Sends a truncate when the new content has fewer chunks than stored.
  // Returns false if the truncate transaction failed on chain.
  bool truncate_if_shrinking(const std::string& name, uint64_t new_count, uint64_t old_count,
                             tx::Uploader& uploader, bool confirm_nonce);

private:
  std::shared_ptr<chain::StorageContract> contract_;
  chain::RetryPolicy retry_;
  std::size_t concurrency_;
};

} // namespace ethstorage::upload

#endif // ETHSTORAGE_UPLOAD_DIFF_ENGINE_HPP
