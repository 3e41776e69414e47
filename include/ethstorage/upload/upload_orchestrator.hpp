#ifndef ETHSTORAGE_UPLOAD_UPLOAD_ORCHESTRATOR_HPP
#define ETHSTORAGE_UPLOAD_UPLOAD_ORCHESTRATOR_HPP

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "ethstorage/chain/retry.hpp"
#include "ethstorage/chain/storage_contract.hpp"
#include "ethstorage/tx/fee.hpp"
#include "ethstorage/tx/transaction_builder.hpp"
#include "ethstorage/tx/uploader.hpp"
#include "ethstorage/upload/chunk_planner.hpp"
#include "ethstorage/upload/diff_engine.hpp"
#include "ethstorage/upload/upload_types.hpp"

namespace ethstorage::upload {

struct UploadOptions {
  // Batches prepared at once on the unconfirmed-nonce path
  std::size_t concurrency = 0;
  std::size_t calldata_chunk_limit = tx::CALLDATA_FREE_LIMIT;
  chain::RetryPolicy retry;
};

// Drives a full upload of one key against a flat directory contract
class UploadOrchestrator {
public:
  // ---- CONSTRUCTOR ----
  // concurrency 0 picks the smaller of 4 and the hardware parallelism
  UploadOrchestrator(std::shared_ptr<chain::StorageContract> contract,
                     std::shared_ptr<tx::TransactionBuilder> builder,
                     std::shared_ptr<tx::Uploader> uploader,
                     UploadOptions options = UploadOptions());


  // ---- OPERATIONS ----
  // Never throws; failures go to on_fail followed by on_finish with the
  // totals gathered so far
  UploadOutcome upload(const UploadRequest& request, const UploadCallback& callback);
  CostEstimate estimate_cost(const EstimateRequest& request);

  DiffEngine& diff_engine() { return diff_; }
  std::size_t concurrency() const { return concurrency_; }

private:
  // What one batch or chunk contributed
  struct UnitOutcome {
    bool written = false;
    uint64_t last_index = 0;
    uint64_t chunks = 0;
    uint64_t bytes = 0;
    Wei storage_cost = 0;
    Wei gas_cost = 0;
  };

  // Shared state of one upload call
  struct UploadContext {
    const UploadRequest* request = nullptr;
    const UploadCallback* callback = nullptr;
    chain::UploadInfo info;
    std::vector<Hash32> remote;
    uint64_t total_chunks = 0;
    std::mutex mutex;
    UploadResult totals;
  };

  void validate(const std::string& key, chain::StorageMode mode) const;
  chain::UploadInfo load_info(const std::string& key, chain::StorageMode mode);
  std::vector<Hash32> load_remote_hashes(const std::string& key, uint64_t chunk_count,
                                         const std::optional<std::vector<Hash32>>& supplied);

  void upload_blobs(UploadContext& ctx);
  void upload_calldata(UploadContext& ctx);
  void run_sequential(UploadContext& ctx, const std::vector<ChunkBatch>& batches);
  void run_concurrent(UploadContext& ctx, const std::vector<ChunkBatch>& batches);

  UnitOutcome process_blob_batch(UploadContext& ctx, const ChunkBatch& batch);
  UnitOutcome process_calldata_chunk(UploadContext& ctx, const ChunkSpec& chunk);
  void record(UploadContext& ctx, const UnitOutcome& outcome);

  CostEstimate estimate_blobs(const EstimateRequest& request);
  CostEstimate estimate_calldata(const EstimateRequest& request);

  std::shared_ptr<chain::StorageContract> contract_;
  std::shared_ptr<tx::TransactionBuilder> builder_;
  std::shared_ptr<tx::Uploader> uploader_;
  UploadOptions options_;
  std::size_t concurrency_;
  DiffEngine diff_;
};

} // namespace ethstorage::upload

#endif // ETHSTORAGE_UPLOAD_UPLOAD_ORCHESTRATOR_HPP
