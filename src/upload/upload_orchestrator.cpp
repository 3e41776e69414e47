#include "ethstorage/upload/upload_orchestrator.hpp"
#include "ethstorage/blob/blob_codec.hpp"
#include "ethstorage/crypto/hash.hpp"
#include "ethstorage/errors.hpp"
#include "ethstorage/utils/ordered_buffer.hpp"
#include "ethstorage/utils/task_pool.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <atomic>
#include <stdexcept>

namespace ethstorage::upload {

namespace {

constexpr std::size_t MAX_DEFAULT_CONCURRENCY = 4;

Bytes slice(const Bytes& content, std::size_t offset, std::size_t size) {
  return Bytes(content.begin() + offset, content.begin() + offset + size);
}

std::vector<Hash32> storage_hashes(const std::vector<kzg::Commitment>& commitments) {
  std::vector<Hash32> hashes;
  hashes.reserve(commitments.size());
  for (const auto& commitment : commitments) {
    hashes.push_back(kzg::CommitmentEngine::storage_hash(commitment));
  }
  return hashes;
}

std::string describe_ids(const std::vector<uint64_t>& ids) {
  std::string out;
  for (std::size_t i = 0; i < ids.size(); ++i) {
    if (i > 0) out += ",";
    out += std::to_string(ids[i]);
  }
  return out;
}

} // namespace

UploadOrchestrator::UploadOrchestrator(std::shared_ptr<chain::StorageContract> contract,
                                       std::shared_ptr<tx::TransactionBuilder> builder,
                                       std::shared_ptr<tx::Uploader> uploader,
                                       UploadOptions options)
  : contract_(std::move(contract))
  , builder_(std::move(builder))
  , uploader_(std::move(uploader))
  , options_(std::move(options))
  , concurrency_(options_.concurrency > 0
                   ? options_.concurrency
                   : utils::TaskPool::default_concurrency(1, MAX_DEFAULT_CONCURRENCY))
  , diff_(contract_, options_.retry) {
  if (!builder_ || !uploader_) {
    throw std::invalid_argument("UploadOrchestrator: transaction builder and uploader are required");
  }
}

//==============================================
// UPLOAD
//==============================================

UploadOutcome UploadOrchestrator::upload(const UploadRequest& request, const UploadCallback& callback) {
  UploadContext ctx;
  ctx.request = &request;
  ctx.callback = &callback;

  UploadOutcome outcome;
  try {
    validate(request.key, request.mode);
    switch (request.mode) {
      case chain::StorageMode::Blob:
        upload_blobs(ctx);
        break;
      case chain::StorageMode::Calldata:
        upload_calldata(ctx);
        break;
      case chain::StorageMode::Undefined:
        throw ValidationError("upload mode must be blob or calldata");
    }
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "UploadOrchestrator: Upload of " << request.key << " failed: " << e.what();
    outcome.error = e.what();
    if (callback.on_fail) {
      callback.on_fail(e.what());
    }
  }

  {
    std::lock_guard<std::mutex> lock(ctx.mutex);
    outcome.result = ctx.totals;
  }
  BOOST_LOG_TRIVIAL(info) << "UploadOrchestrator: Finished " << request.key << ": "
                          << outcome.result.total_chunks << " chunk(s), "
                          << outcome.result.total_bytes << " byte(s) written";
  if (callback.on_finish) {
    callback.on_finish(outcome.result);
  }
  return outcome;
}

void UploadOrchestrator::validate(const std::string& key, chain::StorageMode mode) const {
  if (key.empty()) {
    throw ValidationError("invalid key");
  }
  if (mode == chain::StorageMode::Undefined) {
    throw ValidationError("upload mode must be blob or calldata");
  }
}

chain::UploadInfo UploadOrchestrator::load_info(const std::string& key, chain::StorageMode mode) {
  chain::UploadInfo info =
    options_.retry.run([this, &key]() { return contract_->get_upload_info(key); }, "get_upload_info");

  switch (info.mode) {
    case chain::StorageMode::Undefined:
      break;
    case chain::StorageMode::Calldata:
    case chain::StorageMode::Blob:
      if (info.mode != mode) {
        throw CapabilityError(std::string("this file does not support ") +
                              (mode == chain::StorageMode::Blob ? "blob" : "calldata") + " upload");
      }
      break;
  }

  BOOST_LOG_TRIVIAL(debug) << "UploadOrchestrator: " << key << " holds " << info.chunk_count
                           << " chunk(s) in " << chain::storage_mode_to_string(info.mode) << " mode";
  return info;
}

std::vector<Hash32> UploadOrchestrator::load_remote_hashes(const std::string& key, uint64_t chunk_count,
                                                           const std::optional<std::vector<Hash32>>& supplied) {
  if (supplied) {
    return *supplied;
  }
  return diff_.fetch_remote_state(key, chunk_count).hashes;
}

void UploadOrchestrator::upload_blobs(UploadContext& ctx) {
  const UploadRequest& request = *ctx.request;

  bool supported = options_.retry.run([this]() { return contract_->is_blob_mode_supported(); },
                                      "is_blob_mode_supported");
  if (!supported) {
    throw CapabilityError("the contract does not support blob upload");
  }

  UploadPlan plan = ChunkPlanner::for_blobs().plan(request.content.size());
  ctx.total_chunks = plan.chunk_count;
  ctx.info = load_info(request.key, chain::StorageMode::Blob);

  if (!diff_.truncate_if_shrinking(request.key, plan.chunk_count, ctx.info.chunk_count,
                                   *uploader_, request.confirm_nonce)) {
    throw EthStorageError("failed to truncate old data");
  }
  ctx.remote = load_remote_hashes(request.key, ctx.info.chunk_count, request.chunk_hashes);

  BOOST_LOG_TRIVIAL(info) << "UploadOrchestrator: Uploading " << request.key << " as "
                          << plan.chunk_count << " blob chunk(s) in " << plan.batches.size() << " batch(es)";
  if (request.confirm_nonce) {
    run_sequential(ctx, plan.batches);
  } else {
    run_concurrent(ctx, plan.batches);
  }
}

void UploadOrchestrator::run_sequential(UploadContext& ctx, const std::vector<ChunkBatch>& batches) {
  for (const auto& batch : batches) {
    UnitOutcome outcome = process_blob_batch(ctx, batch);
    record(ctx, outcome);
    if (ctx.callback->on_progress) {
      ctx.callback->on_progress(outcome.last_index, ctx.total_chunks, outcome.written);
    }
  }
}

void UploadOrchestrator::run_concurrent(UploadContext& ctx, const std::vector<ChunkBatch>& batches) {
  if (batches.empty()) {
    return;
  }

  std::atomic<bool> failed{false};
  std::mutex error_mutex;
  std::exception_ptr first_error;

  utils::OrderedBuffer<UnitOutcome> progress(0, [&ctx](std::size_t, UnitOutcome&& outcome) {
    if (ctx.callback->on_progress) {
      ctx.callback->on_progress(outcome.last_index, ctx.total_chunks, outcome.written);
    }
  });

  utils::TaskPool pool(std::min(concurrency_, batches.size()));
  for (const auto& batch : batches) {
    pool.submit([this, &ctx, &batch, &failed, &error_mutex, &first_error, &progress]() {
      // Work not yet started stops after a failure; batches in flight finish
      if (failed.load()) {
        BOOST_LOG_TRIVIAL(debug) << "UploadOrchestrator: Skipping batch " << batch.index << " after failure";
        return;
      }
      try {
        UnitOutcome outcome = process_blob_batch(ctx, batch);
        record(ctx, outcome);
        progress.push(batch.index, std::move(outcome));
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "UploadOrchestrator: Batch " << batch.index << " failed: " << e.what();
        std::lock_guard<std::mutex> lock(error_mutex);
        if (!first_error) {
          first_error = std::current_exception();
        }
        failed.store(true);
      }
    });
  }
  pool.wait();

  if (first_error) {
    std::rethrow_exception(first_error);
  }
}

UploadOrchestrator::UnitOutcome UploadOrchestrator::process_blob_batch(UploadContext& ctx, const ChunkBatch& batch) {
  const UploadRequest& request = *ctx.request;
  UnitOutcome outcome;
  outcome.last_index = batch.last_id();

  blob::CompactBlobCodec codec;
  std::vector<blob::Blob> blobs = codec.encode(slice(request.content, batch.offset(), batch.bytes()));
  std::vector<kzg::Commitment> commitments = builder_->engine()->commit_batch(blobs);

  if (DiffEngine::batch_unchanged(ctx.remote, batch.first_id(), storage_hashes(commitments))) {
    BOOST_LOG_TRIVIAL(debug) << "UploadOrchestrator: Chunks " << describe_ids(batch.ids()) << " unchanged";
    return outcome;
  }

  const Wei value = ctx.info.cost_per_chunk * batch.chunks.size();
  chain::TransactionRequest tx = contract_->write_chunks_by_blobs(request.key, batch.ids(), batch.sizes(), value);
  tx = builder_->build_blob_tx(std::move(tx), std::move(blobs), commitments, request.gas_increase_pct);
  tx::TransactionResult result = uploader_->submit_and_wait(std::move(tx), request.confirm_nonce);
  BOOST_LOG_TRIVIAL(info) << "UploadOrchestrator: The transaction hash for chunks " << describe_ids(batch.ids())
                          << " is " << result.hash;
  if (!result.success) {
    throw TransactionFailure(result.hash, "sending transaction failed");
  }

  outcome.written = true;
  outcome.chunks = batch.chunks.size();
  outcome.bytes = batch.bytes();
  outcome.storage_cost = value;
  outcome.gas_cost = result.cost;
  return outcome;
}

void UploadOrchestrator::upload_calldata(UploadContext& ctx) {
  const UploadRequest& request = *ctx.request;

  UploadPlan plan = ChunkPlanner::for_calldata(options_.calldata_chunk_limit).plan(request.content.size());
  ctx.total_chunks = plan.chunk_count;
  ctx.info = load_info(request.key, chain::StorageMode::Calldata);

  if (!diff_.truncate_if_shrinking(request.key, plan.chunk_count, ctx.info.chunk_count,
                                   *uploader_, request.confirm_nonce)) {
    throw EthStorageError("failed to truncate old data");
  }
  ctx.remote = load_remote_hashes(request.key, ctx.info.chunk_count, request.chunk_hashes);

  BOOST_LOG_TRIVIAL(info) << "UploadOrchestrator: Uploading " << request.key << " as "
                          << plan.chunk_count << " calldata chunk(s)";
  for (const auto& batch : plan.batches) {
    for (const auto& chunk : batch.chunks) {
      UnitOutcome outcome = process_calldata_chunk(ctx, chunk);
      record(ctx, outcome);
      if (ctx.callback->on_progress) {
        ctx.callback->on_progress(outcome.last_index, ctx.total_chunks, outcome.written);
      }
    }
  }
}

UploadOrchestrator::UnitOutcome UploadOrchestrator::process_calldata_chunk(UploadContext& ctx, const ChunkSpec& chunk) {
  const UploadRequest& request = *ctx.request;
  UnitOutcome outcome;
  outcome.last_index = chunk.id;

  Bytes data = slice(request.content, chunk.offset, chunk.size);
  if (DiffEngine::chunk_unchanged(ctx.remote, chunk.id, crypto::keccak256(data))) {
    BOOST_LOG_TRIVIAL(debug) << "UploadOrchestrator: Chunk " << chunk.id << " unchanged";
    return outcome;
  }

  const Wei stake = tx::calldata_stake(data.size());
  chain::TransactionRequest tx = contract_->write_chunk_by_calldata(request.key, chunk.id, data, stake);
  builder_->apply_gas_increase(tx, request.gas_increase_pct);
  tx::TransactionResult result = uploader_->submit_and_wait(std::move(tx), request.confirm_nonce);
  BOOST_LOG_TRIVIAL(info) << "UploadOrchestrator: The transaction hash for chunk " << chunk.id
                          << " is " << result.hash;
  if (!result.success) {
    throw TransactionFailure(result.hash, "sending transaction failed");
  }

  outcome.written = true;
  outcome.chunks = 1;
  outcome.bytes = chunk.size;
  outcome.storage_cost = stake;
  outcome.gas_cost = result.cost;
  return outcome;
}

void UploadOrchestrator::record(UploadContext& ctx, const UnitOutcome& outcome) {
  if (!outcome.written) {
    return;
  }
  std::lock_guard<std::mutex> lock(ctx.mutex);
  ctx.totals.total_chunks += outcome.chunks;
  ctx.totals.total_bytes += outcome.bytes;
  ctx.totals.total_cost += outcome.storage_cost;
  ctx.totals.total_gas_cost += outcome.gas_cost;
}

//==============================================
// COST ESTIMATION
//==============================================

CostEstimate UploadOrchestrator::estimate_cost(const EstimateRequest& request) {
  validate(request.key, request.mode);
  switch (request.mode) {
    case chain::StorageMode::Blob:
      return estimate_blobs(request);
    case chain::StorageMode::Calldata:
      return estimate_calldata(request);
    case chain::StorageMode::Undefined:
      break;
  }
  throw ValidationError("upload mode must be blob or calldata");
}

CostEstimate UploadOrchestrator::estimate_blobs(const EstimateRequest& request) {
  bool supported = options_.retry.run([this]() { return contract_->is_blob_mode_supported(); },
                                      "is_blob_mode_supported");
  if (!supported) {
    throw CapabilityError("the contract does not support blob upload");
  }

  UploadPlan plan = ChunkPlanner::for_blobs().plan(request.content.size());
  chain::UploadInfo info = load_info(request.key, chain::StorageMode::Blob);
  std::vector<Hash32> remote = load_remote_hashes(request.key, info.chunk_count, request.chunk_hashes);
  const Wei blob_gas_price = builder_->blob_gas_price();
  const chain::FeeData fees = builder_->fee_data();

  CostEstimate estimate;
  uint64_t gas_limit = 0;
  blob::CompactBlobCodec codec;
  for (const auto& batch : plan.batches) {
    std::vector<blob::Blob> blobs = codec.encode(slice(request.content, batch.offset(), batch.bytes()));
    std::vector<kzg::Commitment> commitments = builder_->engine()->commit_batch(blobs);
    if (DiffEngine::batch_unchanged(remote, batch.first_id(), storage_hashes(commitments))) {
      continue;
    }

    const Wei value = info.cost_per_chunk * batch.chunks.size();
    estimate.storage_cost += value;
    if (gas_limit == 0) {
      chain::TransactionRequest tx = contract_->write_chunks_by_blobs(request.key, batch.ids(), batch.sizes(), value);
      tx.type = chain::BLOB_TX_TYPE;
      for (const auto& commitment : commitments) {
        tx.blob_versioned_hashes.push_back(kzg::CommitmentEngine::versioned_hash(commitment));
      }
      gas_limit = builder_->estimate_gas(tx);
    }
    estimate.gas_cost += (fees.max_fee_per_gas + fees.max_priority_fee_per_gas) * gas_limit +
                         blob_gas_price * blob::BLOB_SIZE;
  }

  estimate.gas_cost += tx::pct_of(estimate.gas_cost, request.gas_increase_pct);
  return estimate;
}

CostEstimate UploadOrchestrator::estimate_calldata(const EstimateRequest& request) {
  UploadPlan plan = ChunkPlanner::for_calldata(options_.calldata_chunk_limit).plan(request.content.size());
  chain::UploadInfo info = load_info(request.key, chain::StorageMode::Calldata);
  std::vector<Hash32> remote = load_remote_hashes(request.key, info.chunk_count, request.chunk_hashes);
  const chain::FeeData fees = builder_->fee_data();

  CostEstimate estimate;
  uint64_t gas_limit = 0;
  for (const auto& batch : plan.batches) {
    for (const auto& chunk : batch.chunks) {
      Bytes data = slice(request.content, chunk.offset, chunk.size);
      if (DiffEngine::chunk_unchanged(remote, chunk.id, crypto::keccak256(data))) {
        continue;
      }

      const Wei stake = tx::calldata_stake(data.size());
      // The final chunk is usually shorter, so it gets its own estimate
      if (gas_limit == 0 || chunk.id + 1 == plan.chunk_count) {
        chain::TransactionRequest tx = contract_->write_chunk_by_calldata(request.key, chunk.id, data, stake);
        gas_limit = builder_->estimate_gas(tx);
      }
      estimate.storage_cost += stake;
      estimate.gas_cost += (fees.max_fee_per_gas + fees.max_priority_fee_per_gas) * gas_limit;
    }
  }

  estimate.gas_cost += tx::pct_of(estimate.gas_cost, request.gas_increase_pct);
  return estimate;
}

} // namespace ethstorage::upload
