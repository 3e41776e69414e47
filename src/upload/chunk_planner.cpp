#include "ethstorage/upload/chunk_planner.hpp"
#include "ethstorage/blob/blob.hpp"
#include <algorithm>
#include <stdexcept>

namespace ethstorage::upload {

std::size_t ChunkBatch::bytes() const {
  std::size_t total = 0;
  for (const auto& chunk : chunks) total += chunk.size;
  return total;
}

std::vector<uint64_t> ChunkBatch::ids() const {
  std::vector<uint64_t> out;
  out.reserve(chunks.size());
  for (const auto& chunk : chunks) out.push_back(chunk.id);
  return out;
}

std::vector<uint64_t> ChunkBatch::sizes() const {
  std::vector<uint64_t> out;
  out.reserve(chunks.size());
  for (const auto& chunk : chunks) out.push_back(chunk.size);
  return out;
}

ChunkPlanner::ChunkPlanner(std::size_t unit_capacity, std::size_t max_chunks_per_batch, uint64_t min_chunks)
  : unit_capacity_(unit_capacity)
  , max_chunks_per_batch_(max_chunks_per_batch)
  , min_chunks_(min_chunks) {
  if (unit_capacity_ == 0 || max_chunks_per_batch_ == 0) {
    throw std::invalid_argument("ChunkPlanner: capacity and batch size must be positive");
  }
}

ChunkPlanner ChunkPlanner::for_blobs() {
  return ChunkPlanner(blob::COMPACT_BLOB_DATA_SIZE, blob::MAX_BLOBS_PER_BATCH);
}

ChunkPlanner ChunkPlanner::for_calldata(std::size_t chunk_limit) {
  return ChunkPlanner(chunk_limit, 1, 1);
}

uint64_t ChunkPlanner::chunk_count(std::size_t length) const {
  const uint64_t count = (length + unit_capacity_ - 1) / unit_capacity_;
  return std::max(count, min_chunks_);
}

std::vector<ChunkSpec> ChunkPlanner::chunks(std::size_t length) const {
  std::vector<ChunkSpec> out;
  const uint64_t count = chunk_count(length);
  out.reserve(count);
  for (uint64_t id = 0; id < count; ++id) {
    ChunkSpec chunk;
    chunk.id = id;
    chunk.offset = static_cast<std::size_t>(id) * unit_capacity_;
    chunk.size = chunk.offset < length ? std::min(unit_capacity_, length - chunk.offset) : 0;
    out.push_back(chunk);
  }
  return out;
}

UploadPlan ChunkPlanner::plan(std::size_t length) const {
  UploadPlan plan;
  plan.total_bytes = length;
  plan.unit_capacity = unit_capacity_;
  plan.chunk_count = chunk_count(length);

  std::vector<ChunkSpec> all = chunks(length);
  for (std::size_t i = 0; i < all.size(); i += max_chunks_per_batch_) {
    ChunkBatch batch;
    batch.index = plan.batches.size();
    std::size_t end = std::min(all.size(), i + max_chunks_per_batch_);
    batch.chunks.assign(all.begin() + i, all.begin() + end);
    plan.batches.push_back(std::move(batch));
  }
  return plan;
}

} // namespace ethstorage::upload
