#ifndef ETHSTORAGE_UPLOAD_CHUNK_PLANNER_HPP
#define ETHSTORAGE_UPLOAD_CHUNK_PLANNER_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace ethstorage::upload {

// One contiguous range of the content
struct ChunkSpec {
  uint64_t id = 0;
  std::size_t offset = 0;
  std::size_t size = 0;
};

// Chunks submitted together in one transaction
struct ChunkBatch {
  std::size_t index = 0;
  std::vector<ChunkSpec> chunks;

  uint64_t first_id() const { return chunks.front().id; }
  uint64_t last_id() const { return chunks.back().id; }
  std::size_t offset() const { return chunks.front().offset; }
  std::size_t bytes() const;
  std::vector<uint64_t> ids() const;
  std::vector<uint64_t> sizes() const;
};

struct UploadPlan {
  std::size_t total_bytes = 0;
  std::size_t unit_capacity = 0;
  uint64_t chunk_count = 0;
  std::vector<ChunkBatch> batches;
};

// Splits a content length into fixed-capacity chunks and groups
// consecutive chunk ids into batches
class ChunkPlanner {
public:
  // ---- CONSTRUCTORS ----
  ChunkPlanner(std::size_t unit_capacity, std::size_t max_chunks_per_batch, uint64_t min_chunks = 0);

  // Compact blob capacity, three chunks per transaction; empty content has no chunks
  static ChunkPlanner for_blobs();
  // One chunk per transaction; empty content is still written as one empty chunk
  static ChunkPlanner for_calldata(std::size_t chunk_limit);


  // ---- PLANNING ----
  // ceil(length / capacity), at least min_chunks
  uint64_t chunk_count(std::size_t length) const;
  std::vector<ChunkSpec> chunks(std::size_t length) const;
  UploadPlan plan(std::size_t length) const;

  std::size_t unit_capacity() const { return unit_capacity_; }
  std::size_t max_chunks_per_batch() const { return max_chunks_per_batch_; }

private:
  std::size_t unit_capacity_;
  std::size_t max_chunks_per_batch_;
  uint64_t min_chunks_;
};

} // namespace ethstorage::upload

#endif // ETHSTORAGE_UPLOAD_CHUNK_PLANNER_HPP
