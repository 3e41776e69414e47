#ifndef ETHSTORAGE_KZG_COMMITMENT_ENGINE_HPP
#define ETHSTORAGE_KZG_COMMITMENT_ENGINE_HPP

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <vector>
#include "ethstorage/kzg/commitment_backend.hpp"

namespace ethstorage::kzg {

// Owns the commitment backend. The backend is built on first use; callers
// racing on that first use wait on one shared initialization. close()
// releases it and a later call builds a fresh one.
class CommitmentEngine {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // workers > 1 spreads batch operations over a thread pool
  explicit CommitmentEngine(BackendFactory factory, std::size_t workers = 1);
  ~CommitmentEngine();

  CommitmentEngine(const CommitmentEngine&) = delete;
  CommitmentEngine& operator=(const CommitmentEngine&) = delete;


  // ---- SINGLE BLOB ----
  Commitment commit(const blob::Blob& blob);
  Proof prove(const blob::Blob& blob, const Commitment& commitment);
  bool verify(const blob::Blob& blob, const Commitment& commitment, const Proof& proof);


  // ---- BATCH ----
  std::vector<Commitment> commit_batch(const std::vector<blob::Blob>& blobs);
  std::vector<Proof> prove_batch(const std::vector<blob::Blob>& blobs,
                                 const std::vector<Commitment>& commitments);
  bool verify_batch(const std::vector<blob::Blob>& blobs,
                    const std::vector<Commitment>& commitments,
                    const std::vector<Proof>& proofs);
  // Commits every blob and returns the hashes the storage contract keeps
  std::vector<Hash32> compute_storage_hashes(const std::vector<blob::Blob>& blobs);


  // ---- DERIVED HASHES ----
  // 0x01 || sha256(commitment)[1:32]
  static VersionedHash versioned_hash(const Commitment& commitment);
  // First 24 bytes of the versioned hash, zero-padded to 32 as the contract returns it
  static Hash32 storage_hash(const VersionedHash& versioned);
  static Hash32 storage_hash(const Commitment& commitment);


  // ---- LIFECYCLE ----
  // Idempotent; safe before any use. Must not race with in-flight operations.
  void close();
  bool initialized() const;
  // Number of successful backend constructions
  std::size_t initialization_count() const { return init_count_.load(); }

private:
  using BackendPtr = std::shared_ptr<CommitmentBackend>;

  // Get-or-init; rethrows the factory's error and leaves the engine retryable
  BackendPtr backend();

  BackendFactory factory_;
  std::size_t workers_;

  mutable std::mutex mutex_;
  std::shared_future<BackendPtr> init_;
  std::size_t generation_ = 0;
  std::atomic<std::size_t> init_count_{0};
};

} // namespace ethstorage::kzg

#endif // ETHSTORAGE_KZG_COMMITMENT_ENGINE_HPP
