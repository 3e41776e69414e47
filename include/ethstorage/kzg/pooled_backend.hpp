#ifndef ETHSTORAGE_KZG_POOLED_BACKEND_HPP
#define ETHSTORAGE_KZG_POOLED_BACKEND_HPP

#include <memory>
#include <boost/asio/thread_pool.hpp>
#include "ethstorage/kzg/commitment_backend.hpp"

namespace ethstorage::kzg {

// Decorator fanning batch operations out over a worker pool.
// The wrapped backend must tolerate concurrent single-blob calls.
class PooledBackend : public CommitmentBackend {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  PooledBackend(std::unique_ptr<CommitmentBackend> inner, std::size_t workers);
  ~PooledBackend() override;


  // ---- SINGLE BLOB ----
  Commitment blob_to_commitment(const blob::Blob& blob) override;
  Proof compute_blob_proof(const blob::Blob& blob, const Commitment& commitment) override;
  bool verify_blob_proof(const blob::Blob& blob, const Commitment& commitment,
                         const Proof& proof) override;


  // ---- BATCH ----
  std::vector<Commitment> blobs_to_commitments(const std::vector<blob::Blob>& blobs) override;
  std::vector<Proof> compute_blob_proofs(const std::vector<blob::Blob>& blobs,
                                         const std::vector<Commitment>& commitments) override;
  bool verify_blob_proofs(const std::vector<blob::Blob>& blobs,
                          const std::vector<Commitment>& commitments,
                          const std::vector<Proof>& proofs) override;

  // Joins the pool, then releases the wrapped backend
  void release() override;

  std::size_t workers() const { return workers_; }

private:
  std::unique_ptr<CommitmentBackend> inner_;
  std::size_t workers_;
  std::unique_ptr<boost::asio::thread_pool> pool_;
};

} // namespace ethstorage::kzg

#endif // ETHSTORAGE_KZG_POOLED_BACKEND_HPP
