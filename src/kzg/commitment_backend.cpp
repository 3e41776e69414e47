#include "ethstorage/kzg/commitment_backend.hpp"

namespace ethstorage::kzg {

std::vector<Commitment> CommitmentBackend::blobs_to_commitments(const std::vector<blob::Blob>& blobs) {
  std::vector<Commitment> commitments;
  commitments.reserve(blobs.size());
  for (const auto& blob : blobs) {
    commitments.push_back(blob_to_commitment(blob));
  }
  return commitments;
}

std::vector<Proof> CommitmentBackend::compute_blob_proofs(const std::vector<blob::Blob>& blobs,
                                                          const std::vector<Commitment>& commitments) {
  if (blobs.size() != commitments.size()) {
    throw KzgError("blob and commitment counts differ");
  }
  std::vector<Proof> proofs;
  proofs.reserve(blobs.size());
  for (std::size_t i = 0; i < blobs.size(); ++i) {
    proofs.push_back(compute_blob_proof(blobs[i], commitments[i]));
  }
  return proofs;
}

bool CommitmentBackend::verify_blob_proofs(const std::vector<blob::Blob>& blobs,
                                           const std::vector<Commitment>& commitments,
                                           const std::vector<Proof>& proofs) {
  if (blobs.size() != commitments.size() || blobs.size() != proofs.size()) {
    throw KzgError("blob, commitment and proof counts differ");
  }
  for (std::size_t i = 0; i < blobs.size(); ++i) {
    if (!verify_blob_proof(blobs[i], commitments[i], proofs[i])) {
      return false;
    }
  }
  return true;
}

} // namespace ethstorage::kzg
