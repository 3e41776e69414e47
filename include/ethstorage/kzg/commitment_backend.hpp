#ifndef ETHSTORAGE_KZG_COMMITMENT_BACKEND_HPP
#define ETHSTORAGE_KZG_COMMITMENT_BACKEND_HPP

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "ethstorage/blob/blob.hpp"
#include "ethstorage/types.hpp"

namespace ethstorage::kzg {

constexpr std::size_t COMMITMENT_SIZE = 48;
constexpr std::size_t PROOF_SIZE = 48;
constexpr uint8_t VERSIONED_HASH_VERSION_KZG = 0x01;

using Commitment = std::array<uint8_t, COMMITMENT_SIZE>;
using Proof = std::array<uint8_t, PROOF_SIZE>;
using VersionedHash = Hash32;

class KzgError : public std::runtime_error {
public:
  explicit KzgError(const std::string& message)
    : std::runtime_error("KZG: " + message) {}
};

// Cryptographic primitive behind the commitment engine. Implementations
// own whatever setup they load and free it in release().
class CommitmentBackend {
public:
  virtual ~CommitmentBackend() = default;

  virtual Commitment blob_to_commitment(const blob::Blob& blob) = 0;
  virtual Proof compute_blob_proof(const blob::Blob& blob, const Commitment& commitment) = 0;
  virtual bool verify_blob_proof(const blob::Blob& blob, const Commitment& commitment,
                                 const Proof& proof) = 0;

  // Batch forms run sequentially unless overridden
  virtual std::vector<Commitment> blobs_to_commitments(const std::vector<blob::Blob>& blobs);
  virtual std::vector<Proof> compute_blob_proofs(const std::vector<blob::Blob>& blobs,
                                                 const std::vector<Commitment>& commitments);
  virtual bool verify_blob_proofs(const std::vector<blob::Blob>& blobs,
                                  const std::vector<Commitment>& commitments,
                                  const std::vector<Proof>& proofs);

  // Frees native resources; the backend is unusable afterwards
  virtual void release() {}
};

// Produces a ready backend; may be expensive (trusted setup load)
using BackendFactory = std::function<std::unique_ptr<CommitmentBackend>()>;

} // namespace ethstorage::kzg

#endif // ETHSTORAGE_KZG_COMMITMENT_BACKEND_HPP
