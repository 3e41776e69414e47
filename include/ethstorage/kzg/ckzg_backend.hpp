#ifndef ETHSTORAGE_KZG_CKZG_BACKEND_HPP
#define ETHSTORAGE_KZG_CKZG_BACKEND_HPP

#include <memory>
#include <mutex>
#include <string>
#include "ethstorage/kzg/commitment_backend.hpp"

namespace ethstorage::kzg {

// Backend bound to the c-kzg-4844 library. Loading the trusted setup is
// the expensive step the engine memoizes.
class CkzgBackend : public CommitmentBackend {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit CkzgBackend(const std::string& trusted_setup_path, uint64_t precompute = 0);
  ~CkzgBackend() override;

  Commitment blob_to_commitment(const blob::Blob& blob) override;
  Proof compute_blob_proof(const blob::Blob& blob, const Commitment& commitment) override;
  bool verify_blob_proof(const blob::Blob& blob, const Commitment& commitment,
                         const Proof& proof) override;

  // Frees the trusted setup; idempotent
  void release() override;

private:
  struct Settings;
  const Settings& settings() const;

  std::unique_ptr<Settings> settings_;
  std::mutex release_mutex_;
};

// Factory for CommitmentEngine loading the setup at the given path
BackendFactory make_ckzg_factory(const std::string& trusted_setup_path, uint64_t precompute = 0);

} // namespace ethstorage::kzg

#endif // ETHSTORAGE_KZG_CKZG_BACKEND_HPP
