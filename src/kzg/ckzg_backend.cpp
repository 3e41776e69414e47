#include "ethstorage/kzg/ckzg_backend.hpp"
#include <boost/log/trivial.hpp>
#include <cstdio>
#include <cstring>
#include <ckzg.h>

namespace ethstorage::kzg {

struct CkzgBackend::Settings {
  KZGSettings native;
  bool loaded = false;
};

namespace {

const ::Blob* as_native(const blob::Blob& blob) {
  static_assert(sizeof(::Blob) == blob::BLOB_SIZE, "c-kzg blob size mismatch");
  return reinterpret_cast<const ::Blob*>(blob.data());
}

Bytes48 to_bytes48(const std::array<uint8_t, 48>& in) {
  Bytes48 out;
  std::memcpy(out.bytes, in.data(), in.size());
  return out;
}

void check(C_KZG_RET ret, const char* operation) {
  if (ret != C_KZG_OK) {
    throw KzgError(std::string(operation) + " failed with code " + std::to_string(static_cast<int>(ret)));
  }
}

} // namespace

CkzgBackend::CkzgBackend(const std::string& trusted_setup_path, uint64_t precompute)
  : settings_(std::make_unique<Settings>()) {
  std::FILE* file = std::fopen(trusted_setup_path.c_str(), "r");
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "CkzgBackend: Cannot open trusted setup " << trusted_setup_path;
    throw KzgError("cannot open trusted setup: " + trusted_setup_path);
  }
  C_KZG_RET ret = load_trusted_setup_file(&settings_->native, file, precompute);
  std::fclose(file);
  check(ret, "load_trusted_setup_file");
  settings_->loaded = true;
  BOOST_LOG_TRIVIAL(info) << "CkzgBackend: Trusted setup loaded from " << trusted_setup_path;
}

CkzgBackend::~CkzgBackend() {
  release();
}

const CkzgBackend::Settings& CkzgBackend::settings() const {
  if (!settings_ || !settings_->loaded) {
    throw KzgError("trusted setup released");
  }
  return *settings_;
}

Commitment CkzgBackend::blob_to_commitment(const blob::Blob& blob) {
  KZGCommitment out;
  check(blob_to_kzg_commitment(&out, as_native(blob), &settings().native), "blob_to_kzg_commitment");
  Commitment commitment;
  std::memcpy(commitment.data(), out.bytes, commitment.size());
  return commitment;
}

Proof CkzgBackend::compute_blob_proof(const blob::Blob& blob, const Commitment& commitment) {
  Bytes48 commitment_bytes = to_bytes48(commitment);
  KZGProof out;
  check(compute_blob_kzg_proof(&out, as_native(blob), &commitment_bytes, &settings().native),
        "compute_blob_kzg_proof");
  Proof proof;
  std::memcpy(proof.data(), out.bytes, proof.size());
  return proof;
}

bool CkzgBackend::verify_blob_proof(const blob::Blob& blob, const Commitment& commitment,
                                    const Proof& proof) {
  Bytes48 commitment_bytes = to_bytes48(commitment);
  Bytes48 proof_bytes = to_bytes48(proof);
  bool ok = false;
  check(verify_blob_kzg_proof(&ok, as_native(blob), &commitment_bytes, &proof_bytes, &settings().native),
        "verify_blob_kzg_proof");
  return ok;
}

void CkzgBackend::release() {
  std::lock_guard<std::mutex> lock(release_mutex_);
  if (settings_ && settings_->loaded) {
    free_trusted_setup(&settings_->native);
    settings_->loaded = false;
    BOOST_LOG_TRIVIAL(debug) << "CkzgBackend: Trusted setup freed";
  }
}

BackendFactory make_ckzg_factory(const std::string& trusted_setup_path, uint64_t precompute) {
  return [trusted_setup_path, precompute]() -> std::unique_ptr<CommitmentBackend> {
    return std::make_unique<CkzgBackend>(trusted_setup_path, precompute);
  };
}

} // namespace ethstorage::kzg
