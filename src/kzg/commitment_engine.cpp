#include "ethstorage/kzg/commitment_engine.hpp"
#include "ethstorage/kzg/pooled_backend.hpp"
#include "ethstorage/crypto/hash.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <chrono>

namespace ethstorage::kzg {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CommitmentEngine::CommitmentEngine(BackendFactory factory, std::size_t workers)
  : factory_(std::move(factory))
  , workers_(workers) {
  if (!factory_) {
    throw KzgError("commitment engine requires a backend factory");
  }
}

CommitmentEngine::~CommitmentEngine() {
  close();
}

//==============================================
// LIFECYCLE
//==============================================

CommitmentEngine::BackendPtr CommitmentEngine::backend() {
  std::shared_future<BackendPtr> pending;
  std::promise<BackendPtr> promise;
  bool owner = false;
  std::size_t generation = 0;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!init_.valid()) {
      init_ = promise.get_future().share();
      generation = ++generation_;
      owner = true;
    }
    pending = init_;
  }

  if (owner) {
    BOOST_LOG_TRIVIAL(info) << "CommitmentEngine: Initializing commitment backend";
    // Hands the failure to every waiter and clears only our own attempt so
    // the next caller retries
    auto fail = [&]() {
      promise.set_exception(std::current_exception());
      std::lock_guard<std::mutex> lock(mutex_);
      if (generation_ == generation) {
        init_ = std::shared_future<BackendPtr>();
      }
    };
    try {
      std::unique_ptr<CommitmentBackend> made = factory_();
      if (!made) {
        throw KzgError("backend factory returned no backend");
      }
      if (workers_ > 1) {
        made = std::make_unique<PooledBackend>(std::move(made), workers_);
      }
      init_count_.fetch_add(1);
      promise.set_value(BackendPtr(std::move(made)));
      BOOST_LOG_TRIVIAL(info) << "CommitmentEngine: Backend ready";
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "CommitmentEngine: Backend initialization failed: " << e.what();
      fail();
    } catch (...) {
      BOOST_LOG_TRIVIAL(error) << "CommitmentEngine: Backend initialization failed with unknown error";
      fail();
    }
  }

  return pending.get();
}

void CommitmentEngine::close() {
  std::shared_future<BackendPtr> current;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    current = init_;
    init_ = std::shared_future<BackendPtr>();
  }
  if (!current.valid()) {
    return;
  }

  BackendPtr backend;
  try {
    backend = current.get();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(debug) << "CommitmentEngine: Nothing to release after failed init: " << e.what();
    return;
  }
  if (backend) {
    backend->release();
    BOOST_LOG_TRIVIAL(info) << "CommitmentEngine: Backend released";
  }
}

bool CommitmentEngine::initialized() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return init_.valid() &&
         init_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

//==============================================
// OPERATIONS
//==============================================

Commitment CommitmentEngine::commit(const blob::Blob& blob) {
  return backend()->blob_to_commitment(blob);
}

Proof CommitmentEngine::prove(const blob::Blob& blob, const Commitment& commitment) {
  return backend()->compute_blob_proof(blob, commitment);
}

bool CommitmentEngine::verify(const blob::Blob& blob, const Commitment& commitment, const Proof& proof) {
  return backend()->verify_blob_proof(blob, commitment, proof);
}

std::vector<Commitment> CommitmentEngine::commit_batch(const std::vector<blob::Blob>& blobs) {
  if (blobs.empty()) return {};
  return backend()->blobs_to_commitments(blobs);
}

std::vector<Proof> CommitmentEngine::prove_batch(const std::vector<blob::Blob>& blobs,
                                                 const std::vector<Commitment>& commitments) {
  if (blobs.size() != commitments.size()) {
    throw KzgError("cannot prove " + std::to_string(blobs.size()) + " blobs with " +
                   std::to_string(commitments.size()) + " commitments");
  }
  if (blobs.empty()) return {};
  return backend()->compute_blob_proofs(blobs, commitments);
}

bool CommitmentEngine::verify_batch(const std::vector<blob::Blob>& blobs,
                                    const std::vector<Commitment>& commitments,
                                    const std::vector<Proof>& proofs) {
  if (blobs.size() != commitments.size() || blobs.size() != proofs.size()) {
    throw KzgError("batch verification needs equal numbers of blobs, commitments and proofs");
  }
  if (blobs.empty()) return true;
  return backend()->verify_blob_proofs(blobs, commitments, proofs);
}

std::vector<Hash32> CommitmentEngine::compute_storage_hashes(const std::vector<blob::Blob>& blobs) {
  std::vector<Hash32> hashes;
  hashes.reserve(blobs.size());
  for (const auto& commitment : commit_batch(blobs)) {
    hashes.push_back(storage_hash(commitment));
  }
  return hashes;
}

//==============================================
// DERIVED HASHES
//==============================================

VersionedHash CommitmentEngine::versioned_hash(const Commitment& commitment) {
  VersionedHash hash = crypto::sha256(commitment.data(), commitment.size());
  hash[0] = VERSIONED_HASH_VERSION_KZG;
  return hash;
}

Hash32 CommitmentEngine::storage_hash(const VersionedHash& versioned) {
  Hash32 hash{};
  std::copy(versioned.begin(), versioned.begin() + 24, hash.begin());
  return hash;
}

Hash32 CommitmentEngine::storage_hash(const Commitment& commitment) {
  return storage_hash(versioned_hash(commitment));
}

} // namespace ethstorage::kzg
