#include "ethstorage/kzg/pooled_backend.hpp"
#include <boost/asio/post.hpp>
#include <boost/log/trivial.hpp>
#include <future>

namespace ethstorage::kzg {

namespace {

// Runs fn(i) for every index on the pool and gathers results in index order.
// The first failure is rethrown after all items settle.
template <typename R, typename Fn>
std::vector<R> parallel_map(boost::asio::thread_pool& pool, std::size_t count, Fn fn) {
  std::vector<std::future<R>> futures;
  futures.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    auto task = std::make_shared<std::packaged_task<R()>>([fn, i]() { return fn(i); });
    futures.push_back(task->get_future());
    boost::asio::post(pool, [task]() { (*task)(); });
  }

  std::vector<R> results;
  results.reserve(count);
  std::exception_ptr first_error;
  for (auto& future : futures) {
    try {
      results.push_back(future.get());
    } catch (const std::exception&) {
      if (!first_error) first_error = std::current_exception();
    }
  }
  if (first_error) {
    std::rethrow_exception(first_error);
  }
  return results;
}

} // namespace

PooledBackend::PooledBackend(std::unique_ptr<CommitmentBackend> inner, std::size_t workers)
  : inner_(std::move(inner))
  , workers_(workers == 0 ? 1 : workers)
  , pool_(std::make_unique<boost::asio::thread_pool>(workers_)) {
  if (!inner_) {
    throw KzgError("pooled backend requires an inner backend");
  }
  BOOST_LOG_TRIVIAL(info) << "PooledBackend: Started with " << workers_ << " worker(s)";
}

PooledBackend::~PooledBackend() {
  release();
}

Commitment PooledBackend::blob_to_commitment(const blob::Blob& blob) {
  return inner_->blob_to_commitment(blob);
}

Proof PooledBackend::compute_blob_proof(const blob::Blob& blob, const Commitment& commitment) {
  return inner_->compute_blob_proof(blob, commitment);
}

bool PooledBackend::verify_blob_proof(const blob::Blob& blob, const Commitment& commitment,
                                      const Proof& proof) {
  return inner_->verify_blob_proof(blob, commitment, proof);
}

std::vector<Commitment> PooledBackend::blobs_to_commitments(const std::vector<blob::Blob>& blobs) {
  if (!pool_) throw KzgError("backend released");
  CommitmentBackend* inner = inner_.get();
  return parallel_map<Commitment>(*pool_, blobs.size(), [inner, &blobs](std::size_t i) {
    return inner->blob_to_commitment(blobs[i]);
  });
}

std::vector<Proof> PooledBackend::compute_blob_proofs(const std::vector<blob::Blob>& blobs,
                                                      const std::vector<Commitment>& commitments) {
  if (!pool_) throw KzgError("backend released");
  if (blobs.size() != commitments.size()) {
    throw KzgError("blob and commitment counts differ");
  }
  CommitmentBackend* inner = inner_.get();
  return parallel_map<Proof>(*pool_, blobs.size(), [inner, &blobs, &commitments](std::size_t i) {
    return inner->compute_blob_proof(blobs[i], commitments[i]);
  });
}

bool PooledBackend::verify_blob_proofs(const std::vector<blob::Blob>& blobs,
                                       const std::vector<Commitment>& commitments,
                                       const std::vector<Proof>& proofs) {
  if (!pool_) throw KzgError("backend released");
  if (blobs.size() != commitments.size() || blobs.size() != proofs.size()) {
    throw KzgError("blob, commitment and proof counts differ");
  }
  CommitmentBackend* inner = inner_.get();
  auto results = parallel_map<bool>(*pool_, blobs.size(),
      [inner, &blobs, &commitments, &proofs](std::size_t i) {
        return inner->verify_blob_proof(blobs[i], commitments[i], proofs[i]);
      });
  for (bool ok : results) {
    if (!ok) return false;
  }
  return true;
}

void PooledBackend::release() {
  if (pool_) {
    pool_->join();
    pool_.reset();
    BOOST_LOG_TRIVIAL(debug) << "PooledBackend: Worker pool joined";
  }
  if (inner_) {
    inner_->release();
  }
}

} // namespace ethstorage::kzg
