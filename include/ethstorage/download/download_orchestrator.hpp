#ifndef ETHSTORAGE_DOWNLOAD_DOWNLOAD_ORCHESTRATOR_HPP
#define ETHSTORAGE_DOWNLOAD_DOWNLOAD_ORCHESTRATOR_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include "ethstorage/chain/retry.hpp"
#include "ethstorage/chain/storage_contract.hpp"

namespace ethstorage::download {

constexpr std::size_t MIN_DOWNLOAD_CONCURRENCY = 2;
constexpr std::size_t MAX_DOWNLOAD_CONCURRENCY = 20;

// Chunks arrive in ascending index order; on_finish fires only after the
// whole range was delivered, on_fail at most once and ends the download
struct DownloadCallback {
  std::function<void(uint64_t index, uint64_t total, const Bytes& data)> on_progress;
  std::function<void(const std::string& error)> on_fail;
  std::function<void()> on_finish;
};

class DownloadOrchestrator {
public:
  // ---- CONSTRUCTOR ----
  // concurrency 0 derives it from the hardware, clamped to [2, 20]
  explicit DownloadOrchestrator(std::shared_ptr<chain::StorageContract> reader,
                                chain::RetryPolicy retry = chain::RetryPolicy(),
                                std::size_t concurrency = 0);


  // ---- OPERATIONS ----
  // Never throws; returns true when on_finish was reached
  bool download(const std::string& key, const DownloadCallback& callback);
  // Concatenated content; throws on the first failed fetch
  Bytes download_all(const std::string& key);

  std::size_t concurrency() const { return concurrency_; }

private:
  std::shared_ptr<chain::StorageContract> reader_;
  chain::RetryPolicy retry_;
  std::size_t concurrency_;
};

} // namespace ethstorage::download

#endif // ETHSTORAGE_DOWNLOAD_DOWNLOAD_ORCHESTRATOR_HPP
