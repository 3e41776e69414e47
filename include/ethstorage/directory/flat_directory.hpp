#ifndef ETHSTORAGE_DIRECTORY_FLAT_DIRECTORY_HPP
#define ETHSTORAGE_DIRECTORY_FLAT_DIRECTORY_HPP

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "ethstorage/chain/chain_binding.hpp"
#include "ethstorage/config/sdk_config.hpp"
#include "ethstorage/download/download_orchestrator.hpp"
#include "ethstorage/kzg/commitment_engine.hpp"
#include "ethstorage/upload/upload_orchestrator.hpp"

namespace ethstorage::directory {

// Files stored under string keys in one flat directory contract
class FlatDirectory {
public:
  struct Components {
    std::optional<Address> address;
    // Contract seen through the signing client; null when read-only
    std::shared_ptr<chain::StorageContract> writer;
    // Contract seen through the storage network endpoint; null without one
    std::shared_ptr<chain::StorageContract> reader;
    std::shared_ptr<kzg::CommitmentEngine> engine;
    std::shared_ptr<tx::TransactionBuilder> builder;
    std::shared_ptr<tx::Uploader> uploader;
    bool blob_supported = false;
  };

  // ---- CONSTRUCTION ----
  // Connects, checks the contract version and probes blob support
  static std::unique_ptr<FlatDirectory> create(const config::SdkConfig& config,
                                               chain::ChainBinding& binding,
                                               kzg::BackendFactory backend);
  FlatDirectory(Components components, const config::SdkConfig& config);
  ~FlatDirectory();


  // ---- FILE OPERATIONS ----
  // Never throws; problems reach callback.on_fail then on_finish
  upload::UploadOutcome upload(upload::UploadRequest request, const upload::UploadCallback& callback);
  bool download(const std::string& key, const download::DownloadCallback& callback);
  CostEstimate estimate_cost(upload::EstimateRequest request);
  // Stored chunk hashes of several keys, fetched with bounded concurrency
  std::map<std::string, std::vector<Hash32>> fetch_hashes(const std::vector<std::string>& keys);
  bool remove(const std::string& key);
  bool set_default(const std::string& filename);

  // Releases the commitment backend; idempotent
  void close();


  // ---- QUERY ----
  const std::optional<Address>& address() const { return parts_.address; }
  bool blob_supported() const { return parts_.blob_supported; }
  bool read_only() const { return !parts_.writer; }

private:
  void require_writer() const;
  void require_address() const;
  // Submits a one-off management transaction; false on any failure
  bool submit_management(const std::string& what, chain::TransactionRequest tx);

  Components parts_;
  uint32_t gas_increase_pct_;
  bool confirm_nonce_;
  chain::RetryPolicy retry_;
  std::unique_ptr<upload::UploadOrchestrator> uploads_;
  std::unique_ptr<download::DownloadOrchestrator> downloads_;
};

} // namespace ethstorage::directory

#endif // ETHSTORAGE_DIRECTORY_FLAT_DIRECTORY_HPP
