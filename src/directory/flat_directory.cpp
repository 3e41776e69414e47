#include "ethstorage/directory/flat_directory.hpp"
#include "ethstorage/errors.hpp"
#include <boost/log/trivial.hpp>

namespace ethstorage::directory {

namespace {

void check_version(chain::StorageContract& contract, const chain::RetryPolicy& retry) {
  std::string version = retry.run([&contract]() { return contract.contract_version(); }, "contract_version");
  if (version != config::FLAT_DIRECTORY_VERSION) {
    BOOST_LOG_TRIVIAL(error) << "FlatDirectory: Unsupported contract version " << version;
    throw CapabilityError("the current SDK does not support contract version " + version);
  }
}

} // namespace

//==============================================
// CONSTRUCTION
//==============================================

std::unique_ptr<FlatDirectory> FlatDirectory::create(const config::SdkConfig& config,
                                                     chain::ChainBinding& binding,
                                                     kzg::BackendFactory backend) {
  config.validate();
  chain::RetryPolicy retry;

  Components parts;
  parts.address = config.address;

  if (config.ethstorage_rpc && parts.address) {
    parts.reader = binding.flat_directory(*parts.address, binding.connect(*config.ethstorage_rpc, std::nullopt));
  }

  if (config.private_key) {
    std::shared_ptr<chain::ChainClient> client = binding.connect(config.rpc, config.private_key);
    parts.engine = std::make_shared<kzg::CommitmentEngine>(std::move(backend), config.commitment_workers);
    parts.builder = std::make_shared<tx::TransactionBuilder>(client, parts.engine);
    parts.uploader = std::make_shared<tx::Uploader>(client);
    if (parts.address) {
      parts.writer = binding.flat_directory(*parts.address, client);
      check_version(*parts.writer, retry);
      parts.blob_supported =
        retry.run([&parts]() { return parts.writer->is_blob_mode_supported(); }, "is_blob_mode_supported");
    }
  } else {
    if (!parts.reader) {
      throw ValidationError("invalid contract address and ethstorage rpc");
    }
    check_version(*parts.reader, retry);
  }

  BOOST_LOG_TRIVIAL(info) << "FlatDirectory: Ready at " << parts.address.value_or("<not deployed>")
                          << (config.private_key ? "" : " (read-only)")
                          << ", blob mode " << (parts.blob_supported ? "supported" : "unsupported");
  return std::make_unique<FlatDirectory>(std::move(parts), config);
}

FlatDirectory::FlatDirectory(Components components, const config::SdkConfig& config)
  : parts_(std::move(components))
  , gas_increase_pct_(config.gas_increase_pct)
  , confirm_nonce_(config.confirm_nonce) {
  if (parts_.writer) {
    upload::UploadOptions options;
    options.concurrency = config.upload_concurrency;
    uploads_ = std::make_unique<upload::UploadOrchestrator>(parts_.writer, parts_.builder, parts_.uploader, options);
  }
  if (parts_.reader) {
    downloads_ = std::make_unique<download::DownloadOrchestrator>(parts_.reader, retry_, config.download_concurrency);
  }
}

FlatDirectory::~FlatDirectory() {
  close();
}

void FlatDirectory::close() {
  if (parts_.engine) {
    parts_.engine->close();
  }
}

void FlatDirectory::require_writer() const {
  if (!parts_.uploader) {
    throw ValidationError("private key is required for this operation");
  }
}

void FlatDirectory::require_address() const {
  if (!parts_.address) {
    throw ValidationError("flat directory not deployed");
  }
}

//==============================================
// FILE OPERATIONS
//==============================================

upload::UploadOutcome FlatDirectory::upload(upload::UploadRequest request, const upload::UploadCallback& callback) {
  if (!uploads_) {
    const std::string message = !parts_.address ? "flat directory not deployed"
                                                : "private key is required for this operation";
    upload::UploadOutcome outcome;
    outcome.error = ValidationError(message).what();
    if (callback.on_fail) callback.on_fail(*outcome.error);
    if (callback.on_finish) callback.on_finish(outcome.result);
    return outcome;
  }

  if (request.gas_increase_pct == 0) {
    request.gas_increase_pct = gas_increase_pct_;
  }
  request.confirm_nonce = request.confirm_nonce || confirm_nonce_;
  return uploads_->upload(request, callback);
}

bool FlatDirectory::download(const std::string& key, const download::DownloadCallback& callback) {
  require_address();
  if (!downloads_) {
    throw ValidationError("reading content requires providing ethstorage_rpc");
  }
  return downloads_->download(key, callback);
}

CostEstimate FlatDirectory::estimate_cost(upload::EstimateRequest request) {
  require_writer();
  require_address();
  if (request.gas_increase_pct == 0) {
    request.gas_increase_pct = gas_increase_pct_;
  }
  return uploads_->estimate_cost(request);
}

std::map<std::string, std::vector<Hash32>> FlatDirectory::fetch_hashes(const std::vector<std::string>& keys) {
  require_writer();
  require_address();
  return uploads_->diff_engine().fetch_hashes(keys);
}

bool FlatDirectory::remove(const std::string& key) {
  require_writer();
  require_address();
  if (key.empty()) {
    throw ValidationError("invalid key");
  }
  return submit_management("remove " + key, parts_.writer->remove(key));
}

bool FlatDirectory::set_default(const std::string& filename) {
  require_writer();
  require_address();
  return submit_management("set default file " + filename, parts_.writer->set_default(filename));
}

bool FlatDirectory::submit_management(const std::string& what, chain::TransactionRequest tx) {
  try {
    tx::TransactionResult result = parts_.uploader->submit_and_wait(std::move(tx), confirm_nonce_);
    BOOST_LOG_TRIVIAL(info) << "FlatDirectory: Tx hash is " << result.hash;
    return result.success;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "FlatDirectory: Failed to " << what << ": " << e.what();
  }
  return false;
}

} // namespace ethstorage::directory
