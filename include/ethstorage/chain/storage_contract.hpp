#ifndef ETHSTORAGE_CHAIN_STORAGE_CONTRACT_HPP
#define ETHSTORAGE_CHAIN_STORAGE_CONTRACT_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "ethstorage/chain/types.hpp"

namespace ethstorage::chain {

// Flat directory contract. Reads go to the node; writes return the encoded
// call as a transaction request for the caller to finish and submit.
// Names are the raw UTF-8 bytes of the file key.
class StorageContract {
public:
  virtual ~StorageContract() = default;

  virtual Address address() const = 0;

  // ---- READS ----
  virtual std::string contract_version() = 0;
  virtual bool is_blob_mode_supported() = 0;
  virtual UploadInfo get_upload_info(const std::string& name) = 0;
  virtual uint64_t count_chunks(const std::string& name) = 0;
  // Chunk counts for several names in one call
  virtual std::vector<uint64_t> count_chunks_batch(const std::vector<std::string>& names) = 0;
  // Flattened hashes in request order
  virtual std::vector<Hash32> get_chunk_hashes_batch(const std::vector<FileChunks>& files) = 0;
  virtual Bytes read_chunk(const std::string& name, uint64_t chunk_id) = 0;
  virtual Wei upfront_payment() = 0;

  // ---- WRITES ----
  virtual TransactionRequest write_chunks_by_blobs(const std::string& name,
                                                   const std::vector<uint64_t>& chunk_ids,
                                                   const std::vector<uint64_t>& chunk_sizes,
                                                   const Wei& value) = 0;
  virtual TransactionRequest write_chunk_by_calldata(const std::string& name, uint64_t chunk_id,
                                                     const Bytes& data, const Wei& value) = 0;
  virtual TransactionRequest truncate(const std::string& name, uint64_t chunk_count) = 0;
  virtual TransactionRequest remove(const std::string& name) = 0;
  virtual TransactionRequest set_default(const std::string& name) = 0;
};

} // namespace ethstorage::chain

#endif // ETHSTORAGE_CHAIN_STORAGE_CONTRACT_HPP
