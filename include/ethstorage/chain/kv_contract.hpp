#ifndef ETHSTORAGE_CHAIN_KV_CONTRACT_HPP
#define ETHSTORAGE_CHAIN_KV_CONTRACT_HPP

#include <cstdint>
#include <optional>
#include "ethstorage/blob/blob.hpp"
#include "ethstorage/chain/types.hpp"

namespace ethstorage::chain {

// Key-value storage contract addressed by 32-byte keys
class KvContract {
public:
  virtual ~KvContract() = default;

  virtual Address address() const = 0;

  virtual Wei upfront_payment() = 0;
  virtual TransactionRequest put_blob(const Hash32& key, uint64_t blob_index, uint64_t length,
                                      const Wei& value) = 0;
  virtual TransactionRequest put_blobs(const std::vector<Hash32>& keys,
                                       const std::vector<uint64_t>& blob_indexes,
                                       const std::vector<uint64_t>& lengths,
                                       const Wei& value) = 0;

  // Reads are evaluated as calls from `from`
  virtual uint64_t size(const Hash32& key, const Address& from) = 0;
  virtual Bytes get(const Hash32& key, blob::DecodeType decode_type, uint64_t offset,
                    uint64_t length, const Address& from) = 0;
};

} // namespace ethstorage::chain

#endif // ETHSTORAGE_CHAIN_KV_CONTRACT_HPP
