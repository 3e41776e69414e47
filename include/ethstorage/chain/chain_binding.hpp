#ifndef ETHSTORAGE_CHAIN_CHAIN_BINDING_HPP
#define ETHSTORAGE_CHAIN_CHAIN_BINDING_HPP

#include <memory>
#include <optional>
#include <string>
#include "ethstorage/chain/chain_client.hpp"
#include "ethstorage/chain/kv_contract.hpp"
#include "ethstorage/chain/storage_contract.hpp"

namespace ethstorage::chain {

// Creates clients and contract handles for a concrete ledger stack
class ChainBinding {
public:
  virtual ~ChainBinding() = default;

  // Without a private key the client is read-only
  virtual std::shared_ptr<ChainClient> connect(const std::string& rpc,
                                               const std::optional<std::string>& private_key) = 0;
  virtual std::shared_ptr<StorageContract> flat_directory(const Address& address,
                                                          std::shared_ptr<ChainClient> client) = 0;
  virtual std::shared_ptr<KvContract> key_value(const Address& address,
                                                std::shared_ptr<ChainClient> client) = 0;
};

} // namespace ethstorage::chain

#endif // ETHSTORAGE_CHAIN_CHAIN_BINDING_HPP
