#ifndef ETHSTORAGE_CONFIG_SDK_CONFIG_HPP
#define ETHSTORAGE_CONFIG_SDK_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include "ethstorage/types.hpp"

namespace ethstorage::config {

constexpr uint64_t SEPOLIA_CHAIN_ID = 11155111;
constexpr uint64_t QUARKCHAIN_L2_DEVNET_CHAIN_ID = 42069;
constexpr uint64_t QUARKCHAIN_L2_TESTNET_CHAIN_ID = 3335;

constexpr uint32_t MAX_GAS_INCREASE_PCT = 1000;
constexpr const char* FLAT_DIRECTORY_VERSION = "1.0.0";

struct SdkConfig {
  // Execution endpoint used for writes and fee queries
  std::string rpc;
  // Storage network endpoint, needed only for reads
  std::optional<std::string> ethstorage_rpc;
  // Hex signing key; absent means read-only
  std::optional<std::string> private_key;
  // Contract address; resolved from the chain id when absent
  std::optional<Address> address;
  uint32_t gas_increase_pct = 0;
  bool confirm_nonce = false;

  // Worker counts, 0 picks a default from the hardware
  std::size_t upload_concurrency = 0;
  std::size_t download_concurrency = 0;
  std::size_t commitment_workers = 1;

  bool read_only() const { return !private_key.has_value(); }

  // Throws ValidationError describing the first problem found
  void validate() const;
};

// Storage contract deployed on a known network
std::optional<Address> resolve_storage_address(uint64_t chain_id);

// 32 raw key bytes from hex with optional 0x prefix
Bytes parse_private_key(const std::string& hex);

} // namespace ethstorage::config

#endif // ETHSTORAGE_CONFIG_SDK_CONFIG_HPP
