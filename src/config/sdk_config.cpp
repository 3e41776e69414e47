#include "ethstorage/config/sdk_config.hpp"
#include "ethstorage/crypto/hash.hpp"
#include "ethstorage/errors.hpp"
#include <map>

namespace ethstorage::config {

void SdkConfig::validate() const {
  const bool reader_only = read_only() && ethstorage_rpc && address;
  if (rpc.empty() && !reader_only) {
    throw ValidationError("rpc endpoint is required");
  }
  if (gas_increase_pct > MAX_GAS_INCREASE_PCT) {
    throw ValidationError("gas increase percentage must be within 0.." + std::to_string(MAX_GAS_INCREASE_PCT));
  }
  if (private_key) {
    parse_private_key(*private_key);
  }
  if (address && address->empty()) {
    throw ValidationError("contract address must not be empty");
  }
  if (commitment_workers == 0) {
    throw ValidationError("commitment worker count must be positive");
  }
}

std::optional<Address> resolve_storage_address(uint64_t chain_id) {
  static const std::map<uint64_t, Address> addresses{
    {SEPOLIA_CHAIN_ID, "0x804C520d3c084C805E37A35E90057Ac32831F96f"},
    {QUARKCHAIN_L2_DEVNET_CHAIN_ID, "0x90a708C0dca081ca48a9851a8A326775155f87Fd"},
    {QUARKCHAIN_L2_TESTNET_CHAIN_ID, "0x64003adbdf3014f7E38FC6BE752EB047b95da89A"},
  };
  auto it = addresses.find(chain_id);
  if (it == addresses.end()) {
    return std::nullopt;
  }
  return it->second;
}

Bytes parse_private_key(const std::string& hex) {
  Bytes key;
  try {
    key = crypto::from_hex(hex);
  } catch (const crypto::HashError& e) {
    throw ValidationError(std::string("private key is not valid hex: ") + e.what());
  }
  if (key.size() != 32) {
    throw ValidationError("private key must be 32 bytes, got " + std::to_string(key.size()));
  }
  return key;
}

} // namespace ethstorage::config
