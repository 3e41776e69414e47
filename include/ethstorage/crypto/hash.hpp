#ifndef ETHSTORAGE_CRYPTO_HASH_HPP
#define ETHSTORAGE_CRYPTO_HASH_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include "ethstorage/types.hpp"

namespace ethstorage::crypto {

class HashError : public std::runtime_error {
public:
  explicit HashError(const std::string& message)
    : std::runtime_error("Hash error: " + message) {}
};

// ---- DIGESTS ----
// SHA-256 through OpenSSL EVP
Hash32 sha256(const uint8_t* data, std::size_t size);
Hash32 sha256(const Bytes& data);

// Original Keccak-256 (0x01 padding) as used for ledger content hashes
Hash32 keccak256(const uint8_t* data, std::size_t size);
Hash32 keccak256(const Bytes& data);
Hash32 keccak256(const std::string& data);


// ---- HEX ENCODING ----
// Lowercase hex with "0x" prefix
std::string to_hex(const uint8_t* data, std::size_t size);
std::string to_hex(const Bytes& data);
template <std::size_t N>
std::string to_hex(const std::array<uint8_t, N>& data) {
  return to_hex(data.data(), data.size());
}

// Accepts an optional "0x" prefix; throws HashError on odd length or bad digits
Bytes from_hex(const std::string& hex);

// Parses exactly 32 bytes of hex
Hash32 hash_from_hex(const std::string& hex);

} // namespace ethstorage::crypto

#endif // ETHSTORAGE_CRYPTO_HASH_HPP
