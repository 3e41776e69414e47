#include "ethstorage/crypto/hash.hpp"
#include <openssl/evp.h>
#include <array>
#include <cstring>
#include <iomanip>
#include <sstream>

namespace ethstorage::crypto {

namespace {

//==============================================
// KECCAK-F[1600]
//==============================================

constexpr std::array<uint64_t, 24> kRoundConstants = {
  0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808aULL,
  0x8000000080008000ULL, 0x000000000000808bULL, 0x0000000080000001ULL,
  0x8000000080008081ULL, 0x8000000000008009ULL, 0x000000000000008aULL,
  0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000aULL,
  0x000000008000808bULL, 0x800000000000008bULL, 0x8000000000008089ULL,
  0x8000000000008003ULL, 0x8000000000008002ULL, 0x8000000000000080ULL,
  0x000000000000800aULL, 0x800000008000000aULL, 0x8000000080008081ULL,
  0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL};

constexpr std::array<int, 24> kRotations = {
  1, 3, 6, 10, 15, 21, 28, 36, 45, 55, 2, 14,
  27, 41, 56, 8, 25, 43, 62, 18, 39, 61, 20, 44};

constexpr std::array<int, 24> kPiLanes = {
  10, 7, 11, 17, 18, 3, 5, 16, 8, 21, 24, 4,
  15, 23, 19, 13, 12, 2, 20, 14, 22, 9, 6, 1};

constexpr std::size_t kRate = 136;  // 1088-bit rate for a 256-bit output

constexpr uint64_t rotl(uint64_t value, int shift) noexcept {
  return (value << shift) | (value >> (64 - shift));
}

void keccak_f(std::array<uint64_t, 25>& state) {
  std::array<uint64_t, 5> c{};
  for (uint64_t round_constant : kRoundConstants) {
    // Theta
    for (int x = 0; x < 5; ++x) {
      c[x] = state[x] ^ state[x + 5] ^ state[x + 10] ^ state[x + 15] ^ state[x + 20];
    }
    for (int x = 0; x < 5; ++x) {
      uint64_t d = c[(x + 4) % 5] ^ rotl(c[(x + 1) % 5], 1);
      for (int y = 0; y < 25; y += 5) {
        state[y + x] ^= d;
      }
    }

    // Rho and Pi
    uint64_t current = state[1];
    for (int i = 0; i < 24; ++i) {
      int lane = kPiLanes[i];
      uint64_t next = state[lane];
      state[lane] = rotl(current, kRotations[i]);
      current = next;
    }

    // Chi
    for (int y = 0; y < 25; y += 5) {
      for (int x = 0; x < 5; ++x) {
        c[x] = state[y + x];
      }
      for (int x = 0; x < 5; ++x) {
        state[y + x] = c[x] ^ ((~c[(x + 1) % 5]) & c[(x + 2) % 5]);
      }
    }

    // Iota
    state[0] ^= round_constant;
  }
}

// Lanes are little-endian
void absorb_block(std::array<uint64_t, 25>& state, const uint8_t* block) {
  for (std::size_t i = 0; i < kRate / 8; ++i) {
    uint64_t lane = 0;
    for (int b = 7; b >= 0; --b) {
      lane = (lane << 8) | block[i * 8 + b];
    }
    state[i] ^= lane;
  }
  keccak_f(state);
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace


//==============================================
// DIGESTS
//==============================================

Hash32 sha256(const uint8_t* data, std::size_t size) {
  Hash32 result{};
  unsigned int hash_len = 0;

  // Create a new message digest context for the hashing operation
  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw HashError("Failed to create hash context");
  }

  if (!EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr)) {
    EVP_MD_CTX_free(ctx);
    throw HashError("Failed to initialize hash context");
  }

  if (size > 0 && !EVP_DigestUpdate(ctx, data, size)) {
    EVP_MD_CTX_free(ctx);
    throw HashError("Failed to update hash");
  }

  if (!EVP_DigestFinal_ex(ctx, result.data(), &hash_len)) {
    EVP_MD_CTX_free(ctx);
    throw HashError("Failed to finalize hash");
  }

  EVP_MD_CTX_free(ctx);

  if (hash_len != result.size()) {
    throw HashError("Unexpected SHA-256 digest length: " + std::to_string(hash_len));
  }
  return result;
}

Hash32 sha256(const Bytes& data) {
  return sha256(data.data(), data.size());
}

Hash32 keccak256(const uint8_t* data, std::size_t size) {
  std::array<uint64_t, 25> state{};

  std::size_t offset = 0;
  while (size - offset >= kRate) {
    absorb_block(state, data + offset);
    offset += kRate;
  }

  // Final block with Keccak (not SHA-3) domain padding
  std::array<uint8_t, kRate> block{};
  std::size_t remaining = size - offset;
  if (remaining > 0) {
    std::memcpy(block.data(), data + offset, remaining);
  }
  block[remaining] ^= 0x01;
  block[kRate - 1] ^= 0x80;
  absorb_block(state, block.data());

  Hash32 result{};
  for (std::size_t i = 0; i < result.size(); ++i) {
    result[i] = static_cast<uint8_t>(state[i / 8] >> (8 * (i % 8)));
  }
  return result;
}

Hash32 keccak256(const Bytes& data) {
  return keccak256(data.data(), data.size());
}

Hash32 keccak256(const std::string& data) {
  return keccak256(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}


//==============================================
// HEX ENCODING
//==============================================

std::string to_hex(const uint8_t* data, std::size_t size) {
  std::stringstream ss;
  ss << "0x";
  for (std::size_t i = 0; i < size; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(data[i]);
  }
  return ss.str();
}

std::string to_hex(const Bytes& data) {
  return to_hex(data.data(), data.size());
}

Bytes from_hex(const std::string& hex) {
  std::size_t start = 0;
  if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
    start = 2;
  }
  if ((hex.size() - start) % 2 != 0) {
    throw HashError("Odd-length hex string");
  }

  Bytes out;
  out.reserve((hex.size() - start) / 2);
  for (std::size_t i = start; i < hex.size(); i += 2) {
    int high = hex_value(hex[i]);
    int low = hex_value(hex[i + 1]);
    if (high < 0 || low < 0) {
      throw HashError("Invalid hex digit in: " + hex);
    }
    out.push_back(static_cast<uint8_t>((high << 4) | low));
  }
  return out;
}

Hash32 hash_from_hex(const std::string& hex) {
  Bytes bytes = from_hex(hex);
  if (bytes.size() != 32) {
    throw HashError("Expected 32 bytes, got " + std::to_string(bytes.size()));
  }
  Hash32 out{};
  std::memcpy(out.data(), bytes.data(), out.size());
  return out;
}

} // namespace ethstorage::crypto
