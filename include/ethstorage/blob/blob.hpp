#ifndef ETHSTORAGE_BLOB_BLOB_HPP
#define ETHSTORAGE_BLOB_BLOB_HPP

#include <cstddef>
#include <cstdint>
#include "ethstorage/types.hpp"

namespace ethstorage::blob {

constexpr std::size_t BYTES_PER_FIELD_ELEMENT = 32;
constexpr std::size_t FIELD_ELEMENTS_PER_BLOB = 4096;
constexpr std::size_t BLOB_SIZE = BYTES_PER_FIELD_ELEMENT * FIELD_ELEMENTS_PER_BLOB;

// Legacy scheme: first byte of every field element stays 0x00
constexpr std::size_t LEGACY_BYTES_PER_FIELD_ELEMENT = 31;
constexpr std::size_t LEGACY_BLOB_DATA_SIZE = LEGACY_BYTES_PER_FIELD_ELEMENT * FIELD_ELEMENTS_PER_BLOB;

// Compact scheme: 4 x 31 bytes + 3 bytes spread over 4 six-bit tags per round,
// minus the 4-byte version/length header
constexpr std::size_t COMPACT_ROUNDS = 1024;
constexpr std::size_t COMPACT_BLOB_DATA_SIZE = (4 * 31 + 3) * COMPACT_ROUNDS - 4;
constexpr uint8_t COMPACT_ENCODING_VERSION = 0;

// Chunks grouped into one directory write transaction
constexpr std::size_t MAX_BLOBS_PER_BATCH = 3;
// Most blobs any single transaction may carry
constexpr std::size_t BLOB_COUNT_LIMIT = 6;

// Decodings the storage network can apply when serving stored blobs
enum class DecodeType : uint8_t {
  RawData = 0,
  PaddingPer31Bytes = 1,
  OptimismCompact = 2
};

const char* decode_type_to_string(DecodeType type);

// Fixed-size zero-padded container of BLOB_SIZE bytes, immutable once built
class Blob {
public:
  // ---- CONSTRUCTORS ----
  // All-zero blob
  Blob();
  // Takes ownership of exactly BLOB_SIZE bytes, throws CodecError otherwise
  explicit Blob(Bytes data);


  // ---- ACCESSORS ----
  const uint8_t* data() const { return data_.data(); }
  std::size_t size() const { return data_.size(); }
  const Bytes& bytes() const { return data_; }
  uint8_t operator[](std::size_t index) const { return data_[index]; }

  // Returns the 32 bytes of one field element
  const uint8_t* field_element(std::size_t index) const;

  bool operator==(const Blob& other) const { return data_ == other.data_; }
  bool operator!=(const Blob& other) const { return !(*this == other); }

private:
  Bytes data_;
};

} // namespace ethstorage::blob

#endif // ETHSTORAGE_BLOB_BLOB_HPP
