#ifndef ETHSTORAGE_BLOB_CODEC_HPP
#define ETHSTORAGE_BLOB_CODEC_HPP

#include <memory>
#include <vector>
#include "ethstorage/blob/blob.hpp"
#include "ethstorage/blob/codec_error.hpp"

namespace ethstorage::blob {

class BlobCodec {
public:
  virtual ~BlobCodec() = default;

  // ---- ENCODING ----
  // Packs data into as many blobs as needed; empty input is rejected
  virtual std::vector<Blob> encode(const Bytes& data) const = 0;


  // ---- DECODING ----
  virtual Bytes decode(const Blob& blob) const = 0;
  // Decodes and concatenates blobs in order
  virtual Bytes decode_many(const std::vector<Blob>& blobs) const;


  // ---- QUERY ----
  // Payload bytes that fit in one blob
  virtual std::size_t capacity() const = 0;
  virtual DecodeType decode_type() const = 0;
  // Blobs needed for a payload of the given length
  std::size_t blob_count(std::size_t length) const;
};

// Payload at offset 1 of every field element; decode trims trailing zeros of
// each blob, so zero bytes ending any blob of the content cannot be recovered
class LegacyBlobCodec : public BlobCodec {
public:
  std::vector<Blob> encode(const Bytes& data) const override;
  Bytes decode(const Blob& blob) const override;

  std::size_t capacity() const override { return LEGACY_BLOB_DATA_SIZE; }
  DecodeType decode_type() const override { return DecodeType::PaddingPer31Bytes; }

private:
  // Appends the 31 payload bytes of every field element
  static void append_payload(const Blob& blob, Bytes& out);
  static void trim_trailing_zeros(Bytes& data);
};

// Bit-packed layout: a version byte and a big-endian uint24 length prefix,
// then rounds of four 31-byte segments whose spare bytes are spread over
// the four six-bit tag bytes at the start of each field element
class CompactBlobCodec : public BlobCodec {
public:
  std::vector<Blob> encode(const Bytes& data) const override;
  Bytes decode(const Blob& blob) const override;

  // Encodes at most COMPACT_BLOB_DATA_SIZE bytes into one blob
  Blob encode_blob(const uint8_t* data, std::size_t size) const;

  std::size_t capacity() const override { return COMPACT_BLOB_DATA_SIZE; }
  DecodeType decode_type() const override { return DecodeType::OptimismCompact; }
};

// Codec serving the given decode type; RawData has no codec
std::unique_ptr<BlobCodec> make_codec(DecodeType type);

} // namespace ethstorage::blob

#endif // ETHSTORAGE_BLOB_CODEC_HPP
