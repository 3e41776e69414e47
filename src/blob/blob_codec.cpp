#include "ethstorage/blob/blob_codec.hpp"
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <cstring>
#include <string>

namespace ethstorage::blob {

//==============================================
// BASE CODEC
//==============================================

Bytes BlobCodec::decode_many(const std::vector<Blob>& blobs) const {
  Bytes out;
  for (const auto& blob : blobs) {
    Bytes part = decode(blob);
    out.insert(out.end(), part.begin(), part.end());
  }
  return out;
}

std::size_t BlobCodec::blob_count(std::size_t length) const {
  return (length + capacity() - 1) / capacity();
}

//==============================================
// LEGACY CODEC
//==============================================

std::vector<Blob> LegacyBlobCodec::encode(const Bytes& data) const {
  if (data.empty()) {
    BOOST_LOG_TRIVIAL(error) << "LegacyBlobCodec: Refusing to encode empty payload";
    throw EncodingError("payload is empty");
  }

  std::vector<Blob> blobs;
  blobs.reserve(blob_count(data.size()));

  std::size_t offset = 0;
  while (offset < data.size()) {
    Bytes raw(BLOB_SIZE, 0);
    for (std::size_t fe = 0; fe < FIELD_ELEMENTS_PER_BLOB && offset < data.size(); ++fe) {
      std::size_t n = std::min(LEGACY_BYTES_PER_FIELD_ELEMENT, data.size() - offset);
      std::memcpy(raw.data() + fe * BYTES_PER_FIELD_ELEMENT + 1, data.data() + offset, n);
      offset += n;
    }
    blobs.emplace_back(std::move(raw));
  }

  BOOST_LOG_TRIVIAL(debug) << "LegacyBlobCodec: Encoded " << data.size() << " bytes into "
                           << blobs.size() << " blob(s)";
  return blobs;
}

void LegacyBlobCodec::append_payload(const Blob& blob, Bytes& out) {
  out.reserve(out.size() + LEGACY_BLOB_DATA_SIZE);
  for (std::size_t fe = 0; fe < FIELD_ELEMENTS_PER_BLOB; ++fe) {
    const uint8_t* element = blob.field_element(fe);
    out.insert(out.end(), element + 1, element + BYTES_PER_FIELD_ELEMENT);
  }
}

void LegacyBlobCodec::trim_trailing_zeros(Bytes& data) {
  auto last = std::find_if(data.rbegin(), data.rend(), [](uint8_t b) { return b != 0; });
  data.erase(last.base(), data.end());
}

Bytes LegacyBlobCodec::decode(const Blob& blob) const {
  Bytes out;
  append_payload(blob, out);
  trim_trailing_zeros(out);
  return out;
}

//==============================================
// COMPACT CODEC
//==============================================

namespace {

// Sequential reader that yields zeros past the end of the input
class PayloadReader {
public:
  PayloadReader(const uint8_t* data, std::size_t size) : data_(data), size_(size) {}

  uint8_t read1() {
    if (offset_ >= size_) return 0;
    return data_[offset_++];
  }

  void read_into(uint8_t* dst, std::size_t len) {
    std::memset(dst, 0, len);
    if (offset_ >= size_) return;
    std::size_t n = std::min(len, size_ - offset_);
    std::memcpy(dst, data_ + offset_, n);
    offset_ += n;
  }

  bool exhausted() const { return offset_ >= size_; }

private:
  const uint8_t* data_;
  std::size_t size_;
  std::size_t offset_ = 0;
};

// Writer enforcing the tag-byte then 31-byte cadence of each field element
class FieldWriter {
public:
  explicit FieldWriter(Bytes& out) : out_(out) {}

  void write1(uint8_t value) {
    if (offset_ % BYTES_PER_FIELD_ELEMENT != 0) {
      throw EncodingError("tag write at unaligned offset " + std::to_string(offset_));
    }
    if ((value & 0xC0) != 0) {
      throw EncodingError("tag byte exceeds 6 bits");
    }
    out_[offset_++] = value;
  }

  void write31(const uint8_t* segment) {
    if (offset_ % BYTES_PER_FIELD_ELEMENT != 1) {
      throw EncodingError("segment write at unaligned offset " + std::to_string(offset_));
    }
    std::memcpy(out_.data() + offset_, segment, 31);
    offset_ += 31;
  }

private:
  Bytes& out_;
  std::size_t offset_ = 0;
};

} // namespace

Blob CompactBlobCodec::encode_blob(const uint8_t* data, std::size_t size) const {
  if (size > COMPACT_BLOB_DATA_SIZE) {
    throw EncodingError("payload of " + std::to_string(size) + " bytes exceeds blob capacity " +
                        std::to_string(COMPACT_BLOB_DATA_SIZE));
  }

  Bytes raw(BLOB_SIZE, 0);
  PayloadReader reader(data, size);
  FieldWriter writer(raw);
  uint8_t segment[31];

  for (std::size_t round = 0; round < COMPACT_ROUNDS; ++round) {
    if (round > 0 && reader.exhausted()) break;

    if (round == 0) {
      segment[0] = COMPACT_ENCODING_VERSION;
      boost::endian::store_big_u24(segment + 1, static_cast<uint32_t>(size));
      reader.read_into(segment + 4, 27);
    } else {
      reader.read_into(segment, 31);
    }

    uint8_t x = reader.read1();
    writer.write1(x & 0x3F);
    writer.write31(segment);

    reader.read_into(segment, 31);
    uint8_t y = reader.read1();
    writer.write1(static_cast<uint8_t>((y & 0x0F) | ((x & 0xC0) >> 2)));
    writer.write31(segment);

    reader.read_into(segment, 31);
    uint8_t z = reader.read1();
    writer.write1(z & 0x3F);
    writer.write31(segment);

    reader.read_into(segment, 31);
    writer.write1(static_cast<uint8_t>(((z & 0xC0) >> 2) | ((y & 0xF0) >> 4)));
    writer.write31(segment);
  }

  return Blob(std::move(raw));
}

std::vector<Blob> CompactBlobCodec::encode(const Bytes& data) const {
  if (data.empty()) {
    BOOST_LOG_TRIVIAL(error) << "CompactBlobCodec: Refusing to encode empty payload";
    throw EncodingError("payload is empty");
  }

  std::vector<Blob> blobs;
  blobs.reserve(blob_count(data.size()));
  for (std::size_t offset = 0; offset < data.size(); offset += COMPACT_BLOB_DATA_SIZE) {
    std::size_t n = std::min(COMPACT_BLOB_DATA_SIZE, data.size() - offset);
    blobs.push_back(encode_blob(data.data() + offset, n));
  }

  BOOST_LOG_TRIVIAL(debug) << "CompactBlobCodec: Encoded " << data.size() << " bytes into "
                           << blobs.size() << " blob(s)";
  return blobs;
}

Bytes CompactBlobCodec::decode(const Blob& blob) const {
  if (blob[1] != COMPACT_ENCODING_VERSION) {
    throw DecodingError("unsupported encoding version " + std::to_string(blob[1]));
  }

  std::size_t length = boost::endian::load_big_u24(blob.data() + 2);
  if (length > COMPACT_BLOB_DATA_SIZE) {
    throw DecodingError("declared length " + std::to_string(length) + " exceeds capacity");
  }

  Bytes output(COMPACT_BLOB_DATA_SIZE, 0);
  std::memcpy(output.data(), blob.data() + 5, 27);

  std::size_t opos = 28;
  std::size_t ipos = 32;
  uint8_t tags[4];

  auto decode_field_element = [&]() -> uint8_t {
    uint8_t tag = blob[ipos];
    if ((tag & 0xC0) != 0) {
      throw DecodingError("invalid field element at offset " + std::to_string(ipos));
    }
    std::size_t n = std::min<std::size_t>(31, output.size() - std::min(opos, output.size()));
    std::memcpy(output.data() + opos, blob.data() + ipos + 1, n);
    opos += 32;
    ipos += 32;
    return tag;
  };

  // Spreads the three bytes carried by the tags back in front of segments 2..4
  auto reassemble = [&]() {
    --opos;
    uint8_t x = static_cast<uint8_t>((tags[0] & 0x3F) | ((tags[1] & 0x30) << 2));
    uint8_t y = static_cast<uint8_t>((tags[1] & 0x0F) | ((tags[3] & 0x0F) << 4));
    uint8_t z = static_cast<uint8_t>((tags[2] & 0x3F) | ((tags[3] & 0x30) << 2));
    output[opos - 32] = z;
    output[opos - 64] = y;
    output[opos - 96] = x;
  };

  tags[0] = blob[0];
  if ((tags[0] & 0xC0) != 0) {
    throw DecodingError("invalid field element at offset 0");
  }
  for (int i = 1; i < 4; ++i) {
    tags[i] = decode_field_element();
  }
  reassemble();

  for (std::size_t round = 1; round < COMPACT_ROUNDS && opos < length; ++round) {
    for (int i = 0; i < 4; ++i) {
      tags[i] = decode_field_element();
    }
    reassemble();
  }

  for (std::size_t i = length; i < output.size(); ++i) {
    if (output[i] != 0) {
      throw DecodingError("non-zero data past declared length at offset " + std::to_string(i));
    }
  }
  output.resize(length);

  for (; ipos < BLOB_SIZE; ++ipos) {
    if (blob[ipos] != 0) {
      throw DecodingError("non-zero blob byte past encoded data at offset " + std::to_string(ipos));
    }
  }

  return output;
}

//==============================================
// FACTORY
//==============================================

std::unique_ptr<BlobCodec> make_codec(DecodeType type) {
  switch (type) {
    case DecodeType::PaddingPer31Bytes:
      return std::make_unique<LegacyBlobCodec>();
    case DecodeType::OptimismCompact:
      return std::make_unique<CompactBlobCodec>();
    case DecodeType::RawData:
      break;
  }
  throw CodecError(std::string("no codec for decode type ") + decode_type_to_string(type));
}

} // namespace ethstorage::blob
