#include "ethstorage/blob/blob.hpp"
#include "ethstorage/blob/codec_error.hpp"
#include <string>

namespace ethstorage::blob {

const char* decode_type_to_string(DecodeType type) {
  switch (type) {
    case DecodeType::RawData:           return "RawData";
    case DecodeType::PaddingPer31Bytes: return "PaddingPer31Bytes";
    case DecodeType::OptimismCompact:   return "OptimismCompact";
  }
  return "Unknown";
}

Blob::Blob() : data_(BLOB_SIZE, 0) {}

Blob::Blob(Bytes data) : data_(std::move(data)) {
  if (data_.size() != BLOB_SIZE) {
    throw CodecError("blob must be exactly " + std::to_string(BLOB_SIZE) +
                     " bytes, got " + std::to_string(data_.size()));
  }
}

const uint8_t* Blob::field_element(std::size_t index) const {
  if (index >= FIELD_ELEMENTS_PER_BLOB) {
    throw CodecError("field element index out of range: " + std::to_string(index));
  }
  return data_.data() + index * BYTES_PER_FIELD_ELEMENT;
}

} // namespace ethstorage::blob
