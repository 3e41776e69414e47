#include "ethstorage/chain/types.hpp"
#include "ethstorage/errors.hpp"

namespace ethstorage::chain {

const char* storage_mode_to_string(StorageMode mode) {
  switch (mode) {
    case StorageMode::Undefined: return "Undefined";
    case StorageMode::Calldata:  return "Calldata";
    case StorageMode::Blob:      return "Blob";
  }
  return "Unknown";
}

StorageMode storage_mode_from_int(uint64_t value) {
  switch (value) {
    case 0: return StorageMode::Undefined;
    case 1: return StorageMode::Calldata;
    case 2: return StorageMode::Blob;
    default:
      throw ValidationError("unknown storage mode " + std::to_string(value));
  }
}

} // namespace ethstorage::chain
