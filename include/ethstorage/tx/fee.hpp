#ifndef ETHSTORAGE_TX_FEE_HPP
#define ETHSTORAGE_TX_FEE_HPP

#include <cstddef>
#include <cstdint>
#include "ethstorage/types.hpp"

namespace ethstorage::tx {

constexpr uint64_t MIN_BLOB_GASPRICE = 1;
constexpr uint64_t BLOB_GASPRICE_UPDATE_FRACTION = 3338477;

// Calldata chunks above this size pay a stake on networks that charge one
constexpr std::size_t CALLDATA_FREE_LIMIT = 24 * 1024 - 326;
constexpr std::size_t CALLDATA_OVERHEAD = 326;

// Taylor-series approximation of factor * e^(numerator / denominator).
// Throws std::overflow_error if the result leaves the 256-bit range.
Wei fake_exponential(const Wei& factor, const Wei& numerator, const Wei& denominator);

// Blob base fee at the given excess blob gas
Wei blob_base_fee(const Wei& excess_blob_gas);

// Base fee with the 10% safety margin applied
Wei blob_gas_price_with_margin(const Wei& excess_blob_gas);

// value * (100 + pct) / 100
Wei increase_by_pct(const Wei& value, uint32_t pct);

// value * pct / 100
Wei pct_of(const Wei& value, uint32_t pct);

// Stake in wei for one calldata chunk: whole ether per started 24 KiB
// including overhead, charged only above the free limit
Wei calldata_stake(std::size_t chunk_length);

} // namespace ethstorage::tx

#endif // ETHSTORAGE_TX_FEE_HPP
