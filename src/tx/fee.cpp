#include "ethstorage/tx/fee.hpp"
#include <boost/multiprecision/cpp_int.hpp>
#include <stdexcept>

namespace ethstorage::tx {

namespace mp = boost::multiprecision;

namespace {

const Wei ONE_ETHER = Wei(1000000000000000000ULL);

} // namespace

Wei fake_exponential(const Wei& factor, const Wei& numerator, const Wei& denominator) {
  if (denominator == 0) {
    throw std::invalid_argument("fake_exponential: denominator must be non-zero");
  }

  // Intermediate terms can exceed 256 bits, so accumulate unbounded
  const mp::cpp_int num(numerator);
  const mp::cpp_int denom(denominator);
  mp::cpp_int i = 1;
  mp::cpp_int output = 0;
  mp::cpp_int accum = mp::cpp_int(factor) * denom;

  while (accum > 0) {
    output += accum;
    accum = (accum * num) / (denom * i);
    ++i;
  }

  mp::cpp_int result = output / denom;
  if (result != 0 && mp::msb(result) >= 256) {
    throw std::overflow_error("fake_exponential: result exceeds 256 bits");
  }
  return result.convert_to<Wei>();
}

Wei blob_base_fee(const Wei& excess_blob_gas) {
  return fake_exponential(MIN_BLOB_GASPRICE, excess_blob_gas, BLOB_GASPRICE_UPDATE_FRACTION);
}

Wei blob_gas_price_with_margin(const Wei& excess_blob_gas) {
  return blob_base_fee(excess_blob_gas) * 11 / 10;
}

Wei increase_by_pct(const Wei& value, uint32_t pct) {
  return value * (100 + pct) / 100;
}

Wei pct_of(const Wei& value, uint32_t pct) {
  return value * pct / 100;
}

Wei calldata_stake(std::size_t chunk_length) {
  if (chunk_length <= CALLDATA_FREE_LIMIT) {
    return 0;
  }
  return ONE_ETHER * static_cast<uint64_t>((chunk_length + CALLDATA_OVERHEAD) / 1024 / 24);
}

} // namespace ethstorage::tx
