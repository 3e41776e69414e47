#ifndef ETHSTORAGE_TYPES_HPP
#define ETHSTORAGE_TYPES_HPP

#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include <boost/multiprecision/cpp_int.hpp>

namespace ethstorage {

// Raw byte buffer used for content, calldata and decoded chunks
using Bytes = std::vector<uint8_t>;

// 32-byte hash as stored on-chain (bytes32)
using Hash32 = std::array<uint8_t, 32>;

// Amounts of wei and gas prices
using Wei = boost::multiprecision::uint256_t;

// 0x-prefixed hex account or contract address
using Address = std::string;

// Projected price of a write: storage payment plus gas
struct CostEstimate {
  Wei storage_cost = 0;
  Wei gas_cost = 0;
};

} // namespace ethstorage

#endif // ETHSTORAGE_TYPES_HPP
