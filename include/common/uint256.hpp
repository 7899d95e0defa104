#pragma once
#include <boost/multiprecision/cpp_int.hpp>
#include <string>
#include "utils/hex.hpp"

using Uint256 = boost::multiprecision::uint256_t;

// 2^256 - 1
Uint256 MaxUint256();

// Parses a JSON-RPC quantity or raw hex word ("0x1a", "001a"); throws on bad input.
Uint256 Uint256FromHex(const std::string& hex);
Uint256 Uint256FromBigEndian(const unsigned char* data, size_t len);

// Minimal JSON-RPC quantity encoding ("0x0", "0x1a").
std::string ToHexQuantity(const Uint256& v);
// 32-byte big-endian word.
Bytes ToWord(const Uint256& v);
std::string ToDecimalString(const Uint256& v);
