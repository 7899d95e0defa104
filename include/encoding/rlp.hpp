#pragma once
#include "utils/hex.hpp"

// Recursive Length Prefix encoding; each function returns the encoded item.
namespace RLP {
  Bytes EncodeBytes(const Bytes& data);
  Bytes EncodeUint(unsigned long long value);
  // Big-endian integer bytes; leading zeros are stripped.
  Bytes EncodeUintBytes(const Bytes& big_endian);
  Bytes EncodeList(const std::vector<Bytes>& encoded_items);
}
