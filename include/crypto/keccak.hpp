#pragma once
#include <string>
#include "utils/hex.hpp"

namespace Crypto {
  // 32-byte keccak256 digest (pre-standard Keccak padding, as used by Ethereum)
  Bytes Keccak256(const Bytes& data);
  Bytes Keccak256(const std::string& raw);
  // 0x-prefixed first 4 bytes of keccak256(signature), e.g. "transfer(address,uint256)"
  std::string FunctionSelector(const std::string& signature);
}
