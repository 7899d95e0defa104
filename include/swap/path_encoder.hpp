#pragma once
#include <string>
#include "common/result.hpp"
#include "utils/hex.hpp"

struct DecodedPath {
  std::string token_a;   // lowercase 0x-hex
  unsigned int fee = 0;
  std::string token_b;
};

// Uniswap v3 single-pool path: tokenA(20) | fee(3, big-endian) | tokenB(20).
class PathEncoder {
public:
  static constexpr size_t kAddressSize = 20;
  static constexpr size_t kFeeSize = 3;
  static constexpr size_t kPathSize = kAddressSize + kFeeSize + kAddressSize;

  // EncodingError for malformed addresses or fee >= 2^24.
  static Result<Bytes> Encode(const std::string& token_a, unsigned int fee, const std::string& token_b);
  // EncodingError unless the input is exactly 43 bytes.
  static Result<DecodedPath> Decode(const Bytes& path);
};
