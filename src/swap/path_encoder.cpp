#include "swap/path_encoder.hpp"
#include "constants/uniswap.hpp"

Result<Bytes> PathEncoder::Encode(const std::string& token_a, unsigned int fee, const std::string& token_b) {
  if (!IsValidAddress(token_a)) return Result<Bytes>::Fail(SwapError::EncodingError, "malformed token address '" + token_a + "'");
  if (!IsValidAddress(token_b)) return Result<Bytes>::Fail(SwapError::EncodingError, "malformed token address '" + token_b + "'");
  if (fee > UniswapConstants::MAX_FEE_TIER) {
    return Result<Bytes>::Fail(SwapError::EncodingError, "fee " + std::to_string(fee) + " does not fit in 3 bytes");
  }
  Bytes path = HexToBytes(token_a);
  path.reserve(kPathSize);
  path.push_back(static_cast<unsigned char>((fee >> 16) & 0xFF));
  path.push_back(static_cast<unsigned char>((fee >> 8) & 0xFF));
  path.push_back(static_cast<unsigned char>(fee & 0xFF));
  Bytes b = HexToBytes(token_b);
  path.insert(path.end(), b.begin(), b.end());
  return path;
}

Result<DecodedPath> PathEncoder::Decode(const Bytes& path) {
  if (path.size() != kPathSize) {
    return Result<DecodedPath>::Fail(SwapError::EncodingError, "path must be 43 bytes, got " + std::to_string(path.size()));
  }
  DecodedPath out;
  out.token_a = "0x" + BytesToHex(path.data(), kAddressSize);
  out.fee = (static_cast<unsigned int>(path[20]) << 16) | (static_cast<unsigned int>(path[21]) << 8) | path[22];
  out.token_b = "0x" + BytesToHex(path.data() + kAddressSize + kFeeSize, kAddressSize);
  return out;
}
