#include "common/uint256.hpp"
#include <iterator>
#include <stdexcept>

Uint256 MaxUint256() {
  return ~Uint256(0);
}

Uint256 Uint256FromHex(const std::string& hex) {
  std::string s = Strip0x(hex);
  if (s.empty()) throw std::invalid_argument("empty hex quantity");
  // strip leading zero nibbles so that 32-byte words with padding parse fine
  size_t first = s.find_first_not_of('0');
  if (first == std::string::npos) return Uint256(0);
  s = s.substr(first);
  if (s.size() > 64) throw std::out_of_range("hex value exceeds 256 bits: " + hex);
  Uint256 v = 0;
  for (char c : s) {
    int n = HexNibble(c);
    if (n < 0) throw std::invalid_argument("invalid hex quantity: " + hex);
    v <<= 4;
    v |= static_cast<unsigned>(n);
  }
  return v;
}

Uint256 Uint256FromBigEndian(const unsigned char* data, size_t len) {
  if (len > 32) throw std::out_of_range("big-endian value exceeds 32 bytes");
  Uint256 v = 0;
  if (len == 0) return v;
  boost::multiprecision::import_bits(v, data, data + len, 8);
  return v;
}

std::string ToHexQuantity(const Uint256& v) {
  if (v == 0) return "0x0";
  Bytes bytes;
  boost::multiprecision::export_bits(v, std::back_inserter(bytes), 8);
  std::string h = BytesToHex(bytes.data(), bytes.size());
  size_t first = h.find_first_not_of('0');
  return "0x" + h.substr(first);
}

Bytes ToWord(const Uint256& v) {
  Bytes bytes;
  boost::multiprecision::export_bits(v, std::back_inserter(bytes), 8);
  Bytes out(32, 0);
  std::copy(bytes.begin(), bytes.end(), out.begin() + (32 - bytes.size()));
  return out;
}

std::string ToDecimalString(const Uint256& v) {
  return v.str();
}
