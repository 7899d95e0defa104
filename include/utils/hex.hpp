#pragma once
#include <string>
#include <vector>
#include <algorithm>
#include <cctype>
#include <stdexcept>

using Bytes = std::vector<unsigned char>;

inline std::string Strip0x(const std::string& s) {
  if (s.rfind("0x", 0) == 0 || s.rfind("0X", 0) == 0) return s.substr(2);
  return s;
}

inline std::string ToLowerHex(const std::string& s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return out;
}

inline int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + c - 'a';
  if (c >= 'A' && c <= 'F') return 10 + c - 'A';
  return -1;
}

inline bool IsHexString(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](char c){ return HexNibble(c) >= 0; });
}

// Throws std::invalid_argument on odd length or non-hex characters.
inline Bytes HexToBytes(const std::string& hex) {
  std::string s = Strip0x(hex);
  if (s.size() % 2 != 0) throw std::invalid_argument("odd-length hex: " + hex);
  Bytes out; out.reserve(s.size() / 2);
  for (size_t i = 0; i < s.size(); i += 2) {
    int hi = HexNibble(s[i]), lo = HexNibble(s[i + 1]);
    if (hi < 0 || lo < 0) throw std::invalid_argument("invalid hex: " + hex);
    out.push_back(static_cast<unsigned char>((hi << 4) | lo));
  }
  return out;
}

inline std::string BytesToHex(const unsigned char* data, size_t len) {
  static const char* hex = "0123456789abcdef";
  std::string out; out.reserve(2 * len);
  for (size_t i = 0; i < len; ++i) { out += hex[data[i] >> 4]; out += hex[data[i] & 0xF]; }
  return out;
}

inline std::string BytesToHex0x(const Bytes& data) {
  return "0x" + BytesToHex(data.data(), data.size());
}

// 0x + 40 hex chars. Checksum casing is not verified.
inline bool IsValidAddress(const std::string& addr) {
  if (addr.size() != 42 || addr[0] != '0' || (addr[1] != 'x' && addr[1] != 'X')) return false;
  return IsHexString(addr.substr(2));
}
