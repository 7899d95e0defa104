#include "encoding/rlp.hpp"

namespace {
  void append(Bytes& buf, const Bytes& more) {
    buf.insert(buf.end(), more.begin(), more.end());
  }

  Bytes encodeLength(size_t len, unsigned char offset) {
    if (len < 56) {
      return Bytes{ static_cast<unsigned char>(offset + len) };
    }
    // long length
    Bytes lenBytes;
    size_t tmp = len;
    while (tmp) { lenBytes.insert(lenBytes.begin(), static_cast<unsigned char>(tmp & 0xFF)); tmp >>= 8; }
    Bytes out;
    out.push_back(static_cast<unsigned char>(offset + 55 + lenBytes.size()));
    append(out, lenBytes);
    return out;
  }
}

namespace RLP {
  Bytes EncodeBytes(const Bytes& data) {
    if (data.size() == 1 && data[0] < 0x80) return data;
    Bytes out = encodeLength(data.size(), 0x80);
    append(out, data);
    return out;
  }

  Bytes EncodeUint(unsigned long long value) {
    // zero is the empty string (0x80)
    Bytes bytes;
    while (value) { bytes.insert(bytes.begin(), static_cast<unsigned char>(value & 0xFF)); value >>= 8; }
    return EncodeBytes(bytes);
  }

  Bytes EncodeUintBytes(const Bytes& big_endian) {
    size_t first = 0;
    while (first < big_endian.size() && big_endian[first] == 0) ++first;
    return EncodeBytes(Bytes(big_endian.begin() + static_cast<long>(first), big_endian.end()));
  }

  Bytes EncodeList(const std::vector<Bytes>& encoded_items) {
    Bytes payload;
    for (const auto& e : encoded_items) append(payload, e);
    Bytes out = encodeLength(payload.size(), 0xC0);
    append(out, payload);
    return out;
  }
}
