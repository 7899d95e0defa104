#include "encoding/abi.hpp"
#include <stdexcept>

namespace {
  void append(Bytes& buf, const Bytes& more) {
    buf.insert(buf.end(), more.begin(), more.end());
  }

  Bytes pad32Right(const Bytes& data) {
    Bytes padded = data;
    size_t pad = (32 - (padded.size() % 32)) % 32;
    padded.insert(padded.end(), pad, 0);
    return padded;
  }

  Bytes encodeBytesArrayTail(const std::vector<Bytes>& items) {
    Bytes out = ABI::EncodeUint(Uint256(items.size()));
    Bytes heads, tails;
    const size_t head_size = 32 * items.size();
    for (const auto& item : items) {
      append(heads, ABI::EncodeUint(Uint256(head_size + tails.size())));
      append(tails, ABI::EncodeBytesTail(item));
    }
    append(out, heads);
    append(out, tails);
    return out;
  }
}

namespace ABI {
  Value Value::Addr(const std::string& a) { Value v; v.kind = Kind::Address; v.address = a; return v; }
  Value Value::Uint(const Uint256& n) { Value v; v.kind = Kind::Uint; v.number = n; return v; }
  Value Value::Bool(bool b) { Value v; v.kind = Kind::Bool; v.flag = b; return v; }
  Value Value::DynBytes(const Bytes& b) { Value v; v.kind = Kind::DynamicBytes; v.bytes = b; return v; }
  Value Value::DynBytesArray(const std::vector<Bytes>& items) { Value v; v.kind = Kind::BytesArray; v.bytes_array = items; return v; }

  Bytes AddressBytes(const std::string& addr) {
    if (!IsValidAddress(addr)) throw std::invalid_argument("malformed address: " + addr);
    return HexToBytes(addr);
  }

  Bytes EncodeAddress(const std::string& addr) {
    Bytes raw = AddressBytes(addr);
    Bytes out(12, 0);
    append(out, raw);
    return out;
  }

  Bytes EncodeUint(const Uint256& v) { return ToWord(v); }

  Bytes EncodeBool(bool b) { return EncodeUint(Uint256(b ? 1 : 0)); }

  Bytes EncodeBytesTail(const Bytes& data) {
    Bytes out = EncodeUint(Uint256(data.size()));
    append(out, pad32Right(data));
    return out;
  }

  Bytes Encode(const std::vector<Value>& params) {
    Bytes head, tail;
    const size_t head_size = 32 * params.size();
    for (const auto& p : params) {
      switch (p.kind) {
        case Kind::Address: append(head, EncodeAddress(p.address)); break;
        case Kind::Uint: append(head, EncodeUint(p.number)); break;
        case Kind::Bool: append(head, EncodeBool(p.flag)); break;
        case Kind::DynamicBytes:
          append(head, EncodeUint(Uint256(head_size + tail.size())));
          append(tail, EncodeBytesTail(p.bytes));
          break;
        case Kind::BytesArray:
          append(head, EncodeUint(Uint256(head_size + tail.size())));
          append(tail, encodeBytesArrayTail(p.bytes_array));
          break;
      }
    }
    append(head, tail);
    return head;
  }

  Bytes EncodeCall(const std::string& selector0x, const std::vector<Value>& params) {
    Bytes out = HexToBytes(selector0x);
    if (out.size() != 4) throw std::invalid_argument("selector must be 4 bytes: " + selector0x);
    append(out, Encode(params));
    return out;
  }

  Uint256 WordAt(const Bytes& data, size_t index) {
    size_t off = index * 32;
    if (data.size() < off + 32) throw std::out_of_range("ABI data too short for word " + std::to_string(index));
    return Uint256FromBigEndian(data.data() + off, 32);
  }

  std::string AddressAt(const Bytes& data, size_t index) {
    size_t off = index * 32;
    if (data.size() < off + 32) throw std::out_of_range("ABI data too short for address " + std::to_string(index));
    return "0x" + BytesToHex(data.data() + off + 12, 20);
  }

  std::string DecodeString(const Bytes& data) {
    if (data.size() == 32) {
      std::string s(data.begin(), data.end());
      auto end = s.find('\0');
      return end == std::string::npos ? s : s.substr(0, end);
    }
    Uint256 offset = WordAt(data, 0);
    if (offset % 32 != 0 || offset + 32 > data.size()) throw std::out_of_range("bad string offset");
    size_t off = static_cast<size_t>(offset);
    Uint256 len = WordAt(data, off / 32);
    if (off + 32 + len > data.size()) throw std::out_of_range("string length exceeds data");
    auto begin = data.begin() + static_cast<long>(off + 32);
    return std::string(begin, begin + static_cast<long>(len));
  }
}
