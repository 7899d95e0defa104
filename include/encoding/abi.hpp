#pragma once
#include <string>
#include <vector>
#include "common/uint256.hpp"

// Solidity ABI encoding for the handful of types the swap pipeline needs.
namespace ABI {
  enum class Kind { Address, Uint, Bool, DynamicBytes, BytesArray };

  struct Value {
    Kind kind = Kind::Uint;
    std::string address;
    Uint256 number = 0;
    bool flag = false;
    Bytes bytes;
    std::vector<Bytes> bytes_array;

    static Value Addr(const std::string& a);
    static Value Uint(const Uint256& n);
    static Value Bool(bool b);
    static Value DynBytes(const Bytes& b);
    static Value DynBytesArray(const std::vector<Bytes>& items);
    bool IsDynamic() const { return kind == Kind::DynamicBytes || kind == Kind::BytesArray; }
  };

  // Throws std::invalid_argument for anything but 0x + 40 hex chars.
  Bytes AddressBytes(const std::string& addr);
  Bytes EncodeAddress(const std::string& addr);
  Bytes EncodeUint(const Uint256& v);
  Bytes EncodeBool(bool b);
  // length word followed by data right-padded to 32 bytes
  Bytes EncodeBytesTail(const Bytes& data);

  // Head/tail encoding of a parameter tuple.
  Bytes Encode(const std::vector<Value>& params);
  // selector (0x + 8 hex) followed by Encode(params)
  Bytes EncodeCall(const std::string& selector0x, const std::vector<Value>& params);

  // index-th 32-byte word; throws std::out_of_range if the data is short
  Uint256 WordAt(const Bytes& data, size_t index);
  std::string AddressAt(const Bytes& data, size_t index);
  // ABI `string` return value; 32-byte responses are read as bytes32 (right-padded)
  std::string DecodeString(const Bytes& data);
}
