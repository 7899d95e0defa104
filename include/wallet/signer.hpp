#pragma once
#include <string>
#include <vector>
#include "common/uint256.hpp"

struct TransactionFields {
  int chain_id = 1;
  unsigned long long nonce = 0;
  unsigned long long gas_price = 0; // wei
  unsigned long long gas_limit = 0;
  std::string to; // 0x...
  Uint256 value = 0; // wei
  Bytes data;
};

class Signer {
public:
  explicit Signer(const std::string& private_key_hex);
  // Legacy transaction with EIP-155 replay protection; returns 0x raw tx hex.
  std::string SignLegacy(const TransactionFields& tx) const;
  std::string Address() const;
  // Throws std::invalid_argument unless `expected` is the key's address (any case).
  void VerifyAddress(const std::string& expected) const;
private:
  std::vector<unsigned char> priv_;
  std::string address_;
};
