#include "wallet/signer.hpp"
#include "crypto/keccak.hpp"
#include "crypto/secp256k1.hpp"
#include "encoding/abi.hpp"
#include "encoding/rlp.hpp"
#include <stdexcept>

Signer::Signer(const std::string& private_key_hex) {
  if (private_key_hex.empty()) throw std::invalid_argument("empty private key");
  priv_ = HexToBytes(private_key_hex);
  if (priv_.size() != 32) throw std::invalid_argument("invalid private key length");
  auto pub = Crypto::PublicKeyFromPrivate(priv_);
  // keccak256 of pubkey[1:] (skip 0x04), last 20 bytes
  auto hash = Crypto::Keccak256(Bytes(pub.begin() + 1, pub.end()));
  address_ = "0x" + BytesToHex(hash.data() + 12, 20);
}

std::string Signer::SignLegacy(const TransactionFields& tx) const {
  // [nonce, gasPrice, gasLimit, to, value, data]
  std::vector<Bytes> fields{
    RLP::EncodeUint(tx.nonce),
    RLP::EncodeUint(tx.gas_price),
    RLP::EncodeUint(tx.gas_limit),
    RLP::EncodeBytes(ABI::AddressBytes(tx.to)),
    RLP::EncodeUintBytes(ToWord(tx.value)),
    RLP::EncodeBytes(tx.data)
  };
  // EIP-155 sighash appends [chainId, 0, 0]
  std::vector<Bytes> unsigned_fields = fields;
  unsigned_fields.push_back(RLP::EncodeUint(static_cast<unsigned long long>(tx.chain_id)));
  unsigned_fields.push_back(RLP::EncodeUint(0));
  unsigned_fields.push_back(RLP::EncodeUint(0));
  auto digest = Crypto::Keccak256(RLP::EncodeList(unsigned_fields));

  auto sig = Crypto::SignDigest(priv_, digest);
  unsigned long long v = static_cast<unsigned long long>(sig.recovery_id) + 35ULL + 2ULL * static_cast<unsigned long long>(tx.chain_id);
  fields.push_back(RLP::EncodeUint(v));
  fields.push_back(RLP::EncodeUintBytes(sig.r));
  fields.push_back(RLP::EncodeUintBytes(sig.s));
  return BytesToHex0x(RLP::EncodeList(fields));
}

std::string Signer::Address() const { return address_; }

void Signer::VerifyAddress(const std::string& expected) const {
  if (ToLowerHex(expected) != address_) {
    throw std::invalid_argument("address " + expected + " does not belong to the private key (" + address_ + ")");
  }
}
