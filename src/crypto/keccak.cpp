#include "crypto/keccak.hpp"
#include <cryptopp/keccak.h>

namespace Crypto {
  Bytes Keccak256(const Bytes& data) {
    CryptoPP::Keccak_256 hash;
    Bytes digest(CryptoPP::Keccak_256::DIGESTSIZE);
    hash.CalculateDigest(digest.data(), data.data(), data.size());
    return digest;
  }

  Bytes Keccak256(const std::string& raw) {
    return Keccak256(Bytes(raw.begin(), raw.end()));
  }

  std::string FunctionSelector(const std::string& signature) {
    auto digest = Keccak256(signature);
    return "0x" + BytesToHex(digest.data(), 4);
  }
}
