#include "protocols/erc20.hpp"
#include "node_connection/rpc_client.hpp"
#include "encoding/abi.hpp"
#include "constants/uniswap.hpp"
#include "common/logger.hpp"

using UniswapConstants::SEL_ALLOWANCE;
using UniswapConstants::SEL_APPROVE;
using UniswapConstants::SEL_BALANCE_OF;
using UniswapConstants::SEL_DECIMALS;
using UniswapConstants::SEL_SYMBOL;

namespace {
  std::optional<Uint256> CallForWord(RpcClient& rpc, const std::string& token, const Bytes& data, const char* what) {
    try {
      auto res = rpc.EthCall(token, data);
      return ABI::WordAt(res, 0);
    } catch (const std::exception& ex) {
      LOG_WARN(std::string(what) + " failed for " + token + ": " + ex.what());
      return std::nullopt;
    }
  }
}

namespace ERC20 {
  std::optional<std::string> Symbol(RpcClient& rpc, const std::string& token) {
    try {
      auto res = rpc.EthCall(token, ABI::EncodeCall(SEL_SYMBOL, {}));
      return ABI::DecodeString(res);
    } catch (const std::exception& ex) {
      LOG_WARN("symbol() failed for " + token + ": " + ex.what());
      return std::nullopt;
    }
  }

  std::optional<int> Decimals(RpcClient& rpc, const std::string& token) {
    auto word = CallForWord(rpc, token, ABI::EncodeCall(SEL_DECIMALS, {}), "decimals()");
    if (!word) return std::nullopt;
    // uint8 on-chain; 10^77 is the largest power of ten below 2^256
    if (*word > 77) {
      LOG_WARN("decimals() out of range for " + token + ": " + ToDecimalString(*word));
      return std::nullopt;
    }
    return static_cast<int>(*word);
  }

  std::optional<Uint256> BalanceOf(RpcClient& rpc, const std::string& token, const std::string& owner) {
    return CallForWord(rpc, token, ABI::EncodeCall(SEL_BALANCE_OF, { ABI::Value::Addr(owner) }), "balanceOf()");
  }

  std::optional<Uint256> Allowance(RpcClient& rpc, const std::string& token, const std::string& owner, const std::string& spender) {
    return CallForWord(rpc, token,
                       ABI::EncodeCall(SEL_ALLOWANCE, { ABI::Value::Addr(owner), ABI::Value::Addr(spender) }),
                       "allowance()");
  }

  Bytes BuildApproveCalldata(const std::string& spender, const Uint256& amount) {
    return ABI::EncodeCall(SEL_APPROVE, { ABI::Value::Addr(spender), ABI::Value::Uint(amount) });
  }
}
