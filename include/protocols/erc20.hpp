#pragma once
#include <optional>
#include <string>
#include "common/uint256.hpp"

class RpcClient;

// Read helpers return nullopt (and log why) when the call fails or the
// contract answers with something that is not a valid ERC20 response.
namespace ERC20 {
  std::optional<std::string> Symbol(RpcClient& rpc, const std::string& token);
  std::optional<int> Decimals(RpcClient& rpc, const std::string& token);
  std::optional<Uint256> BalanceOf(RpcClient& rpc, const std::string& token, const std::string& owner);
  std::optional<Uint256> Allowance(RpcClient& rpc, const std::string& token, const std::string& owner, const std::string& spender);
  // approve(spender, amount) calldata
  Bytes BuildApproveCalldata(const std::string& spender, const Uint256& amount);
}
