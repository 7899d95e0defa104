#pragma once
#include <string>
#include "common/result.hpp"
#include "common/uint256.hpp"

class RpcClient;
class TransactionSender;
struct SwapPolicy;

enum class AllowanceAction { AlreadySufficient, Approved };

struct AllowanceStatus {
  AllowanceAction action = AllowanceAction::AlreadySufficient;
  Uint256 allowance = 0;         // allowance after the call
  std::string approval_tx_hash;  // set when an approval was sent
};

// Brings an ERC20 allowance for (owner, spender) up to a required amount.
class AllowanceManager {
public:
  AllowanceManager(RpcClient& rpc, TransactionSender& sender, const SwapPolicy& policy);
  // Sends approve(spender, 2^256-1) only when the current allowance is
  // below required, then blocks until the receipt or the approval timeout.
  // Every failure path is ApprovalFailed.
  Result<AllowanceStatus> EnsureAllowance(const std::string& token,
                                          const std::string& spender,
                                          const Uint256& required);
private:
  RpcClient& rpc_;
  TransactionSender& sender_;
  const SwapPolicy& policy_;
};
