#pragma once
#include <string>
#include "common/result.hpp"
#include "swap/types.hpp"

class RpcClient;
class TransactionSender;
class AllowanceManager;
class QuoteService;
class CommandBuilder;
struct NetworkConfig;
struct SwapPolicy;

// Drives one swap from intent to confirmed result:
// Init -> InfoFetched -> BalanceChecked -> Approved -> Quoted -> PlanBuilt
//      -> Submitted -> Confirmed, or Failed from any stage.
// Each stage runs at most once and nothing is retried. Exceptions never
// escape Execute; they become a failed outcome.
class SwapOrchestrator {
public:
  SwapOrchestrator(RpcClient& rpc,
                   TransactionSender& sender,
                   AllowanceManager& allowances,
                   QuoteService& quotes,
                   const CommandBuilder& commands,
                   const NetworkConfig& network,
                   const SwapPolicy& policy);

  SwapOutcome Execute(const SwapIntent& intent);

  // symbol, decimals, balance of the sender and allowance towards the spender
  Result<TokenInfo> FetchTokenInfo(const std::string& token);
private:
  RpcClient& rpc_;
  TransactionSender& sender_;
  AllowanceManager& allowances_;
  QuoteService& quotes_;
  const CommandBuilder& commands_;
  const NetworkConfig& network_;
  const SwapPolicy& policy_;

  void Run(const SwapIntent& intent, SwapOutcome& out);
  void Advance(SwapOutcome& out, SwapStage next, const std::string& note);
  void Fail(SwapOutcome& out, const Failure& failure);
  void RefreshBalances(const SwapIntent& intent, SwapOutcome& out);
};
