#include "swap/allowance_manager.hpp"
#include "config/swap_policy.hpp"
#include "protocols/erc20.hpp"
#include "wallet/transaction_sender.hpp"
#include "common/logger.hpp"
#include "telemetry/structured_logger.hpp"

AllowanceManager::AllowanceManager(RpcClient& rpc, TransactionSender& sender, const SwapPolicy& policy)
  : rpc_(rpc), sender_(sender), policy_(policy) {}

Result<AllowanceStatus> AllowanceManager::EnsureAllowance(const std::string& token,
                                                          const std::string& spender,
                                                          const Uint256& required) {
  using R = Result<AllowanceStatus>;
  const std::string owner = sender_.From();
  const std::string ctx = "token=" + token + " spender=" + spender + " required=" + ToDecimalString(required);

  auto current = ERC20::Allowance(rpc_, token, owner, spender);
  if (!current) return R::Fail(SwapError::ApprovalFailed, ctx + ": allowance() unreadable");
  if (*current >= required) {
    LOG_INFO("Allowance already sufficient (" + ToDecimalString(*current) + ") " + ctx);
    return AllowanceStatus{ AllowanceAction::AlreadySufficient, *current, std::string() };
  }

  LOG_INFO("Allowance " + ToDecimalString(*current) + " below required, approving max " + ctx);
  auto sent = sender_.Send(token, ERC20::BuildApproveCalldata(spender, MaxUint256()), policy_.approval_gas_limit);
  if (!sent) return R::Fail(SwapError::ApprovalFailed, ctx + ": " + sent.error().detail);
  const std::string& hash = sent.value();
  StructuredLogger::Instance().LogEvent("approval_submitted", { {"token", token}, {"spender", spender}, {"tx_hash", hash} });

  auto conf = sender_.WaitForReceipt(hash, policy_.approval_timeout, policy_.receipt_poll_interval);
  switch (conf.state) {
    case ConfirmationState::Confirmed:
      LOG_INFO("Approval confirmed tx=" + hash);
      return AllowanceStatus{ AllowanceAction::Approved, MaxUint256(), hash };
    case ConfirmationState::Reverted:
      return R::Fail(SwapError::ApprovalFailed, ctx + ": approval reverted tx=" + hash);
    case ConfirmationState::Timeout:
      break;
  }
  return R::Fail(SwapError::ApprovalFailed, ctx + ": approval not confirmed within " +
                 std::to_string(policy_.approval_timeout.count()) + " ms tx=" + hash);
}
