#include "swap/swap_orchestrator.hpp"
#include "swap/allowance_manager.hpp"
#include "swap/amount_math.hpp"
#include "swap/command_builder.hpp"
#include "swap/quote_service.hpp"
#include "config/network.hpp"
#include "config/swap_policy.hpp"
#include "constants/uniswap.hpp"
#include "node_connection/rpc_client.hpp"
#include "protocols/erc20.hpp"
#include "wallet/transaction_sender.hpp"
#include "common/logger.hpp"
#include "utils/hex.hpp"
#include "telemetry/structured_logger.hpp"
#include <chrono>

SwapOrchestrator::SwapOrchestrator(RpcClient& rpc,
                                   TransactionSender& sender,
                                   AllowanceManager& allowances,
                                   QuoteService& quotes,
                                   const CommandBuilder& commands,
                                   const NetworkConfig& network,
                                   const SwapPolicy& policy)
  : rpc_(rpc), sender_(sender), allowances_(allowances), quotes_(quotes),
    commands_(commands), network_(network), policy_(policy) {}

Result<TokenInfo> SwapOrchestrator::FetchTokenInfo(const std::string& token) {
  using R = Result<TokenInfo>;
  if (!IsValidAddress(token)) return R::Fail(SwapError::TokenInfoUnavailable, "malformed token address '" + token + "'");
  const std::string owner = sender_.From();
  TokenInfo info;
  info.address = token;
  auto symbol = ERC20::Symbol(rpc_, token);
  if (!symbol) return R::Fail(SwapError::TokenInfoUnavailable, token + ": symbol() failed");
  auto decimals = ERC20::Decimals(rpc_, token);
  if (!decimals) return R::Fail(SwapError::TokenInfoUnavailable, token + ": decimals() failed");
  auto balance = ERC20::BalanceOf(rpc_, token, owner);
  if (!balance) return R::Fail(SwapError::TokenInfoUnavailable, token + ": balanceOf(" + owner + ") failed");
  auto allowance = ERC20::Allowance(rpc_, token, owner, network_.contracts.permit2);
  if (!allowance) return R::Fail(SwapError::TokenInfoUnavailable, token + ": allowance() failed");
  info.symbol = *symbol;
  info.decimals = *decimals;
  info.balance = *balance;
  info.allowance = *allowance;
  return info;
}

SwapOutcome SwapOrchestrator::Execute(const SwapIntent& intent) {
  SwapOutcome out;
  out.dry_run = policy_.dry_run;
  LOG_INFO("Swap requested: " + intent.amount_in + " of " + intent.token_in + " -> " + intent.token_out +
           " fee=" + std::to_string(intent.fee) + " slippage=" + intent.slippage_percent + "%" +
           (policy_.dry_run ? " [dry run]" : ""));
  auto& events = StructuredLogger::Instance();
  events.SetContext("run", "swap-" + std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count()));
  events.SetContext("pair", intent.token_in + "->" + intent.token_out);
  try {
    Run(intent, out);
  } catch (const std::exception& ex) {
    Fail(out, Failure{ SwapError::Unexpected, std::string("unhandled error at ") + SwapStageName(out.stage) + ": " + ex.what() });
  }
  events.ClearContext();
  if (out.success) LOG_INFO(out.Describe()); else LOG_ERROR(out.Describe());
  return out;
}

void SwapOrchestrator::Advance(SwapOutcome& out, SwapStage next, const std::string& note) {
  out.stage = next;
  LOG_INFO(std::string("[") + SwapStageName(next) + "] " + note);
  StructuredLogger::Instance().LogEvent("swap_stage", { {"stage", SwapStageName(next)}, {"note", note} });
}

void SwapOrchestrator::Fail(SwapOutcome& out, const Failure& failure) {
  out.success = false;
  out.failed_after = out.stage;
  out.stage = SwapStage::Failed;
  out.failure = failure;
  StructuredLogger::Instance().LogEvent("swap_stage", {
    {"stage", "Failed"},
    {"after", SwapStageName(out.failed_after)},
    {"reason", SwapErrorName(failure.code)},
    {"detail", failure.detail}
  });
}

void SwapOrchestrator::Run(const SwapIntent& intent, SwapOutcome& out) {
  // Intent checks that need no chain access
  auto slippage = ParseSlippage(intent.slippage_percent);
  if (!slippage.ok()) return Fail(out, slippage.error());
  if (intent.fee > UniswapConstants::MAX_FEE_TIER) {
    return Fail(out, Failure{ SwapError::EncodingError, "fee " + std::to_string(intent.fee) + " does not fit in 3 bytes" });
  }
  if (ToLowerHex(intent.token_in) == ToLowerHex(intent.token_out)) {
    return Fail(out, Failure{ SwapError::InvalidIntent, "token_in and token_out are the same: " + intent.token_in });
  }

  try {
    int chain = rpc_.EthChainId();
    if (chain != network_.chain_id) {
      LOG_WARN("RPC endpoint reports chain " + std::to_string(chain) + " but configuration says " + std::to_string(network_.chain_id));
    }
  } catch (const std::exception& ex) {
    return Fail(out, Failure{ SwapError::ConnectivityError, rpc_.Endpoint() + ": " + ex.what() });
  }

  // 1. Init -> InfoFetched
  auto in_info = FetchTokenInfo(intent.token_in);
  if (!in_info) return Fail(out, in_info.error());
  auto out_info = FetchTokenInfo(intent.token_out);
  if (!out_info) return Fail(out, out_info.error());
  Advance(out, SwapStage::InfoFetched,
          in_info->symbol + " balance " + FormatUnits(in_info->balance, in_info->decimals) + ", " +
          out_info->symbol + " balance " + FormatUnits(out_info->balance, out_info->decimals));

  // 2. InfoFetched -> BalanceChecked
  auto amount_in = ParseUnits(intent.amount_in, in_info->decimals);
  if (!amount_in) return Fail(out, amount_in.error());
  if (amount_in.value() == 0) {
    return Fail(out, Failure{ SwapError::InvalidIntent, "amount '" + intent.amount_in + "' is zero in smallest units" });
  }
  if (in_info->balance < amount_in.value()) {
    return Fail(out, Failure{ SwapError::InsufficientBalance,
      in_info->symbol + " (" + intent.token_in + ") balance " + ToDecimalString(in_info->balance) +
      " < required " + ToDecimalString(amount_in.value()) + " for holder " + sender_.From() });
  }
  Advance(out, SwapStage::BalanceChecked, "amount_in=" + ToDecimalString(amount_in.value()) + " " + in_info->symbol);

  // 3. BalanceChecked -> Approved
  const std::string& spender = network_.contracts.permit2;
  if (policy_.dry_run) {
    if (in_info->allowance < amount_in.value()) {
      LOG_WARN("Dry run: allowance " + ToDecimalString(in_info->allowance) + " to " + spender + " is insufficient; a live run would approve");
    }
    Advance(out, SwapStage::Approved, "dry run, approval skipped");
  } else {
    auto approved = allowances_.EnsureAllowance(intent.token_in, spender, amount_in.value());
    if (!approved) return Fail(out, approved.error());
    out.approval_tx_hash = approved->approval_tx_hash;
    Advance(out, SwapStage::Approved,
            approved->action == AllowanceAction::Approved ? "approved tx=" + approved->approval_tx_hash : "allowance already sufficient");
  }

  // 4. Approved -> Quoted
  auto quoted = quotes_.Quote(intent.token_in, intent.token_out, amount_in.value(), intent.fee);
  if (!quoted) return Fail(out, quoted.error());
  Advance(out, SwapStage::Quoted, "expected out " + FormatUnits(quoted.value(), out_info->decimals) + " " + out_info->symbol);

  // 5. Quoted -> PlanBuilt
  SwapPlan plan;
  plan.token_in = intent.token_in;
  plan.token_out = intent.token_out;
  plan.amount_in = amount_in.value();
  plan.quoted_amount_out = quoted.value();
  plan.amount_out_minimum = MinimumAmountOut(quoted.value(), slippage.value());
  plan.recipient = sender_.From();
  plan.fee = intent.fee;
  auto now_s = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
  plan.deadline = static_cast<unsigned long long>(now_s + policy_.deadline_window_s);
  out.plan = plan;

  auto cmd = commands_.Build(plan);
  if (!cmd) return Fail(out, cmd.error());
  out.execute_calldata = CommandBuilder::BuildExecuteCalldata(cmd.value(), plan.deadline);
  Advance(out, SwapStage::PlanBuilt,
          "min_out=" + ToDecimalString(plan.amount_out_minimum) + " deadline=" + std::to_string(plan.deadline) +
          " encoder=" + commands_.Strategy().Name());

  if (policy_.dry_run) {
    out.success = true;
    return;
  }

  // 6. PlanBuilt -> Submitted
  auto sent = sender_.Send(network_.contracts.universal_router, out.execute_calldata, policy_.swap_gas_limit);
  if (!sent) return Fail(out, sent.error());
  out.tx_hash = sent.value();
  Advance(out, SwapStage::Submitted, "tx=" + out.tx_hash);

  // 7. Submitted -> Confirmed
  auto conf = sender_.WaitForReceipt(out.tx_hash, policy_.confirmation_timeout, policy_.receipt_poll_interval);
  if (conf.receipt) out.gas_used = conf.receipt->gas_used;
  if (conf.state == ConfirmationState::Reverted) {
    return Fail(out, Failure{ SwapError::TransactionReverted,
      "swap reverted tx=" + out.tx_hash + " gas_used=" + ToDecimalString(out.gas_used) });
  }
  if (conf.state == ConfirmationState::Timeout) {
    return Fail(out, Failure{ SwapError::ConfirmationTimeout,
      "no receipt within " + std::to_string(policy_.confirmation_timeout.count()) + " ms tx=" + out.tx_hash +
      " (outcome unknown, the transaction may still be mined)" });
  }
  out.success = true;
  Advance(out, SwapStage::Confirmed, "tx=" + out.tx_hash + " gas_used=" + ToDecimalString(out.gas_used));

  // 8. best-effort refresh
  RefreshBalances(intent, out);
}

void SwapOrchestrator::RefreshBalances(const SwapIntent& intent, SwapOutcome& out) {
  try {
    auto in_after = FetchTokenInfo(intent.token_in);
    if (in_after) out.token_in_after = in_after.value();
    else LOG_WARN("Post-swap refresh failed: " + in_after.error().Describe());
    auto out_after = FetchTokenInfo(intent.token_out);
    if (out_after) out.token_out_after = out_after.value();
    else LOG_WARN("Post-swap refresh failed: " + out_after.error().Describe());
  } catch (const std::exception& ex) {
    LOG_WARN(std::string("Post-swap refresh failed: ") + ex.what());
  }
}
