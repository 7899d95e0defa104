#include "swap/command_builder.hpp"
#include "swap/path_encoder.hpp"
#include "constants/uniswap.hpp"
#include "encoding/abi.hpp"
#include "common/logger.hpp"
#include <stdexcept>

namespace {
  void append(Bytes& buf, const Bytes& more) {
    buf.insert(buf.end(), more.begin(), more.end());
  }
}

Bytes StructuredSwapEncoder::EncodeSwapInput(const SwapPlan& plan, const Bytes& path) const {
  Bytes out;
  out.reserve(32 * 6 + ((path.size() + 31) / 32) * 32);
  // recipient
  append(out, ABI::EncodeAddress(plan.recipient));
  // amountIn
  append(out, ABI::EncodeUint(plan.amount_in));
  // amountOutMin
  append(out, ABI::EncodeUint(plan.amount_out_minimum));
  // path (dynamic) -> head is 5 slots, so offset = 5*32 = 160 bytes
  append(out, ABI::EncodeUint(Uint256(5 * 32)));
  // payerIsUser: funds are pulled from the transaction sender
  append(out, ABI::EncodeBool(true));
  append(out, ABI::EncodeBytesTail(path));
  return out;
}

Bytes GenericAbiEncoder::EncodeSwapInput(const SwapPlan& plan, const Bytes& path) const {
  return ABI::Encode({
    ABI::Value::Addr(plan.recipient),
    ABI::Value::Uint(plan.amount_in),
    ABI::Value::Uint(plan.amount_out_minimum),
    ABI::Value::DynBytes(path),
    ABI::Value::Bool(true)
  });
}

std::unique_ptr<CommandEncodingStrategy> SelectCommandEncodingStrategy(bool structured_available) {
  if (structured_available) return std::unique_ptr<CommandEncodingStrategy>(new StructuredSwapEncoder());
  LOG_WARN("Structured router encoder unavailable, falling back to generic ABI encoding");
  return std::unique_ptr<CommandEncodingStrategy>(new GenericAbiEncoder());
}

CommandBuilder::CommandBuilder(std::unique_ptr<CommandEncodingStrategy> strategy) : strategy_(std::move(strategy)) {
  if (!strategy_) throw std::invalid_argument("CommandBuilder requires an encoding strategy");
}

Result<RouterCommand> CommandBuilder::Build(const SwapPlan& plan) const {
  auto path = PathEncoder::Encode(plan.token_in, plan.fee, plan.token_out);
  if (!path) return path.error();
  if (!IsValidAddress(plan.recipient)) {
    return Result<RouterCommand>::Fail(SwapError::EncodingError, "malformed recipient '" + plan.recipient + "'");
  }
  RouterCommand cmd;
  cmd.commands.push_back(UniswapConstants::CMD_V3_SWAP_EXACT_IN);
  cmd.inputs.push_back(strategy_->EncodeSwapInput(plan, path.value()));
  return cmd;
}

Bytes CommandBuilder::BuildExecuteCalldata(const RouterCommand& cmd, unsigned long long deadline) {
  return ABI::EncodeCall(UniswapConstants::SEL_EXECUTE, {
    ABI::Value::DynBytes(cmd.commands),
    ABI::Value::DynBytesArray(cmd.inputs),
    ABI::Value::Uint(Uint256(deadline))
  });
}
