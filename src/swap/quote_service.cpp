#include "swap/quote_service.hpp"
#include "config/network.hpp"
#include "constants/uniswap.hpp"
#include "encoding/abi.hpp"
#include "node_connection/rpc_client.hpp"
#include "common/logger.hpp"
#include "telemetry/structured_logger.hpp"

QuoteService::QuoteService(RpcClient& rpc, const NetworkConfig& network) : rpc_(rpc), network_(network) {}

Bytes QuoteService::BuildQuoteCalldata(const std::string& token_in,
                                       const std::string& token_out,
                                       const Uint256& amount_in,
                                       unsigned int fee) {
  return ABI::EncodeCall(UniswapConstants::SEL_QUOTE_EXACT_INPUT_SINGLE, {
    ABI::Value::Addr(token_in),
    ABI::Value::Addr(token_out),
    ABI::Value::Uint(Uint256(fee)),
    ABI::Value::Uint(amount_in),
    ABI::Value::Uint(Uint256(0))   // sqrtPriceLimitX96: unbounded
  });
}

Result<Uint256> QuoteService::Quote(const std::string& token_in,
                                    const std::string& token_out,
                                    const Uint256& amount_in,
                                    unsigned int fee) {
  const std::string ctx = token_in + " -> " + token_out + " fee=" + std::to_string(fee) +
                          " amount_in=" + ToDecimalString(amount_in);
  Uint256 amount_out = 0;
  try {
    auto data = BuildQuoteCalldata(token_in, token_out, amount_in, fee);
    auto res = rpc_.EthCall(network_.contracts.quoter, data);
    amount_out = ABI::WordAt(res, 0);
  } catch (const std::exception& ex) {
    LOG_WARN("Quote unavailable for " + ctx + ": " + ex.what());
    return Result<Uint256>::Fail(SwapError::QuoteUnavailable, ctx + ": " + ex.what());
  }
  if (amount_out == 0) {
    LOG_WARN("Quoter returned zero for " + ctx);
    return Result<Uint256>::Fail(SwapError::QuoteUnavailable, ctx + ": quoter returned zero output");
  }
  StructuredLogger::Instance().LogEvent("quote", {
    {"token_in", token_in},
    {"token_out", token_out},
    {"fee", fee},
    {"amount_in", ToDecimalString(amount_in)},
    {"amount_out", ToDecimalString(amount_out)}
  });
  return amount_out;
}
