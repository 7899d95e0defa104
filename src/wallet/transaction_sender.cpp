#include "wallet/transaction_sender.hpp"
#include "wallet/signer.hpp"
#include "gas/gas_strategy.hpp"
#include "common/logger.hpp"
#include "telemetry/structured_logger.hpp"
#include <algorithm>
#include <thread>

TransactionSender::TransactionSender(RpcClient& rpc, const Signer& signer, GasStrategy& gas, int chain_id)
  : rpc_(rpc), signer_(signer), gas_(gas), chain_id_(chain_id) {}

std::string TransactionSender::From() const { return signer_.Address(); }

Result<std::string> TransactionSender::Send(const std::string& to, const Bytes& data, unsigned long long gas_limit, const Uint256& value) {
  auto gas_price = gas_.GasPrice();
  if (!gas_price) return Result<std::string>::Fail(SwapError::SubmissionFailed, "gas price unavailable");

  TransactionFields tx;
  tx.chain_id = chain_id_;
  tx.gas_price = *gas_price;
  tx.gas_limit = gas_limit;
  tx.to = to;
  tx.value = value;
  tx.data = data;
  try {
    tx.nonce = rpc_.EthGetTransactionCount(signer_.Address(), "pending");
  } catch (const std::exception& ex) {
    return Result<std::string>::Fail(SwapError::SubmissionFailed, std::string("nonce lookup failed: ") + ex.what());
  }

  std::string raw;
  try {
    raw = signer_.SignLegacy(tx);
  } catch (const std::exception& ex) {
    return Result<std::string>::Fail(SwapError::SubmissionFailed, std::string("signing failed: ") + ex.what());
  }

  std::string tx_hash;
  try {
    tx_hash = rpc_.EthSendRawTransaction(raw);
  } catch (const std::exception& ex) {
    return Result<std::string>::Fail(SwapError::SubmissionFailed, std::string("broadcast failed: ") + ex.what());
  }

  LOG_INFO("Sent tx " + tx_hash + " to " + to + " nonce=" + std::to_string(tx.nonce) +
           " gas_price=" + std::to_string(tx.gas_price) + " gas_limit=" + std::to_string(gas_limit));
  StructuredLogger::Instance().LogEvent("tx_submitted", {
    {"tx_hash", tx_hash},
    {"to", to},
    {"nonce", tx.nonce},
    {"gas_price_wei", std::to_string(tx.gas_price)},
    {"gas_limit", gas_limit}
  });
  return tx_hash;
}

Confirmation TransactionSender::WaitForReceipt(const std::string& tx_hash,
                                               std::chrono::milliseconds timeout,
                                               std::chrono::milliseconds poll_interval) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  Confirmation out;
  while (true) {
    try {
      auto receipt = rpc_.EthGetTransactionReceipt(tx_hash);
      if (receipt) {
        out.state = receipt->status_ok ? ConfirmationState::Confirmed : ConfirmationState::Reverted;
        out.receipt = receipt;
        StructuredLogger::Instance().LogEvent("tx_receipt", {
          {"tx_hash", tx_hash},
          {"status", receipt->status_ok ? "success" : "reverted"},
          {"gas_used", ToDecimalString(receipt->gas_used)},
          {"block", receipt->block_number}
        });
        return out;
      }
    } catch (const std::exception& ex) {
      LOG_WARN("receipt poll for " + tx_hash + " failed: " + ex.what());
    }
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) break;
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(std::min(poll_interval, remaining));
  }
  LOG_WARN("No receipt for " + tx_hash + " after " + std::to_string(timeout.count()) + " ms");
  out.state = ConfirmationState::Timeout;
  return out;
}
