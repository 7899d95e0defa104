#pragma once
#include <chrono>
#include <optional>
#include <string>
#include "common/result.hpp"
#include "common/uint256.hpp"
#include "node_connection/rpc_client.hpp"

class Signer;
class GasStrategy;

enum class ConfirmationState { Confirmed, Reverted, Timeout };

struct Confirmation {
  ConfirmationState state = ConfirmationState::Timeout;
  std::optional<TransactionReceipt> receipt;
};

// Signs and broadcasts legacy transactions for one account. The nonce is read
// from the node ("pending") immediately before each signature and is not
// reserved: callers sharing a key must serialize their submissions.
class TransactionSender {
public:
  TransactionSender(RpcClient& rpc, const Signer& signer, GasStrategy& gas, int chain_id);
  // Returns the transaction hash or SubmissionFailed.
  Result<std::string> Send(const std::string& to, const Bytes& data, unsigned long long gas_limit, const Uint256& value = 0);
  // Polls for the receipt until it appears or timeout elapses. Transient RPC
  // errors while polling are logged and polling continues.
  Confirmation WaitForReceipt(const std::string& tx_hash,
                              std::chrono::milliseconds timeout,
                              std::chrono::milliseconds poll_interval);
  std::string From() const;
private:
  RpcClient& rpc_;
  const Signer& signer_;
  GasStrategy& gas_;
  int chain_id_;
};
