#pragma once
#include <chrono>
#include <string>
#include <optional>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "common/uint256.hpp"

class HttpClient;

struct TransactionReceipt {
  std::string tx_hash;
  bool status_ok = false;
  Uint256 gas_used = 0;
  unsigned long long block_number = 0;
};

// JSON-RPC client over the HttpClient seam. Transport failures, non-2xx
// replies and node error objects are thrown (std::runtime_error / RpcError).
class RpcClient {
public:
  RpcClient(HttpClient& http,
            const std::string& endpoint_url,
            const std::optional<std::string>& auth_header = std::nullopt,
            int timeout_ms = 10000);

  nlohmann::json Call(const std::string& method, const nlohmann::json& params);

  int EthChainId();
  Bytes EthCall(const std::string& to, const Bytes& data, const std::string& block = "latest");
  Uint256 EthGasPrice();
  unsigned long long EthGetTransactionCount(const std::string& address, const std::string& block_tag = "pending");
  Uint256 EthGetBalance(const std::string& address, const std::string& block_tag = "latest");
  std::string EthSendRawTransaction(const std::string& raw_tx_hex);
  // nullopt while the transaction is pending
  std::optional<TransactionReceipt> EthGetTransactionReceipt(const std::string& tx_hash);

  const std::string& Endpoint() const { return endpoint_; }
private:
  HttpClient& http_;
  std::string endpoint_;
  int timeout_ms_;
  int next_id_ = 1;
  std::unordered_map<std::string, std::string> default_headers_;
};
