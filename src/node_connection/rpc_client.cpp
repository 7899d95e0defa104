#include "node_connection/rpc_client.hpp"
#include "net/http_client.hpp"
#include "common/logger.hpp"
#include "utils/json_rpc.hpp"
#include <cctype>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;

static inline std::string Trim(const std::string& s) {
  size_t start = 0, end = s.size();
  while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
  while (end > start && std::isspace(static_cast<unsigned char>(s[end-1]))) --end;
  return s.substr(start, end - start);
}

// "Name: value" sets that header; a bare value becomes Authorization.
static void ApplyAuthHeader(std::unordered_map<std::string, std::string>& headers,
                            const std::optional<std::string>& auth_header_opt) {
  if (!auth_header_opt) return;
  const std::string& raw = *auth_header_opt;
  auto pos = raw.find(':');
  if (pos != std::string::npos) {
    std::string name = Trim(raw.substr(0, pos));
    std::string value = Trim(raw.substr(pos + 1));
    if (!name.empty() && !value.empty()) {
      headers[name] = value;
      return;
    }
  }
  headers["Authorization"] = raw;
}

static unsigned long long QuantityToULL(const json& v) {
  if (!v.is_string()) throw std::runtime_error("expected hex quantity, got " + v.dump());
  Uint256 n = Uint256FromHex(v.get<std::string>());
  if (n > Uint256(std::numeric_limits<unsigned long long>::max())) throw std::out_of_range("quantity exceeds 64 bits");
  return static_cast<unsigned long long>(n);
}

RpcClient::RpcClient(HttpClient& http,
                     const std::string& endpoint_url,
                     const std::optional<std::string>& auth_header,
                     int timeout_ms)
  : http_(http), endpoint_(endpoint_url), timeout_ms_(timeout_ms) {
  default_headers_["Content-Type"] = "application/json";
  ApplyAuthHeader(default_headers_, auth_header);
}

json RpcClient::Call(const std::string& method, const json& params) {
  auto payload = JsonRpcUtil::BuildRequest(method, params, next_id_++);
  auto resp = http_.Post(endpoint_, payload, default_headers_, timeout_ms_);
  if (resp.status == 0) {
    throw std::runtime_error(method + " transport failure: " + (resp.error.empty() ? "no response" : resp.error));
  }
  if (resp.status < 200 || resp.status >= 300) {
    LOG_ERROR("HTTP POST failed status=" + std::to_string(resp.status) + " method=" + method);
    throw std::runtime_error(method + " HTTP status " + std::to_string(resp.status));
  }
  return JsonRpcUtil::ExtractResult(resp.body);
}

int RpcClient::EthChainId() {
  return static_cast<int>(QuantityToULL(Call("eth_chainId", json::array())));
}

Bytes RpcClient::EthCall(const std::string& to, const Bytes& data, const std::string& block) {
  json call = { {"to", to}, {"data", BytesToHex0x(data)} };
  auto r = Call("eth_call", json::array({ call, block }));
  if (!r.is_string()) throw std::runtime_error("eth_call returned non-string result");
  return HexToBytes(r.get<std::string>());
}

Uint256 RpcClient::EthGasPrice() {
  auto r = Call("eth_gasPrice", json::array());
  if (!r.is_string()) throw std::runtime_error("eth_gasPrice returned non-string result");
  return Uint256FromHex(r.get<std::string>());
}

unsigned long long RpcClient::EthGetTransactionCount(const std::string& address, const std::string& block_tag) {
  return QuantityToULL(Call("eth_getTransactionCount", json::array({ address, block_tag })));
}

Uint256 RpcClient::EthGetBalance(const std::string& address, const std::string& block_tag) {
  auto r = Call("eth_getBalance", json::array({ address, block_tag }));
  if (!r.is_string()) throw std::runtime_error("eth_getBalance returned non-string result");
  return Uint256FromHex(r.get<std::string>());
}

std::string RpcClient::EthSendRawTransaction(const std::string& raw_tx_hex) {
  auto r = Call("eth_sendRawTransaction", json::array({ raw_tx_hex }));
  if (!r.is_string()) throw std::runtime_error("eth_sendRawTransaction returned non-string result");
  return r.get<std::string>();
}

std::optional<TransactionReceipt> RpcClient::EthGetTransactionReceipt(const std::string& tx_hash) {
  auto r = Call("eth_getTransactionReceipt", json::array({ tx_hash }));
  if (r.is_null()) return std::nullopt;
  if (!r.is_object()) throw std::runtime_error("malformed receipt for " + tx_hash);
  TransactionReceipt receipt;
  receipt.tx_hash = r.value("transactionHash", tx_hash);
  // pre-Byzantium receipts carry no status; treat them as success
  receipt.status_ok = !r.contains("status") || r["status"].is_null() || Uint256FromHex(r["status"].get<std::string>()) == 1;
  if (r.contains("gasUsed") && r["gasUsed"].is_string()) receipt.gas_used = Uint256FromHex(r["gasUsed"].get<std::string>());
  if (r.contains("blockNumber") && r["blockNumber"].is_string()) receipt.block_number = QuantityToULL(r["blockNumber"]);
  return receipt;
}
