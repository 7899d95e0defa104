#include "config/network.hpp"
#include "common/config_manager.hpp"
#include "common/logger.hpp"
#include "constants/uniswap.hpp"
#include "utils/hex.hpp"
#include <stdexcept>

ContractAddresses ContractsForChain(int chain_id, bool* known) {
  using namespace UniswapConstants;
  if (known) *known = true;
  switch (chain_id) {
    case ETHEREUM_CHAIN_ID:
      return ContractAddresses{ ETH_UNIVERSAL_ROUTER, PERMIT2, ETH_QUOTER, ETH_WETH };
    case POLYGON_CHAIN_ID:
      return ContractAddresses{ POLYGON_UNIVERSAL_ROUTER, PERMIT2, POLYGON_QUOTER, POLYGON_WMATIC };
    default:
      if (known) *known = false;
      return ContractAddresses{ ETH_UNIVERSAL_ROUTER, PERMIT2, ETH_QUOTER, ETH_WETH };
  }
}

static std::string NetworkName(int chain_id) {
  switch (chain_id) {
    case UniswapConstants::ETHEREUM_CHAIN_ID: return "ethereum";
    case UniswapConstants::POLYGON_CHAIN_ID: return "polygon";
    default: return "chain-" + std::to_string(chain_id);
  }
}

static void ApplyOverride(const std::string& key, std::string& target) {
  auto v = ConfigManager::Get(key);
  if (!v || v->empty()) return;
  if (!IsValidAddress(*v)) throw std::invalid_argument("Config " + key + " is not an address: " + *v);
  target = *v;
}

NetworkConfig LoadNetworkConfig() {
  NetworkConfig cfg;
  cfg.chain_id = ConfigManager::GetIntOr("CHAIN_ID", UniswapConstants::ETHEREUM_CHAIN_ID);
  cfg.name = NetworkName(cfg.chain_id);
  cfg.rpc_url = ConfigManager::GetOrThrow("RPC_URL");
  if (auto a = ConfigManager::Get("RPC_AUTH_HEADER")) {
    if (!a->empty()) cfg.auth_header = *a;
  }
  bool known = true;
  cfg.contracts = ContractsForChain(cfg.chain_id, &known);
  if (!known) {
    LOG_WARN("No contract table for chain " + std::to_string(cfg.chain_id) + ", using Ethereum defaults");
  }
  ApplyOverride("ROUTER_ADDRESS", cfg.contracts.universal_router);
  ApplyOverride("PERMIT2_ADDRESS", cfg.contracts.permit2);
  ApplyOverride("QUOTER_ADDRESS", cfg.contracts.quoter);
  return cfg;
}
