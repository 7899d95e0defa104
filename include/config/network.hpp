#pragma once
#include <string>
#include <optional>

struct ContractAddresses {
  std::string universal_router;
  std::string permit2;   // allowance target for ERC20 approvals
  std::string quoter;
  std::string wrapped_native;
};

struct NetworkConfig {
  int chain_id = 1;
  std::string name;
  std::string rpc_url;
  std::optional<std::string> auth_header;
  ContractAddresses contracts;
};

// Fixed per-chain contract table. Unknown chain ids get the Ethereum table.
ContractAddresses ContractsForChain(int chain_id, bool* known = nullptr);

// Loads network configuration from .env keys (CHAIN_ID, RPC_URL, RPC_AUTH_HEADER,
// ROUTER_ADDRESS / PERMIT2_ADDRESS / QUOTER_ADDRESS overrides).
NetworkConfig LoadNetworkConfig();
