#pragma once
#include <string>

namespace UniswapConstants {
  inline constexpr int ETHEREUM_CHAIN_ID = 1;
  inline constexpr int POLYGON_CHAIN_ID = 137;

  // Ethereum mainnet
  inline const std::string ETH_UNIVERSAL_ROUTER = "0x3fC91A3afd70395Cd496C647d5a6CC9D4B2b7FAD";
  inline const std::string ETH_QUOTER = "0xb27308f9F90D607463bb33eA1BeBb41C27CE5AB6"; // QuoterV1
  inline const std::string ETH_WETH = "0xC02aaA39b223FE8D0A0e5C4F27eAD9083C756Cc2";
  // Polygon
  inline const std::string POLYGON_UNIVERSAL_ROUTER = "0xec7BE89e9d109e7e3Fec59c222CF297125FEFda2";
  inline const std::string POLYGON_QUOTER = "0xb27308f9F90D607463bb33eA1BeBb41C27CE5AB6";
  inline const std::string POLYGON_WMATIC = "0x0d500B1d8E8eF31E21C99d1Db9A6444d3ADf1270";
  // Permit2 shares one address across chains
  inline const std::string PERMIT2 = "0x000000000022D473030F116dDEE9F6B43aC78BA3";

  // UniversalRouter command opcodes
  inline constexpr unsigned char CMD_V3_SWAP_EXACT_IN = 0x00;

  // Function selectors
  inline const std::string SEL_EXECUTE = "0x3593564c";                   // execute(bytes,bytes[],uint256)
  inline const std::string SEL_QUOTE_EXACT_INPUT_SINGLE = "0xf7729d43";  // quoteExactInputSingle(address,address,uint24,uint256,uint160)
  inline const std::string SEL_SYMBOL = "0x95d89b41";
  inline const std::string SEL_DECIMALS = "0x313ce567";
  inline const std::string SEL_BALANCE_OF = "0x70a08231";
  inline const std::string SEL_ALLOWANCE = "0xdd62ed3e";
  inline const std::string SEL_APPROVE = "0x095ea7b3";

  inline constexpr unsigned int MAX_FEE_TIER = (1u << 24) - 1;
}
