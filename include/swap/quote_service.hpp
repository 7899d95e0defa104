#pragma once
#include <string>
#include "common/result.hpp"
#include "common/uint256.hpp"

class RpcClient;
struct NetworkConfig;

// Read-only quotes from the network's Uniswap v3 Quoter.
class QuoteService {
public:
  QuoteService(RpcClient& rpc, const NetworkConfig& network);
  // Simulated (eth_call) quoteExactInputSingle with no price limit.
  // Any failure, including a zero quote, is QuoteUnavailable; never throws.
  Result<Uint256> Quote(const std::string& token_in,
                        const std::string& token_out,
                        const Uint256& amount_in,
                        unsigned int fee);
  static Bytes BuildQuoteCalldata(const std::string& token_in,
                                  const std::string& token_out,
                                  const Uint256& amount_in,
                                  unsigned int fee);
private:
  RpcClient& rpc_;
  const NetworkConfig& network_;
};
