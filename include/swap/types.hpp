#pragma once
#include <optional>
#include <string>
#include <vector>
#include "common/result.hpp"
#include "common/uint256.hpp"

struct SwapIntent {
  std::string token_in;
  std::string token_out;
  std::string amount_in;        // human-readable decimal, e.g. "10.5"
  std::string slippage_percent = "0.5"; // decimal percent, parsed exactly
  unsigned int fee = 3000;      // pool fee in hundredths of a bip (3000 = 0.30%)
};

struct TokenInfo {
  std::string address;
  std::string symbol;
  int decimals = 0;
  Uint256 balance = 0;
  Uint256 allowance = 0;        // towards the spender contract
};

struct SwapPlan {
  std::string token_in;
  std::string token_out;
  Uint256 amount_in = 0;
  Uint256 amount_out_minimum = 0;
  Uint256 quoted_amount_out = 0;
  std::string recipient;
  unsigned long long deadline = 0; // unix seconds
  unsigned int fee = 0;
};

// UniversalRouter `commands` bytes and one input per command.
struct RouterCommand {
  Bytes commands;
  std::vector<Bytes> inputs;
};

enum class SwapStage {
  Init,
  InfoFetched,
  BalanceChecked,
  Approved,
  Quoted,
  PlanBuilt,
  Submitted,
  Confirmed,
  Failed
};

const char* SwapStageName(SwapStage s);

struct SwapOutcome {
  bool success = false;
  SwapStage stage = SwapStage::Init;          // last stage reached (Failed on failure)
  SwapStage failed_after = SwapStage::Init;   // last good stage before a failure
  std::optional<Failure> failure;
  std::string tx_hash;
  std::string approval_tx_hash;
  Uint256 gas_used = 0;
  std::optional<SwapPlan> plan;
  Bytes execute_calldata;
  std::optional<TokenInfo> token_in_after;
  std::optional<TokenInfo> token_out_after;
  bool dry_run = false;

  std::string Describe() const;
};
