#pragma once
#include <string>
#include "common/result.hpp"
#include "common/uint256.hpp"

// "10.5" with decimals 6 -> 10500000. Extra fractional digits are truncated.
Result<Uint256> ParseUnits(const std::string& human, int decimals);
// 20000000 with decimals 6 -> "20.000000"
std::string FormatUnits(const Uint256& amount, int decimals);

// Slippage percent held exactly as scaled / 10^digits, e.g. "0.25" -> {25, 2}.
struct Slippage {
  boost::multiprecision::cpp_int scaled = 0;
  unsigned int digits = 0;

  boost::multiprecision::cpp_int HundredPercent() const;
};

// Parses a plain decimal percent. InvalidIntent unless 0 <= percent < 100.
Result<Slippage> ParseSlippage(const std::string& percent);
// floor(quoted * (100 - percent) / 100)
Uint256 MinimumAmountOut(const Uint256& quoted, const Slippage& slippage);
