#pragma once
#include <chrono>
#include <string>

// Numeric policy applied to every swap.
struct SwapPolicy {
  long long deadline_window_s = 1800;
  unsigned long long swap_gas_limit = 300000;
  unsigned long long approval_gas_limit = 100000;
  unsigned int gas_price_markup_percent = 110;
  std::chrono::milliseconds approval_timeout{300000};
  std::chrono::milliseconds confirmation_timeout{300000};
  std::chrono::milliseconds receipt_poll_interval{2000};
  bool dry_run = false;
};

// Defaults above, overridable by DEADLINE_WINDOW_SEC, SWAP_GAS_LIMIT,
// APPROVAL_GAS_LIMIT, GAS_PRICE_MARKUP_PCT, APPROVAL_TIMEOUT_SEC,
// CONFIRMATION_TIMEOUT_SEC, RECEIPT_POLL_MS, DRY_RUN.
SwapPolicy LoadSwapPolicy();
