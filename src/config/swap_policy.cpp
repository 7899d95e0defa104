#include "config/swap_policy.hpp"
#include "common/config_manager.hpp"

SwapPolicy LoadSwapPolicy() {
  SwapPolicy p;
  p.deadline_window_s = ConfigManager::GetIntOr("DEADLINE_WINDOW_SEC", static_cast<int>(p.deadline_window_s));
  p.swap_gas_limit = ConfigManager::GetUint64Or("SWAP_GAS_LIMIT", p.swap_gas_limit);
  p.approval_gas_limit = ConfigManager::GetUint64Or("APPROVAL_GAS_LIMIT", p.approval_gas_limit);
  p.gas_price_markup_percent = static_cast<unsigned int>(ConfigManager::GetIntOr("GAS_PRICE_MARKUP_PCT", static_cast<int>(p.gas_price_markup_percent)));
  p.approval_timeout = std::chrono::seconds(ConfigManager::GetIntOr("APPROVAL_TIMEOUT_SEC", 300));
  p.confirmation_timeout = std::chrono::seconds(ConfigManager::GetIntOr("CONFIRMATION_TIMEOUT_SEC", 300));
  p.receipt_poll_interval = std::chrono::milliseconds(ConfigManager::GetIntOr("RECEIPT_POLL_MS", 2000));
  p.dry_run = ConfigManager::GetBoolOr("DRY_RUN", false);
  return p;
}
