#include "swap/types.hpp"

const char* SwapStageName(SwapStage s) {
  switch (s) {
    case SwapStage::Init: return "Init";
    case SwapStage::InfoFetched: return "InfoFetched";
    case SwapStage::BalanceChecked: return "BalanceChecked";
    case SwapStage::Approved: return "Approved";
    case SwapStage::Quoted: return "Quoted";
    case SwapStage::PlanBuilt: return "PlanBuilt";
    case SwapStage::Submitted: return "Submitted";
    case SwapStage::Confirmed: return "Confirmed";
    case SwapStage::Failed: return "Failed";
  }
  return "Unknown";
}

std::string SwapOutcome::Describe() const {
  if (success) {
    if (dry_run) return "dry run: plan built, nothing submitted";
    return "swap confirmed tx=" + tx_hash + " gas_used=" + ToDecimalString(gas_used);
  }
  std::string s = "swap failed after " + std::string(SwapStageName(failed_after));
  if (failure) s += " - " + failure->Describe();
  if (!tx_hash.empty()) s += " tx=" + tx_hash;
  return s;
}
