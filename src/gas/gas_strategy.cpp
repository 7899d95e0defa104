#include "gas/gas_strategy.hpp"
#include "node_connection/rpc_client.hpp"
#include "telemetry/structured_logger.hpp"
#include "common/logger.hpp"
#include <limits>

unsigned long long GasStrategy::ApplyMarkup(unsigned long long suggested, unsigned int markup_percent) {
  Uint256 marked = Uint256(suggested) * markup_percent / 100;
  if (marked > Uint256(std::numeric_limits<unsigned long long>::max())) return std::numeric_limits<unsigned long long>::max();
  return static_cast<unsigned long long>(marked);
}

std::optional<unsigned long long> GasStrategy::GasPrice() {
  Uint256 suggested = 0;
  try {
    suggested = rpc_.EthGasPrice();
  } catch (const std::exception& ex) {
    LOG_ERROR(std::string("eth_gasPrice failed: ") + ex.what());
    return std::nullopt;
  }
  if (suggested > Uint256(std::numeric_limits<unsigned long long>::max())) {
    LOG_ERROR("suggested gas price out of range: " + ToDecimalString(suggested));
    return std::nullopt;
  }
  unsigned long long price = ApplyMarkup(static_cast<unsigned long long>(suggested), markup_percent_);
  StructuredLogger::Instance().LogEvent("gas_price", {
    {"suggested_wei", ToDecimalString(suggested)},
    {"markup_pct", markup_percent_},
    {"gas_price_wei", std::to_string(price)}
  });
  return price;
}
