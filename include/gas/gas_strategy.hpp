#pragma once
#include <optional>
#include <string>

class RpcClient;

// Legacy gas pricing: the node's suggested price times a fixed markup.
class GasStrategy {
public:
  GasStrategy(RpcClient& rpc, unsigned int markup_percent) : rpc_(rpc), markup_percent_(markup_percent) {}
  // nullopt (with a logged reason) when the suggestion cannot be read or overflows 64 bits
  std::optional<unsigned long long> GasPrice();
  static unsigned long long ApplyMarkup(unsigned long long suggested, unsigned int markup_percent);
private:
  RpcClient& rpc_;
  unsigned int markup_percent_;
};
