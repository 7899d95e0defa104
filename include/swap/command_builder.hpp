#pragma once
#include <memory>
#include "common/result.hpp"
#include "swap/types.hpp"

// Encodes the V3_SWAP_EXACT_IN input
// (address recipient, uint256 amountIn, uint256 amountOutMin, bytes path, bool payerIsUser).
class CommandEncodingStrategy {
public:
  virtual ~CommandEncodingStrategy() = default;
  virtual const char* Name() const = 0;
  virtual Bytes EncodeSwapInput(const SwapPlan& plan, const Bytes& path) const = 0;
};

// Fixed five-slot layout written out field by field.
class StructuredSwapEncoder : public CommandEncodingStrategy {
public:
  const char* Name() const override { return "structured"; }
  Bytes EncodeSwapInput(const SwapPlan& plan, const Bytes& path) const override;
};

// Same fields through the generic ABI value encoder. Best effort.
class GenericAbiEncoder : public CommandEncodingStrategy {
public:
  const char* Name() const override { return "generic"; }
  Bytes EncodeSwapInput(const SwapPlan& plan, const Bytes& path) const override;
};

// Picked once at startup; the generic encoder is used only when the
// structured one is not available.
std::unique_ptr<CommandEncodingStrategy> SelectCommandEncodingStrategy(bool structured_available);

class CommandBuilder {
public:
  explicit CommandBuilder(std::unique_ptr<CommandEncodingStrategy> strategy);
  // Single V3_SWAP_EXACT_IN command; EncodingError if the path cannot be built.
  Result<RouterCommand> Build(const SwapPlan& plan) const;
  // execute(bytes commands, bytes[] inputs, uint256 deadline)
  static Bytes BuildExecuteCalldata(const RouterCommand& cmd, unsigned long long deadline);
  const CommandEncodingStrategy& Strategy() const { return *strategy_; }
private:
  std::unique_ptr<CommandEncodingStrategy> strategy_;
};
