#pragma once
#include "fake_node.hpp"
#include "config/network.hpp"
#include "config/swap_policy.hpp"
#include "gas/gas_strategy.hpp"
#include "node_connection/rpc_client.hpp"
#include "swap/allowance_manager.hpp"
#include "swap/command_builder.hpp"
#include "swap/quote_service.hpp"
#include "swap/swap_orchestrator.hpp"
#include "wallet/signer.hpp"
#include "wallet/transaction_sender.hpp"

namespace rig {
  const std::string kPrivateKey = "0x4c0883a69102937d6231471b5dbb6204fe5129617082792ae468d01a3f362318";
  const std::string kUsdc = "0xA0b86991c6218b36c1d19D4a2e9Eb0cE3606eB48";
  const std::string kWeth = "0xC02aaA39b223FE8D0A0e5C4F27eAD9083C756Cc2";
}

// Full component graph wired to a FakeNode on chain 1, with USDC (6 decimals,
// 20.0 balance, no allowance) and WETH (18 decimals) deployed and the quoter
// answering 0.0031 WETH. Timeouts are short so that pending receipts fail fast.
struct SwapRig {
  FakeNode node;
  RpcClient rpc;
  Signer signer;
  GasStrategy gas;
  TransactionSender sender;
  NetworkConfig net;
  SwapPolicy policy;
  AllowanceManager allowances;
  QuoteService quotes;
  CommandBuilder commands;
  SwapOrchestrator orchestrator;

  explicit SwapRig(bool structured_encoder = true)
    : rpc(node, "http://fake-node"),
      signer(rig::kPrivateKey),
      gas(rpc, 110),
      sender(rpc, signer, gas, 1),
      allowances(rpc, sender, policy),
      quotes(rpc, net),
      commands(SelectCommandEncodingStrategy(structured_encoder)),
      orchestrator(rpc, sender, allowances, quotes, commands, net, policy) {
    net.chain_id = 1;
    net.name = "ethereum";
    net.rpc_url = "http://fake-node";
    net.contracts = ContractsForChain(1);

    policy.approval_timeout = std::chrono::milliseconds(200);
    policy.confirmation_timeout = std::chrono::milliseconds(200);
    policy.receipt_poll_interval = std::chrono::milliseconds(10);

    FakeNode::Token usdc;
    usdc.symbol = "USDC";
    usdc.decimals = 6;
    usdc.balance = Uint256(20000000);
    node.AddToken(rig::kUsdc, usdc);

    FakeNode::Token weth;
    weth.symbol = "WETH";
    weth.decimals = 18;
    node.AddToken(rig::kWeth, weth);

    node.quote_amount = Uint256(3100000000000000ULL);
  }

  static SwapIntent Intent(const std::string& amount = "10.0") {
    SwapIntent intent;
    intent.token_in = rig::kUsdc;
    intent.token_out = rig::kWeth;
    intent.amount_in = amount;
    intent.slippage_percent = "0.5";
    intent.fee = 3000;
    return intent;
  }

  size_t Sends() const { return node.CountMethod("eth_sendRawTransaction"); }
};
