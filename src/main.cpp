#include "common/logger.hpp"
#include "common/config_manager.hpp"
#include "config/network.hpp"
#include "config/swap_policy.hpp"
#include "gas/gas_strategy.hpp"
#include "net/http_client.hpp"
#include "node_connection/rpc_client.hpp"
#include "swap/allowance_manager.hpp"
#include "swap/amount_math.hpp"
#include "swap/command_builder.hpp"
#include "swap/quote_service.hpp"
#include "swap/swap_orchestrator.hpp"
#include "telemetry/structured_logger.hpp"
#include "wallet/signer.hpp"
#include "wallet/transaction_sender.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

void PrintUsage(const char* argv0) {
  std::cout << "usage: " << argv0 << " <token_in> <token_out> <amount> [slippage_pct] [fee]" << std::endl;
  std::cout << "  missing arguments are read from SWAP_TOKEN_IN, SWAP_TOKEN_OUT, SWAP_AMOUNT," << std::endl;
  std::cout << "  SWAP_SLIPPAGE_PCT (0.5) and SWAP_FEE (3000)" << std::endl;
  std::cout << "  DRY_RUN=true builds and prints the plan without sending transactions" << std::endl;
  std::cout << std::endl;
  std::cout << "note: only the token -> Permit2 ERC20 allowance is granted. The UniversalRouter" << std::endl;
  std::cout << "  also needs a Permit2 allowance (Permit2.approve(token, router, amount, expiration))" << std::endl;
  std::cout << "  to pull funds; without it a live swap reverts on chain and still pays gas." << std::endl;
}

SwapIntent IntentFromArgs(int argc, char** argv) {
  if (argc > 1) ConfigManager::Set("SWAP_TOKEN_IN", argv[1]);
  if (argc > 2) ConfigManager::Set("SWAP_TOKEN_OUT", argv[2]);
  if (argc > 3) ConfigManager::Set("SWAP_AMOUNT", argv[3]);
  if (argc > 4) ConfigManager::Set("SWAP_SLIPPAGE_PCT", argv[4]);
  if (argc > 5) ConfigManager::Set("SWAP_FEE", argv[5]);

  SwapIntent intent;
  intent.token_in = ConfigManager::GetOrThrow("SWAP_TOKEN_IN");
  intent.token_out = ConfigManager::GetOrThrow("SWAP_TOKEN_OUT");
  intent.amount_in = ConfigManager::GetOrThrow("SWAP_AMOUNT");
  intent.slippage_percent = ConfigManager::Get("SWAP_SLIPPAGE_PCT").value_or("0.5");
  const int fee = ConfigManager::GetIntOr("SWAP_FEE", 3000);
  if (fee < 0) throw std::invalid_argument("SWAP_FEE must not be negative");
  intent.fee = static_cast<unsigned int>(fee);
  return intent;
}

void PrintBalance(const char* label, const TokenInfo& info) {
  std::cout << label << info.symbol << " (" << info.address << ") balance: "
            << FormatUnits(info.balance, info.decimals) << std::endl;
}

} // namespace

int main(int argc, char** argv) {
  if (argc > 1 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")) {
    PrintUsage(argv[0]);
    return 0;
  }
  try {
    std::cout << "=== Uniswap swapper ===" << std::endl;
    std::cout << "Step 1: Loading .env configuration..." << std::endl;
    ConfigManager::Initialize(ConfigManager::Get("ENV_FILE").value_or(".env"));

    std::cout << "Step 2: Initializing loggers..." << std::endl;
    Logger::Initialize(ConfigManager::Get("LOG_FILE").value_or("swapper.log"),
                       Logger::ParseLevel(ConfigManager::Get("LOG_LEVEL").value_or("info")),
                       ConfigManager::GetBoolOr("LOG_CONSOLE", false));
    StructuredLogger::Instance().Initialize(ConfigManager::Get("METRICS_FILE").value_or("swapper_events.jsonl"));

    std::cout << "Step 3: Loading network configuration..." << std::endl;
    const NetworkConfig net = LoadNetworkConfig();
    const SwapPolicy policy = LoadSwapPolicy();
    std::cout << "Network: " << net.name << " (chain " << net.chain_id << ")" << std::endl;
    std::cout << "UniversalRouter: " << net.contracts.universal_router << std::endl;
    std::cout << "Wrapped native: " << net.contracts.wrapped_native << std::endl;
    std::cout << "DRY_RUN: " << (policy.dry_run ? "true" : "false") << std::endl;
    if (!policy.dry_run) {
      std::cout << "NOTE: the router must already hold a Permit2 allowance for the input token," << std::endl;
      std::cout << "      otherwise the swap reverts and gas is spent (see --help)" << std::endl;
    }

    const SwapIntent intent = IntentFromArgs(argc, argv);

    std::cout << "Step 4: Setting up RPC client..." << std::endl;
    HttpClientTuning http_tuning;
    http_tuning.verify_tls = ConfigManager::GetBoolOr("HTTP_VERIFY_TLS", true);
    std::unique_ptr<HttpClient> http = CreateCurlHttpClient(http_tuning);
    RpcClient rpc(*http, net.rpc_url, net.auth_header, ConfigManager::GetIntOr("RPC_TIMEOUT_MS", 10000));

    std::cout << "Step 5: Setting up signer..." << std::endl;
    Signer signer(ConfigManager::GetOrThrow("PRIVATE_KEY"));
    if (auto addr = ConfigManager::Get("WALLET_ADDRESS")) signer.VerifyAddress(*addr);
    std::cout << "Wallet: " << signer.Address() << std::endl;
    try {
      std::cout << "Native balance (gas): " << FormatUnits(rpc.EthGetBalance(signer.Address()), 18) << std::endl;
    } catch (const std::exception& e) {
      LOG_WARN(std::string("eth_getBalance failed: ") + e.what());
    }

    std::cout << "Step 6: Setting up swap components..." << std::endl;
    GasStrategy gas(rpc, policy.gas_price_markup_percent);
    TransactionSender sender(rpc, signer, gas, net.chain_id);
    AllowanceManager allowances(rpc, sender, policy);
    QuoteService quotes(rpc, net);
    const std::string encoder = ConfigManager::Get("ROUTER_ENCODER").value_or("structured");
    CommandBuilder commands(SelectCommandEncodingStrategy(encoder != "generic"));
    SwapOrchestrator orchestrator(rpc, sender, allowances, quotes, commands, net, policy);
    std::cout << "Command encoder: " << commands.Strategy().Name() << std::endl;

    LOG_INFO("Swapper started on " + net.name + " via " + net.rpc_url);

    std::cout << "Step 7: Executing swap..." << std::endl;
    const SwapOutcome outcome = orchestrator.Execute(intent);

    std::cout << outcome.Describe() << std::endl;
    if (outcome.token_in_after) PrintBalance("After: ", *outcome.token_in_after);
    if (outcome.token_out_after) PrintBalance("After: ", *outcome.token_out_after);
    if (outcome.dry_run && !outcome.execute_calldata.empty()) {
      std::cout << "execute calldata: " << BytesToHex0x(outcome.execute_calldata) << std::endl;
    }

    StructuredLogger::Instance().Shutdown();
    Logger::Shutdown();
    return outcome.success ? 0 : 1;
  } catch (const std::exception& e) {
    std::cout << "CRITICAL ERROR: " << e.what() << std::endl;
    std::cout << "Swapper failed to start. Check configuration and try again." << std::endl;
    LOG_CRITICAL(std::string("Startup failed: ") + e.what());
    StructuredLogger::Instance().Shutdown();
    Logger::Shutdown();
    return 1;
  }
}
