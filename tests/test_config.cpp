#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include "common/config_manager.hpp"
#include "swap_rig.hpp"
#include "utils/json_rpc.hpp"

namespace {
  class ConfigTest : public ::testing::Test {
  protected:
    void SetUp() override { ConfigManager::Clear(); }
    void TearDown() override { ConfigManager::Clear(); }
  };
}

// ============================================================================
// ConfigManager
// ============================================================================

TEST_F(ConfigTest, ParsesEnvFile)
{
  const std::string path = ::testing::TempDir() + "swapper_config_test.env";
  {
    std::ofstream f(path);
    f << "# comment\n"
      << "RPC_URL = \"https://rpc.example\"\n"
      << "export CHAIN_ID=137\n"
      << "SWAP_SLIPPAGE_PCT='1.25'\n"
      << "DRY_RUN=yes\n"
      << "broken line\n"
      << "SWAP_GAS_LIMIT=abc\n";
  }
  ConfigManager::Initialize(path);
  EXPECT_EQ(ConfigManager::Get("RPC_URL").value(), "https://rpc.example");
  EXPECT_EQ(ConfigManager::GetIntOr("CHAIN_ID", 1), 137);
  EXPECT_DOUBLE_EQ(ConfigManager::GetDoubleOr("SWAP_SLIPPAGE_PCT", 0.5), 1.25);
  EXPECT_TRUE(ConfigManager::GetBoolOr("DRY_RUN", false));
  EXPECT_EQ(ConfigManager::GetUint64Or("SWAP_GAS_LIMIT", 300000), 300000ULL);
  EXPECT_FALSE(ConfigManager::Get("SWAPPER_TEST_UNSET_KEY").has_value());
  EXPECT_THROW(ConfigManager::GetOrThrow("SWAPPER_TEST_UNSET_KEY"), std::runtime_error);
  std::remove(path.c_str());
}

TEST_F(ConfigTest, EmptyRequiredValueThrows)
{
  ConfigManager::Set("PRIVATE_KEY", "");
  EXPECT_THROW(ConfigManager::GetOrThrow("PRIVATE_KEY"), std::runtime_error);
}

// ============================================================================
// Network table
// ============================================================================

TEST(NetworkTest, KnownChains)
{
  bool known = false;
  ContractAddresses eth = ContractsForChain(1, &known);
  EXPECT_TRUE(known);
  EXPECT_EQ(eth.universal_router, UniswapConstants::ETH_UNIVERSAL_ROUTER);
  EXPECT_EQ(eth.permit2, UniswapConstants::PERMIT2);
  EXPECT_EQ(eth.wrapped_native, UniswapConstants::ETH_WETH);

  ContractAddresses polygon = ContractsForChain(137, &known);
  EXPECT_TRUE(known);
  EXPECT_EQ(polygon.universal_router, UniswapConstants::POLYGON_UNIVERSAL_ROUTER);
  EXPECT_EQ(polygon.permit2, UniswapConstants::PERMIT2);
  EXPECT_EQ(polygon.wrapped_native, UniswapConstants::POLYGON_WMATIC);
}

TEST(NetworkTest, UnknownChainFallsBackToEthereum)
{
  bool known = true;
  ContractAddresses c = ContractsForChain(42161, &known);
  EXPECT_FALSE(known);
  EXPECT_EQ(c.universal_router, UniswapConstants::ETH_UNIVERSAL_ROUTER);
}

TEST_F(ConfigTest, LoadNetworkConfigWithOverrides)
{
  ConfigManager::Set("RPC_URL", "https://polygon.example");
  ConfigManager::Set("CHAIN_ID", "137");
  ConfigManager::Set("RPC_AUTH_HEADER", "x-api-key: secret");
  ConfigManager::Set("QUOTER_ADDRESS", "0x61fFE014bA17989E743c5F6cB21bF9697530B21e");
  NetworkConfig net = LoadNetworkConfig();
  EXPECT_EQ(net.chain_id, 137);
  EXPECT_EQ(net.name, "polygon");
  EXPECT_EQ(net.rpc_url, "https://polygon.example");
  ASSERT_TRUE(net.auth_header.has_value());
  EXPECT_EQ(net.contracts.quoter, "0x61fFE014bA17989E743c5F6cB21bF9697530B21e");
  EXPECT_EQ(net.contracts.universal_router, UniswapConstants::POLYGON_UNIVERSAL_ROUTER);

  ConfigManager::Set("ROUTER_ADDRESS", "router");
  EXPECT_THROW(LoadNetworkConfig(), std::invalid_argument);
}

TEST_F(ConfigTest, LoadNetworkConfigRequiresRpcUrl)
{
  ConfigManager::Set("RPC_URL", "");
  EXPECT_THROW(LoadNetworkConfig(), std::runtime_error);
}

TEST_F(ConfigTest, SwapPolicyDefaultsAndOverrides)
{
  SwapPolicy defaults = LoadSwapPolicy();
  EXPECT_EQ(defaults.deadline_window_s, 1800);
  EXPECT_EQ(defaults.swap_gas_limit, 300000ULL);
  EXPECT_EQ(defaults.approval_gas_limit, 100000ULL);
  EXPECT_EQ(defaults.gas_price_markup_percent, 110u);
  EXPECT_EQ(defaults.approval_timeout, std::chrono::seconds(300));
  EXPECT_EQ(defaults.confirmation_timeout, std::chrono::seconds(300));
  EXPECT_FALSE(defaults.dry_run);

  ConfigManager::Set("DEADLINE_WINDOW_SEC", "600");
  ConfigManager::Set("SWAP_GAS_LIMIT", "450000");
  ConfigManager::Set("CONFIRMATION_TIMEOUT_SEC", "30");
  ConfigManager::Set("DRY_RUN", "true");
  SwapPolicy p = LoadSwapPolicy();
  EXPECT_EQ(p.deadline_window_s, 600);
  EXPECT_EQ(p.swap_gas_limit, 450000ULL);
  EXPECT_EQ(p.confirmation_timeout, std::chrono::seconds(30));
  EXPECT_TRUE(p.dry_run);
}

// ============================================================================
// Gas
// ============================================================================

TEST(GasStrategyTest, MarkupIsIntegerFloor)
{
  EXPECT_EQ(GasStrategy::ApplyMarkup(20000000000ULL, 110), 22000000000ULL);
  EXPECT_EQ(GasStrategy::ApplyMarkup(15, 110), 16ULL);
  EXPECT_EQ(GasStrategy::ApplyMarkup(9, 110), 9ULL);
  EXPECT_EQ(GasStrategy::ApplyMarkup(~0ULL, 110), ~0ULL);
}

TEST(GasStrategyTest, ReadsNodeSuggestion)
{
  SwapRig r;
  r.node.gas_price = Uint256(1000);
  EXPECT_EQ(r.gas.GasPrice().value(), 1100ULL);
  r.node.unreachable = true;
  EXPECT_FALSE(r.gas.GasPrice().has_value());
}

// ============================================================================
// JSON-RPC plumbing
// ============================================================================

TEST(JsonRpcTest, ExtractResultAndErrors)
{
  EXPECT_EQ(JsonRpcUtil::ExtractResult(R"({"jsonrpc":"2.0","id":1,"result":"0x1"})"), "0x1");
  try {
    JsonRpcUtil::ExtractResult(R"({"jsonrpc":"2.0","id":1,"error":{"code":-32000,"message":"nonce too low"}})");
    FAIL() << "expected RpcError";
  } catch (const RpcError& e) {
    EXPECT_EQ(e.code(), -32000);
    EXPECT_NE(std::string(e.what()).find("nonce too low"), std::string::npos);
  }
  EXPECT_THROW(JsonRpcUtil::ExtractResult("not json"), std::runtime_error);
  EXPECT_THROW(JsonRpcUtil::ExtractResult(R"({"jsonrpc":"2.0","id":1})"), std::runtime_error);
}

TEST(RpcClientTest, AuthHeaderAndChainId)
{
  FakeNode node;
  node.chain_id = 137;
  RpcClient named(node, "http://fake", std::string("x-api-key: secret"));
  EXPECT_EQ(named.EthChainId(), 137);
  EXPECT_EQ(node.last_headers["x-api-key"], "secret");
  EXPECT_EQ(node.last_headers["Content-Type"], "application/json");

  RpcClient bare(node, "http://fake", std::string("Bearer token"));
  bare.EthChainId();
  EXPECT_EQ(node.last_headers["Authorization"], "Bearer token");
}

TEST(RpcClientTest, PendingReceiptIsEmpty)
{
  FakeNode node;
  RpcClient rpc(node, "http://fake");
  EXPECT_FALSE(rpc.EthGetTransactionReceipt(FakeNode::TxHash(5)).has_value());
  node.unreachable = true;
  EXPECT_THROW(rpc.EthChainId(), std::runtime_error);
}

TEST(CurlHttpClientTest, HandleIsReusableAfterFailedRequests)
{
  HttpClientTuning tuning;
  tuning.connect_timeout_ms = 500;
  std::unique_ptr<HttpClient> http = CreateCurlHttpClient(tuning);
  // nothing listens on port 1
  for (int i = 0; i < 3; ++i) {
    HttpResponse resp = http->Post("http://127.0.0.1:1", "{}", { {"Content-Type", "application/json"} }, 500);
    EXPECT_EQ(resp.status, 0) << i;
    EXPECT_FALSE(resp.error.empty()) << i;
  }
}
