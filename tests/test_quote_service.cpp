#include <gtest/gtest.h>

#include "swap_rig.hpp"

TEST(QuoteServiceTest, ReturnsQuoterOutput)
{
  SwapRig r;
  auto q = r.quotes.Quote(rig::kUsdc, rig::kWeth, Uint256(10000000), 3000);
  ASSERT_TRUE(q.ok());
  EXPECT_EQ(q.value(), Uint256(3100000000000000ULL));

  long idx = r.node.IndexOf("eth_call", UniswapConstants::ETH_QUOTER, UniswapConstants::SEL_QUOTE_EXACT_INPUT_SINGLE);
  ASSERT_GE(idx, 0);
  EXPECT_EQ(r.Sends(), 0u);
}

TEST(QuoteServiceTest, CalldataLayout)
{
  Bytes data = QuoteService::BuildQuoteCalldata(rig::kUsdc, rig::kWeth, Uint256(10000000), 500);
  ASSERT_EQ(data.size(), 4u + 5 * 32u);
  EXPECT_EQ(BytesToHex(data.data(), 4), "f7729d43");
  Bytes args(data.begin() + 4, data.end());
  EXPECT_EQ(ABI::AddressAt(args, 0), ToLowerHex(rig::kUsdc));
  EXPECT_EQ(ABI::AddressAt(args, 1), ToLowerHex(rig::kWeth));
  EXPECT_EQ(ABI::WordAt(args, 2), Uint256(500));
  EXPECT_EQ(ABI::WordAt(args, 3), Uint256(10000000));
  EXPECT_EQ(ABI::WordAt(args, 4), Uint256(0));
}

TEST(QuoteServiceTest, RevertIsQuoteUnavailable)
{
  SwapRig r;
  r.node.quote_reverts = true;
  auto q = r.quotes.Quote(rig::kUsdc, rig::kWeth, Uint256(10000000), 3000);
  ASSERT_FALSE(q.ok());
  EXPECT_EQ(q.error().code, SwapError::QuoteUnavailable);
}

TEST(QuoteServiceTest, ZeroOutputIsQuoteUnavailable)
{
  SwapRig r;
  r.node.quote_amount = 0;
  auto q = r.quotes.Quote(rig::kUsdc, rig::kWeth, Uint256(10000000), 3000);
  ASSERT_FALSE(q.ok());
  EXPECT_EQ(q.error().code, SwapError::QuoteUnavailable);
}

TEST(QuoteServiceTest, TransportFailureIsQuoteUnavailable)
{
  SwapRig r;
  r.node.unreachable = true;
  auto q = r.quotes.Quote(rig::kUsdc, rig::kWeth, Uint256(10000000), 3000);
  ASSERT_FALSE(q.ok());
  EXPECT_EQ(q.error().code, SwapError::QuoteUnavailable);
}

TEST(QuoteServiceTest, UsesConfiguredQuoter)
{
  SwapRig r;
  r.net.contracts.quoter = "0x1111111111111111111111111111111111111111";
  auto q = r.quotes.Quote(rig::kUsdc, rig::kWeth, Uint256(10000000), 3000);
  // the fake only answers at its own quoter address
  EXPECT_FALSE(q.ok());
  EXPECT_GE(r.node.IndexOf("eth_call", "0x1111111111111111111111111111111111111111"), 0);
}
