#include <gtest/gtest.h>

#include "protocols/erc20.hpp"
#include "swap_rig.hpp"

// ============================================================================
// TransactionSender
// ============================================================================

TEST(TransactionSenderTest, SignsWithFreshNonceAndMarkedUpGasPrice)
{
  SwapRig r;
  r.node.nonce = 41;
  auto hash = r.sender.Send(rig::kUsdc, Bytes{ 0xde, 0xad }, 100000);
  ASSERT_TRUE(hash.ok());
  EXPECT_EQ(hash.value(), FakeNode::TxHash(0));
  ASSERT_EQ(r.node.raw_transactions.size(), 1u);
  const std::string& raw = r.node.raw_transactions[0];
  // nonce 41, 20 gwei * 110% = 22 gwei, gas limit 100000
  EXPECT_EQ(raw.substr(0, 2), "0x");
  EXPECT_NE(raw.find("29" "85051f4d5c00" "830186a0"), std::string::npos);
  EXPECT_NE(raw.find("82dead"), std::string::npos);

  long nonce_idx = r.node.IndexOf("eth_getTransactionCount");
  ASSERT_GE(nonce_idx, 0);
  EXPECT_EQ(r.node.requests[nonce_idx].params[1], "pending");
  EXPECT_LT(nonce_idx, r.node.IndexOfSend(0));
}

TEST(TransactionSenderTest, BroadcastErrorIsSubmissionFailed)
{
  SwapRig r;
  r.node.reject_sends = true;
  auto hash = r.sender.Send(rig::kUsdc, Bytes(), 100000);
  ASSERT_FALSE(hash.ok());
  EXPECT_EQ(hash.error().code, SwapError::SubmissionFailed);
}

TEST(TransactionSenderTest, ReceiptStates)
{
  SwapRig r;
  r.node.receipts = { FakeNode::Receipt::Success, FakeNode::Receipt::Reverted, FakeNode::Receipt::Pending };
  std::vector<std::string> hashes;
  for (int i = 0; i < 3; ++i) hashes.push_back(r.sender.Send(rig::kUsdc, Bytes(), 21000).value());

  auto ok = r.sender.WaitForReceipt(hashes[0], std::chrono::milliseconds(50), std::chrono::milliseconds(5));
  EXPECT_EQ(ok.state, ConfirmationState::Confirmed);
  ASSERT_TRUE(ok.receipt.has_value());
  EXPECT_EQ(ok.receipt->gas_used, Uint256(150000));

  auto reverted = r.sender.WaitForReceipt(hashes[1], std::chrono::milliseconds(50), std::chrono::milliseconds(5));
  EXPECT_EQ(reverted.state, ConfirmationState::Reverted);

  auto pending = r.sender.WaitForReceipt(hashes[2], std::chrono::milliseconds(50), std::chrono::milliseconds(5));
  EXPECT_EQ(pending.state, ConfirmationState::Timeout);
  EXPECT_FALSE(pending.receipt.has_value());
  EXPECT_GT(r.node.CountMethod("eth_getTransactionReceipt"), 3u);
}

// ============================================================================
// AllowanceManager
// ============================================================================

TEST(AllowanceManagerTest, SufficientAllowanceSendsNothing)
{
  SwapRig r;
  r.node.TokenAt(rig::kUsdc).allowance = Uint256(10000000);
  auto res = r.allowances.EnsureAllowance(rig::kUsdc, UniswapConstants::PERMIT2, Uint256(10000000));
  ASSERT_TRUE(res.ok());
  EXPECT_EQ(res->action, AllowanceAction::AlreadySufficient);
  EXPECT_EQ(res->allowance, Uint256(10000000));
  EXPECT_TRUE(res->approval_tx_hash.empty());
  EXPECT_EQ(r.Sends(), 0u);
}

TEST(AllowanceManagerTest, ApprovesMaxToSpender)
{
  SwapRig r;
  r.node.TokenAt(rig::kUsdc).allowance = Uint256(5);
  auto res = r.allowances.EnsureAllowance(rig::kUsdc, UniswapConstants::PERMIT2, Uint256(10000000));
  ASSERT_TRUE(res.ok());
  EXPECT_EQ(res->action, AllowanceAction::Approved);
  EXPECT_EQ(res->approval_tx_hash, FakeNode::TxHash(0));
  ASSERT_EQ(r.Sends(), 1u);

  const std::string& raw = r.node.raw_transactions[0];
  Bytes approve = ERC20::BuildApproveCalldata(UniswapConstants::PERMIT2, MaxUint256());
  EXPECT_NE(raw.find(BytesToHex(approve.data(), approve.size())), std::string::npos);
  // sent to the token, 100000 gas
  EXPECT_NE(raw.find("830186a094" + ToLowerHex(Strip0x(rig::kUsdc))), std::string::npos);
}

TEST(AllowanceManagerTest, RevertedApprovalFails)
{
  SwapRig r;
  r.node.receipts = { FakeNode::Receipt::Reverted };
  auto res = r.allowances.EnsureAllowance(rig::kUsdc, UniswapConstants::PERMIT2, Uint256(1));
  ASSERT_FALSE(res.ok());
  EXPECT_EQ(res.error().code, SwapError::ApprovalFailed);
  EXPECT_NE(res.error().detail.find("reverted"), std::string::npos);
}

TEST(AllowanceManagerTest, UnconfirmedApprovalFails)
{
  SwapRig r;
  r.node.receipts = { FakeNode::Receipt::Pending };
  auto res = r.allowances.EnsureAllowance(rig::kUsdc, UniswapConstants::PERMIT2, Uint256(1));
  ASSERT_FALSE(res.ok());
  EXPECT_EQ(res.error().code, SwapError::ApprovalFailed);
}

TEST(AllowanceManagerTest, UnreadableAllowanceFails)
{
  SwapRig r;
  auto res = r.allowances.EnsureAllowance("0x9999999999999999999999999999999999999999", UniswapConstants::PERMIT2, Uint256(1));
  ASSERT_FALSE(res.ok());
  EXPECT_EQ(res.error().code, SwapError::ApprovalFailed);
  EXPECT_EQ(r.Sends(), 0u);
}

TEST(AllowanceManagerTest, RejectedBroadcastFails)
{
  SwapRig r;
  r.node.reject_sends = true;
  auto res = r.allowances.EnsureAllowance(rig::kUsdc, UniswapConstants::PERMIT2, Uint256(1));
  ASSERT_FALSE(res.ok());
  EXPECT_EQ(res.error().code, SwapError::ApprovalFailed);
}
