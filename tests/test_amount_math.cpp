#include <gtest/gtest.h>

#include "swap/amount_math.hpp"

// ============================================================================
// ParseUnits
// ============================================================================

TEST(ParseUnitsTest, WholeAndFractionalAmounts)
{
  EXPECT_EQ(ParseUnits("10.0", 6).value(), Uint256(10000000));
  EXPECT_EQ(ParseUnits("10", 6).value(), Uint256(10000000));
  EXPECT_EQ(ParseUnits("0.5", 18).value(), Uint256(500000000000000000ULL));
  EXPECT_EQ(ParseUnits(".25", 2).value(), Uint256(25));
  EXPECT_EQ(ParseUnits("7.", 0).value(), Uint256(7));
}

TEST(ParseUnitsTest, ExactWhereFloatingPointWouldDrift)
{
  // 0.29 * 10^6 is 289999.99999999994 as a double
  EXPECT_EQ(ParseUnits("0.29", 6).value(), Uint256(290000));
  EXPECT_EQ(ParseUnits("1.000000000000000001", 18).value(), Uint256(1000000000000000001ULL));
}

TEST(ParseUnitsTest, ExtraFractionDigitsAreTruncated)
{
  EXPECT_EQ(ParseUnits("1.2345678", 6).value(), Uint256(1234567));
  EXPECT_EQ(ParseUnits("0.0000009", 6).value(), Uint256(0));
}

TEST(ParseUnitsTest, MalformedInputIsInvalidIntent)
{
  for (const char* bad : { "", ".", "abc", "1,5", "-1", "1.2.3", " 1", "1e6" }) {
    auto r = ParseUnits(bad, 6);
    ASSERT_FALSE(r.ok()) << bad;
    EXPECT_EQ(r.error().code, SwapError::InvalidIntent) << bad;
  }
}

TEST(ParseUnitsTest, RejectsUnsupportedDecimalsAndOverflow)
{
  EXPECT_FALSE(ParseUnits("1", -1).ok());
  EXPECT_FALSE(ParseUnits("1", 78).ok());
  auto huge = ParseUnits("1000000000000000000000000000000000000000000000000000000000000000000000000000000", 0);
  ASSERT_FALSE(huge.ok());
  EXPECT_EQ(huge.error().code, SwapError::InvalidIntent);
  EXPECT_EQ(ParseUnits(ToDecimalString(MaxUint256()), 0).value(), MaxUint256());
}

TEST(FormatUnitsTest, InsertsDecimalPoint)
{
  EXPECT_EQ(FormatUnits(Uint256(20000000), 6), "20.000000");
  EXPECT_EQ(FormatUnits(Uint256(5), 3), "0.005");
  EXPECT_EQ(FormatUnits(Uint256(0), 2), "0.00");
  EXPECT_EQ(FormatUnits(Uint256(42), 0), "42");
}

// ============================================================================
// Slippage bound
// ============================================================================

TEST(SlippageTest, ParsesPercentExactly)
{
  auto half = ParseSlippage("0.5").value();
  EXPECT_EQ(half.scaled, 5);
  EXPECT_EQ(half.digits, 1u);
  EXPECT_EQ(ParseSlippage("0.500").value().digits, 1u);
  EXPECT_EQ(ParseSlippage("0").value().scaled, 0);
  EXPECT_EQ(ParseSlippage("99.5").value().scaled, 995);
  EXPECT_EQ(ParseSlippage("0.0000006").value().digits, 7u);
}

TEST(SlippageTest, RejectsOutOfRangeAndMalformed)
{
  for (const char* bad : { "100", "100.0", "250", "-0.1", "", ".", "nan", "0.5%", "1e-3" }) {
    auto r = ParseSlippage(bad);
    ASSERT_FALSE(r.ok()) << bad;
    EXPECT_EQ(r.error().code, SwapError::InvalidIntent) << bad;
  }
}

TEST(SlippageTest, AcceptsAnyPrecisionBelowHundred)
{
  EXPECT_TRUE(ParseSlippage("99.99999996").ok());
  EXPECT_TRUE(ParseSlippage("99.999999999999999999999999999999999999999999999999999999999999999999999999999999").ok());
}

TEST(SlippageTest, MinimumOutForHalfPercent)
{
  auto s = ParseSlippage("0.5").value();
  EXPECT_EQ(MinimumAmountOut(Uint256(3100000000000000ULL), s), Uint256(3084500000000000ULL));
}

TEST(SlippageTest, SubMillionthPercentIsNotRounded)
{
  // 1e18 * (100 - 0.0000006) / 100 = 999999994000000000
  const Uint256 q = Uint256(1000000000000000000ULL);
  EXPECT_EQ(MinimumAmountOut(q, ParseSlippage("0.0000006").value()), Uint256(999999994000000000ULL));
  // 1e18 * 0.00000004 / 100 = 400000000
  EXPECT_EQ(MinimumAmountOut(q, ParseSlippage("99.99999996").value()), Uint256(400000000));
}

TEST(SlippageTest, ZeroSlippageKeepsQuote)
{
  const Slippage none = ParseSlippage("0").value();
  Uint256 q = Uint256(123456789);
  EXPECT_EQ(MinimumAmountOut(q, none), q);
  EXPECT_EQ(MinimumAmountOut(MaxUint256(), none), MaxUint256());
}

TEST(SlippageTest, MinimumNeverExceedsQuoteAndRoundsDown)
{
  const char* slippages[] = { "0.000001", "0.333333", "0.5", "1", "12.345678", "99.999999", "33.3333333333333333333" };
  const Uint256 quotes[] = { Uint256(1), Uint256(7), Uint256(999), Uint256(3100000000000000ULL), MaxUint256() };
  for (const char* text : slippages) {
    const Slippage s = ParseSlippage(text).value();
    const boost::multiprecision::cpp_int hundred = s.HundredPercent();
    for (const auto& q : quotes) {
      Uint256 min = MinimumAmountOut(q, s);
      EXPECT_LE(min, q) << text;
      // floor: min * 100% <= q * (100% - s) < (min + 1) * 100%
      boost::multiprecision::cpp_int lhs = boost::multiprecision::cpp_int(min) * hundred;
      boost::multiprecision::cpp_int rhs = boost::multiprecision::cpp_int(q) * (hundred - s.scaled);
      EXPECT_LE(lhs, rhs) << text;
      EXPECT_GT(lhs + hundred, rhs) << text;
    }
  }
  // 1% of 99 rounds the bound down to 98
  EXPECT_EQ(MinimumAmountOut(Uint256(99), ParseSlippage("1").value()), Uint256(98));
}
