#include <limits>
#include <stdexcept>
#include "gtest/gtest.h"
#include "core/exceptions.hpp"
#include "core/fixed_point.hpp"

using namespace orion;

class FixedPointTest : public ::testing::Test {
protected:
    const Amount max_amount = std::numeric_limits<Amount>::max();
};

TEST_F(FixedPointTest, MulDivRoundsPerDirection) {
    EXPECT_EQ(fixed_point::mul_div(Amount(10), Amount(1), Amount(3)), Amount(3));
    EXPECT_EQ(fixed_point::mul_div(Amount(10), Amount(1), Amount(3), Rounding::CEIL), Amount(4));
    EXPECT_EQ(fixed_point::mul_div(Amount(9), Amount(1), Amount(3), Rounding::CEIL), Amount(3));
}

TEST_F(FixedPointTest, MulDivUsesWideIntermediate) {
    EXPECT_EQ(fixed_point::mul_div(max_amount, Amount(2), Amount(2)), max_amount);
}

TEST_F(FixedPointTest, MulDivRejectsOverflowAndZeroDenominator) {
    EXPECT_THROW(fixed_point::mul_div(max_amount, Amount(2), Amount(1)), InvariantViolationError);
    EXPECT_THROW(fixed_point::mul_div(Amount(1), Amount(1), Amount(0)), InvariantViolationError);
}

TEST_F(FixedPointTest, CheckedArithmeticThrows) {
    Amount value = max_amount;
    EXPECT_THROW(value += 1, std::overflow_error);

    Amount zero = 0;
    EXPECT_THROW(zero -= 1, std::range_error);
}

TEST_F(FixedPointTest, BasisPointHelpers) {
    EXPECT_EQ(fixed_point::apply_bps(Amount(1000000), 250), Amount(25000));
    EXPECT_EQ(fixed_point::annualized_bps(Amount(1000000000000ULL), 100, SECONDS_PER_YEAR),
              Amount(10000000000ULL));
    // one day of 1% per year on 1M USDC
    EXPECT_EQ(fixed_point::annualized_bps(Amount(1000000000000ULL), 100, 86400), Amount(27397260));
    EXPECT_EQ(fixed_point::annualized_bps(Amount(1000000), 0, 86400), Amount(0));
}

TEST_F(FixedPointTest, Pow10Bounds) {
    EXPECT_EQ(fixed_point::pow10(0), Amount(1));
    EXPECT_EQ(fixed_point::pow10(18), Amount("1000000000000000000"));
    EXPECT_NO_THROW(fixed_point::pow10(77));
    EXPECT_THROW(fixed_point::pow10(78), InvariantViolationError);
}

TEST_F(FixedPointTest, SignedConversions) {
    EXPECT_EQ(fixed_point::magnitude(SignedAmount(-5)), Amount(5));
    EXPECT_EQ(fixed_point::magnitude(SignedAmount(7)), Amount(7));
    EXPECT_EQ(fixed_point::to_signed(Amount(42)), SignedAmount(42));
}

TEST_F(FixedPointTest, ParseAmount) {
    EXPECT_EQ(fixed_point::parse_amount("89100000"), Amount(89100000));
    EXPECT_THROW(fixed_point::parse_amount(""), ValidationError);
    EXPECT_THROW(fixed_point::parse_amount("-1"), ValidationError);
    EXPECT_THROW(fixed_point::parse_amount("1.5"), ValidationError);
}

TEST_F(FixedPointTest, FormatAmount) {
    EXPECT_EQ(fixed_point::format_amount(Amount(1234567), 6), "1.234567");
    EXPECT_EQ(fixed_point::format_amount(Amount(1000000), 6), "1");
    EXPECT_EQ(fixed_point::format_amount(Amount(5), 6), "0.000005");
    EXPECT_EQ(fixed_point::format_amount(Amount(0), 6), "0");
    EXPECT_EQ(fixed_point::format_amount(Amount(1500), 0), "1500");
}
