#include "gtest/gtest.h"
#include "core/exceptions.hpp"
#include "core/fee_engine.hpp"

using namespace orion;

class FeeEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        // 100 shares priced at 1 USDC each at the start of the epoch
        snapshot.current_share_price = Amount(1000000);
        snapshot.total_supply = Amount("100000000000000000000");
        snapshot.previous_supply = snapshot.total_supply;
    }

    FeeModel model(FeeType type, std::uint32_t performance_bps, std::uint32_t management_bps = 0,
                   const Amount& high_water_mark = 0) {
        FeeModel result;
        result.type = type;
        result.performance_fee_bps = performance_bps;
        result.management_fee_bps = management_bps;
        result.high_water_mark = high_water_mark;
        return result;
    }

    fees::FeeSnapshot snapshot;
    fees::ProtocolFeeRates no_protocol_fees;
};

TEST_F(FeeEngineTest, SharePrice) {
    EXPECT_EQ(fees::share_price(Amount(110000000), snapshot.total_supply), Amount(1100000));
    EXPECT_EQ(fees::share_price(Amount(110000000), Amount(0)), Amount(0));
}

TEST_F(FeeEngineTest, AbsolutePerformanceFee) {
    auto result = fees::compute_epoch_fees(Amount(110000000), model(FeeType::ABSOLUTE, 1000), snapshot,
                                           no_protocol_fees, 86400, 0);
    EXPECT_EQ(result.management, Amount(0));
    EXPECT_EQ(result.performance, Amount(1000000));
    EXPECT_EQ(result.curator_share, Amount(1000000));
    EXPECT_EQ(result.protocol_share, Amount(0));
}

TEST_F(FeeEngineTest, ManagementFeeIsTakenBeforePerformanceFee) {
    auto result = fees::compute_epoch_fees(Amount(110000000), model(FeeType::ABSOLUTE, 1000, 300), snapshot,
                                           no_protocol_fees, SECONDS_PER_YEAR, 0);
    EXPECT_EQ(result.management, Amount(3300000));
    EXPECT_EQ(result.performance, Amount(670000));
    EXPECT_EQ(result.total(), Amount(3970000));
}

TEST_F(FeeEngineTest, HighWaterMarkBlocksFeesBelowMark) {
    auto below = fees::compute_epoch_fees(Amount(110000000),
                                          model(FeeType::HIGH_WATER_MARK, 1000, 0, Amount(1200000)),
                                          snapshot, no_protocol_fees, 86400, 0);
    EXPECT_EQ(below.performance, Amount(0));

    auto above = fees::compute_epoch_fees(Amount(110000000),
                                          model(FeeType::HIGH_WATER_MARK, 1000, 0, Amount(1050000)),
                                          snapshot, no_protocol_fees, 86400, 0);
    EXPECT_EQ(above.performance, Amount(500000));
}

TEST_F(FeeEngineTest, UnsetHighWaterMarkFallsBackToCurrentPrice) {
    auto result = fees::compute_epoch_fees(Amount(110000000), model(FeeType::HIGH_WATER_MARK, 1000),
                                           snapshot, no_protocol_fees, 86400, 0);
    EXPECT_EQ(result.performance, Amount(1000000));
}

TEST_F(FeeEngineTest, HardHurdleChargesOnlyAboveHurdle) {
    // 10% risk-free rate over a year puts the hurdle at 1.1 USDC per share
    auto result = fees::compute_epoch_fees(Amount(120000000), model(FeeType::HARD_HURDLE, 1000), snapshot,
                                           no_protocol_fees, SECONDS_PER_YEAR, 1000);
    EXPECT_EQ(result.performance, Amount(1000000));
}

TEST_F(FeeEngineTest, SoftHurdleChargesWholeGainOnceCleared) {
    auto cleared = fees::compute_epoch_fees(Amount(120000000), model(FeeType::SOFT_HURDLE, 1000), snapshot,
                                            no_protocol_fees, SECONDS_PER_YEAR, 1000);
    EXPECT_EQ(cleared.performance, Amount(2000000));

    auto missed = fees::compute_epoch_fees(Amount(105000000), model(FeeType::SOFT_HURDLE, 1000), snapshot,
                                           no_protocol_fees, SECONDS_PER_YEAR, 1000);
    EXPECT_EQ(missed.performance, Amount(0));
}

TEST_F(FeeEngineTest, HurdleHighWaterMarkUsesTheHigherBenchmark) {
    auto result = fees::compute_epoch_fees(Amount(120000000),
                                           model(FeeType::HURDLE_HWM, 1000, 0, Amount(1150000)), snapshot,
                                           no_protocol_fees, SECONDS_PER_YEAR, 1000);
    EXPECT_EQ(result.performance, Amount(500000));
}

TEST_F(FeeEngineTest, ShortEpochHurdleDoesNotTruncate) {
    EXPECT_EQ(fees::hurdle_price(Amount(1000000), 500, 86400), Amount(1000136));
}

TEST_F(FeeEngineTest, NoPerformanceFeeWithoutPreviousSupply) {
    snapshot.previous_supply = 0;
    auto result = fees::compute_epoch_fees(Amount(110000000), model(FeeType::ABSOLUTE, 1000), snapshot,
                                           no_protocol_fees, 86400, 0);
    EXPECT_EQ(result.performance, Amount(0));
}

TEST_F(FeeEngineTest, ProtocolTakesVolumeFeeAndRevenueShare) {
    fees::ProtocolFeeRates rates;
    rates.volume_fee_bps = 50;
    rates.revenue_share_bps = 1000;

    auto result = fees::compute_epoch_fees(Amount(100000000), model(FeeType::ABSOLUTE, 0, 100), snapshot,
                                           rates, SECONDS_PER_YEAR, 0);
    EXPECT_EQ(result.management, Amount(1000000));
    EXPECT_EQ(result.protocol_volume, Amount(500000));
    EXPECT_EQ(result.protocol_share, Amount(600000));
    EXPECT_EQ(result.curator_share, Amount(900000));
    EXPECT_EQ(result.curator_share + result.protocol_share, result.total());
}

TEST_F(FeeEngineTest, HighWaterMarkOnlyMovesUp) {
    auto hwm = model(FeeType::HIGH_WATER_MARK, 1000, 0, Amount(1100000));
    EXPECT_EQ(fees::updated_high_water_mark(hwm, Amount(1000000)), Amount(1100000));
    EXPECT_EQ(fees::updated_high_water_mark(hwm, Amount(1200000)), Amount(1200000));

    auto absolute = model(FeeType::ABSOLUTE, 1000);
    EXPECT_EQ(fees::updated_high_water_mark(absolute, Amount(1200000)), Amount(0));
}

TEST_F(FeeEngineTest, RejectsFeesAboveMaxima) {
    EXPECT_NO_THROW(fees::validate_fee_model(model(FeeType::ABSOLUTE, fees::MAX_PERFORMANCE_FEE_BPS,
                                                   fees::MAX_MANAGEMENT_FEE_BPS)));
    EXPECT_THROW(fees::validate_fee_model(model(FeeType::ABSOLUTE, fees::MAX_PERFORMANCE_FEE_BPS + 1)),
                 ValidationError);
    EXPECT_THROW(fees::validate_fee_model(model(FeeType::ABSOLUTE, 0, fees::MAX_MANAGEMENT_FEE_BPS + 1)),
                 ValidationError);

    fees::ProtocolFeeRates rates;
    rates.volume_fee_bps = fees::MAX_PROTOCOL_VOLUME_FEE_BPS + 1;
    EXPECT_THROW(fees::validate_protocol_fee_rates(rates), ValidationError);
    rates.volume_fee_bps = 0;
    rates.revenue_share_bps = fees::MAX_PROTOCOL_REVENUE_SHARE_BPS + 1;
    EXPECT_THROW(fees::validate_protocol_fee_rates(rates), ValidationError);
}
