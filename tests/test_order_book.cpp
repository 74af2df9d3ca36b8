#include <set>
#include <vector>
#include "gtest/gtest.h"
#include "core/exceptions.hpp"
#include "core/order_book.hpp"

using namespace orion;

class OrderBookTest : public ::testing::Test {
protected:
    void SetUp() override {
        pricing = accounting::PricingContext("USDC", 6);
        AssetInfo info;
        info.decimals = 18;
        pricing.add_asset("WETH", info);
        pricing.add_asset("WBTC", info);
        pricing.add_asset("LINK", info);
        pricing.set_quote("WETH", PriceQuote{Amount(1000), 0});
        pricing.set_quote("WBTC", PriceQuote{Amount(60000), 0});
        pricing.set_quote("LINK", PriceQuote{Amount(10), 0});
        dust = [](const AssetId&) { return Amount("10000000000000000"); };
    }

    accounting::PricingContext pricing;
    OrderBook::DustThreshold dust;
};

TEST_F(OrderBookTest, NetsOpposingDeltasAcrossVaults) {
    OrderBook book("USDC");
    Portfolio first_current{{"WETH", Amount("2000000000000000000")}};
    Portfolio first_target{{"WETH", Amount("1000000000000000000")}};
    Portfolio second_current;
    Portfolio second_target{{"WETH", Amount("1500000000000000000")}};

    book.fold_vault(first_current, first_target);
    book.fold_vault(second_current, second_target);
    EXPECT_EQ(book.folded_vaults(), 2u);

    auto orders = book.build(dust, pricing);
    EXPECT_TRUE(orders.sells.empty());
    ASSERT_EQ(orders.buys.size(), 1u);
    EXPECT_EQ(orders.buys[0].asset, "WETH");
    EXPECT_EQ(orders.buys[0].amount, Amount("500000000000000000"));
    EXPECT_EQ(orders.buys[0].estimated_underlying_value, Amount(500000000));
}

TEST_F(OrderBookTest, FullyNettedAssetProducesNoOrder) {
    OrderBook book("USDC");
    book.add_delta("WETH", SignedAmount("1000000000000000000"));
    book.add_delta("WETH", SignedAmount("-1000000000000000000"));

    auto orders = book.build(dust, pricing);
    EXPECT_TRUE(orders.empty());
    EXPECT_EQ(orders.dust_filtered, 0u);
}

TEST_F(OrderBookTest, DustThresholdIsExclusive) {
    OrderBook at_threshold("USDC");
    at_threshold.add_delta("WETH", SignedAmount("10000000000000000"));
    auto filtered = at_threshold.build(dust, pricing);
    EXPECT_TRUE(filtered.empty());
    EXPECT_EQ(filtered.dust_filtered, 1u);

    OrderBook above_threshold("USDC");
    above_threshold.add_delta("WETH", SignedAmount("10000000000000001"));
    auto orders = above_threshold.build(dust, pricing);
    ASSERT_EQ(orders.buys.size(), 1u);
    EXPECT_EQ(orders.buys[0].side, OrderSide::BUY);
    EXPECT_EQ(orders.buys[0].amount, Amount("10000000000000001"));
}

TEST_F(OrderBookTest, UnderlyingNeverProducesOrders) {
    OrderBook book("USDC");
    Portfolio current{{"USDC", Amount(100000000)}};
    Portfolio target{{"USDC", Amount(0)}, {"WETH", Amount("100000000000000000")}};
    book.fold_vault(current, target);
    book.add_delta("USDC", SignedAmount(-5000000));

    EXPECT_EQ(book.deltas().count("USDC"), 0u);
    auto orders = book.build(dust, pricing);
    ASSERT_EQ(orders.buys.size(), 1u);
    EXPECT_EQ(orders.buys[0].asset, "WETH");
}

TEST_F(OrderBookTest, DrainSellsComeFirst) {
    OrderBook book("USDC");
    Portfolio current{{"LINK", Amount("5000000000000000000")}, {"WETH", Amount("3000000000000000000")}};
    Portfolio target{{"LINK", Amount("1000000000000000000")}};
    book.fold_vault(current, target, {"WETH"});
    book.add_delta("WBTC", SignedAmount("-2000000000000000000"));

    auto orders = book.build(dust, pricing);
    ASSERT_EQ(orders.sells.size(), 3u);
    EXPECT_EQ(orders.sells[0].asset, "WETH");
    EXPECT_TRUE(orders.sells[0].drain);
    EXPECT_EQ(orders.sells[1].asset, "LINK");
    EXPECT_FALSE(orders.sells[1].drain);
    EXPECT_EQ(orders.sells[2].asset, "WBTC");
    EXPECT_EQ(orders.sells[1].estimated_underlying_value, Amount(40000000));
}

TEST_F(OrderBookTest, PerAssetDustThreshold) {
    OrderBook book("USDC");
    book.add_delta("WETH", SignedAmount("20000000000000000"));
    book.add_delta("WBTC", SignedAmount("20000000000000000"));
    OrderBook::DustThreshold per_asset = [](const AssetId& asset) {
        return asset == "WBTC" ? Amount("100000000000000000") : Amount("10000000000000000");
    };

    auto orders = book.build(per_asset, pricing);
    ASSERT_EQ(orders.buys.size(), 1u);
    EXPECT_EQ(orders.buys[0].asset, "WETH");
    EXPECT_EQ(orders.dust_filtered, 1u);
}

TEST_F(OrderBookTest, FilteredAssetsAreReported) {
    OrderBook book("USDC");
    book.add_delta("WETH", SignedAmount("5000000000000000"));
    book.add_delta("LINK", SignedAmount("-20000000000000000"));

    auto orders = book.build(dust, pricing);
    ASSERT_EQ(orders.sells.size(), 1u);
    EXPECT_EQ(orders.filtered_assets, std::set<AssetId>{"WETH"});
}

TEST_F(OrderBookTest, FilteredBuyComesOutOfTheBuyers) {
    // the seller's units cross internally, only the net excess is reverted
    Portfolio seller_current{{"WETH", Amount("5000000000000000")}};
    Portfolio seller_target{{"USDC", Amount(5000000)}};
    Portfolio buyer_current{{"USDC", Amount(5000001)}};
    Portfolio buyer_target{{"WETH", Amount("5000001000000000")}};

    std::vector<Rebalance> rebalances(2);
    rebalances[0].current = &seller_current;
    rebalances[0].target = &seller_target;
    rebalances[1].current = &buyer_current;
    rebalances[1].target = &buyer_target;
    revert_filtered_delta("WETH", rebalances);

    EXPECT_FALSE(rebalances[0].adjusted);
    EXPECT_EQ(seller_target.count("WETH"), 0u);
    EXPECT_TRUE(rebalances[1].adjusted);
    EXPECT_EQ(buyer_target.at("WETH"), Amount("5000000000000000"));
}

TEST_F(OrderBookTest, FilteredSellIsKeptProRata) {
    Portfolio big_current{{"WETH", Amount("6000000000000000")}};
    Portfolio big_target;
    Portfolio small_current{{"WETH", Amount("3000000000000000")}};
    Portfolio small_target;
    Portfolio buyer_current;
    Portfolio buyer_target{{"WETH", Amount("3000000000000000")}};

    std::vector<Rebalance> rebalances(3);
    rebalances[0].current = &big_current;
    rebalances[0].target = &big_target;
    rebalances[1].current = &small_current;
    rebalances[1].target = &small_target;
    rebalances[2].current = &buyer_current;
    rebalances[2].target = &buyer_target;
    revert_filtered_delta("WETH", rebalances);

    EXPECT_EQ(big_target.at("WETH"), Amount("4000000000000000"));
    EXPECT_EQ(small_target.at("WETH"), Amount("2000000000000000"));
    EXPECT_EQ(buyer_target.at("WETH"), Amount("3000000000000000"));
    EXPECT_FALSE(rebalances[2].adjusted);
}

TEST_F(OrderBookTest, DrainingSellersKeepUnitsLast) {
    Portfolio draining_current{{"WETH", Amount("4000000000000000")}};
    Portfolio draining_target;
    Portfolio other_current{{"WETH", Amount("8000000000000000")}};
    Portfolio other_target;
    Portfolio buyer_current;
    Portfolio buyer_target{{"WETH", Amount("6000000000000000")}};

    std::vector<Rebalance> rebalances(3);
    rebalances[0].current = &draining_current;
    rebalances[0].target = &draining_target;
    rebalances[0].drain_assets = {"WETH"};
    rebalances[1].current = &other_current;
    rebalances[1].target = &other_target;
    rebalances[2].current = &buyer_current;
    rebalances[2].target = &buyer_target;
    revert_filtered_delta("WETH", rebalances);

    EXPECT_TRUE(draining_target.empty());
    EXPECT_FALSE(rebalances[0].adjusted);
    EXPECT_EQ(other_target.at("WETH"), Amount("6000000000000000"));
}

TEST_F(OrderBookTest, RevertRemainderGoesToEarlierSellers) {
    Portfolio first_current{{"LINK", Amount(1)}};
    Portfolio first_target;
    Portfolio second_current{{"LINK", Amount(1)}};
    Portfolio second_target;
    Portfolio third_current{{"LINK", Amount(1)}};
    Portfolio third_target;
    Portfolio buyer_current;
    Portfolio buyer_target{{"LINK", Amount(1)}};

    std::vector<Rebalance> rebalances(4);
    rebalances[0].current = &first_current;
    rebalances[0].target = &first_target;
    rebalances[1].current = &second_current;
    rebalances[1].target = &second_target;
    rebalances[2].current = &third_current;
    rebalances[2].target = &third_target;
    rebalances[3].current = &buyer_current;
    rebalances[3].target = &buyer_target;
    revert_filtered_delta("LINK", rebalances);

    EXPECT_EQ(first_target.at("LINK"), Amount(1));
    EXPECT_EQ(second_target.at("LINK"), Amount(1));
    EXPECT_EQ(third_target.count("LINK"), 0u);
    EXPECT_EQ(buyer_target.at("LINK"), Amount(1));
}

TEST_F(OrderBookTest, SettleUnderlyingRebalancesTheRemainder) {
    Portfolio target{{"WETH", Amount("1000000000000000")}, {"USDC", Amount(7)}};
    EXPECT_EQ(settle_underlying(target, Amount(3000000), pricing), Amount(0));
    EXPECT_EQ(target.at("USDC"), Amount(2000000));
    EXPECT_EQ(pricing.portfolio_value(target), Amount(3000000));

    EXPECT_EQ(settle_underlying(target, Amount(400000), pricing), Amount(600000));
    EXPECT_EQ(target.count("USDC"), 0u);
    EXPECT_EQ(target.at("WETH"), Amount("1000000000000000"));
}

TEST_F(OrderBookTest, TargetPortfolioKeepsRemainderInUnderlying) {
    accounting::PricingContext context("USDC", 6);
    AssetInfo weth;
    weth.decimals = 18;
    context.add_asset("WETH", weth);
    context.set_quote("WETH", PriceQuote{Amount(7), 0});

    Intent intent{IntentEntry{"WETH", 600000000}, IntentEntry{"USDC", 400000000}};
    auto target = target_portfolio(intent, Amount(1000000000), context);
    EXPECT_EQ(target["WETH"], Amount("85714285714285714285"));
    EXPECT_EQ(target["USDC"], Amount(400000001));
    EXPECT_EQ(context.portfolio_value(target), Amount(1000000000));
}

TEST_F(OrderBookTest, TargetPortfolioOfEmptyVaultIsEmpty) {
    Intent intent{IntentEntry{"WETH", INTENT_SCALE}};
    EXPECT_TRUE(target_portfolio(intent, Amount(0), pricing).empty());
}
