#pragma once

#include <cstdint>
#include <map>
#include <vector>
#include "core/adapters.hpp"
#include "core/types.hpp"

namespace orion {

struct SimulatedTrade {
    OrderSide side = OrderSide::SELL;
    AssetId asset;
    Amount amount = 0;
    Amount underlying = 0;
};

/**
 * Price table plus a fill model: sells receive the quoted value less the configured
 * slippage, buys pay the quoted value plus it. Fills outside the caller's bound throw.
 */
class SimulatedMarket : public PriceAdapter, public ExecutionAdapter {
public:
    SimulatedMarket(AssetId underlying, unsigned underlying_decimals, std::uint32_t slippage_bps = 0);

    void set_price(const AssetId& asset, const PriceQuote& quote, unsigned asset_decimals);
    void remove_price(const AssetId& asset);
    void set_slippage_bps(std::uint32_t bps);

    PriceQuote quote(const AssetId& asset) override;
    Amount execute(OrderSide side, const AssetId& asset, const Amount& amount, const Amount& bound) override;

    std::vector<SimulatedTrade> trades() const;

private:
    struct Listing {
        PriceQuote quote;
        unsigned decimals = 18;
    };

    const Listing& listing(const AssetId& asset) const;

    AssetId underlying_;
    unsigned underlying_decimals_;
    std::uint32_t slippage_bps_;
    std::map<AssetId, Listing> listings_;
    std::vector<SimulatedTrade> trades_;
};

} // namespace orion
