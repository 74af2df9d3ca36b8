#include "simulated_market.hpp"

#include <utility>
#include "core/exceptions.hpp"
#include "core/fixed_point.hpp"
#include "core/vault_accounting.hpp"
#include "utils/logger.hpp"

namespace orion {

SimulatedMarket::SimulatedMarket(AssetId underlying, unsigned underlying_decimals, std::uint32_t slippage_bps)
    : underlying_(std::move(underlying)), underlying_decimals_(underlying_decimals), slippage_bps_(slippage_bps) {
    if (slippage_bps_ >= BASIS_POINTS) {
        throw ConfigurationError("market slippage must be below 100%");
    }
}

void SimulatedMarket::set_price(const AssetId& asset, const PriceQuote& quote, unsigned asset_decimals) {
    Listing listing;
    listing.quote = quote;
    listing.decimals = asset_decimals;
    listings_[asset] = listing;
}

void SimulatedMarket::remove_price(const AssetId& asset) {
    listings_.erase(asset);
}

void SimulatedMarket::set_slippage_bps(std::uint32_t bps) {
    if (bps >= BASIS_POINTS) {
        throw ConfigurationError("market slippage must be below 100%");
    }
    slippage_bps_ = bps;
}

const SimulatedMarket::Listing& SimulatedMarket::listing(const AssetId& asset) const {
    auto it = listings_.find(asset);
    if (it == listings_.end()) {
        throw ValidationError("no market for " + asset);
    }
    return it->second;
}

PriceQuote SimulatedMarket::quote(const AssetId& asset) {
    return listing(asset).quote;
}

Amount SimulatedMarket::execute(OrderSide side, const AssetId& asset, const Amount& amount, const Amount& bound) {
    if (asset == underlying_) {
        throw ExecutionError("cannot trade the underlying against itself");
    }
    const Listing& market = listing(asset);
    const Amount value = accounting::to_underlying_value(amount, market.quote, market.decimals, underlying_decimals_);

    Amount filled = 0;
    if (side == OrderSide::SELL) {
        filled = fixed_point::apply_bps(value, BASIS_POINTS - slippage_bps_);
        if (filled < bound) {
            throw ExecutionError("sell of " + asset + " would return " + filled.str() + ", below " + bound.str());
        }
    } else {
        filled = fixed_point::mul_div(value, Amount(BASIS_POINTS + slippage_bps_), Amount(BASIS_POINTS),
                                      Rounding::CEIL);
        if (filled > bound) {
            throw ExecutionError("buy of " + asset + " would cost " + filled.str() + ", above " + bound.str());
        }
    }

    SimulatedTrade trade;
    trade.side = side;
    trade.asset = asset;
    trade.amount = amount;
    trade.underlying = filled;
    trades_.push_back(trade);
    ORION_LOG_DEBUG("Simulated {} of {} {} for {}", to_string(side), amount.str(), asset, filled.str());
    return filled;
}

std::vector<SimulatedTrade> SimulatedMarket::trades() const {
    return trades_;
}

} // namespace orion
