#pragma once

#include <map>
#include "types.hpp"

namespace orion {
namespace accounting {

// Point-in-time totals a vault is priced at during one epoch.
struct PitSnapshot {
    Amount total_assets_for_redeem = 0;   // before any deposit-driven increase
    Amount total_assets_for_deposit = 0;  // after redemptions, before new deposits
    Amount supply_for_redeem = 0;
    Amount supply_for_deposit = 0;
};

unsigned decimals_offset(unsigned share_decimals, unsigned underlying_decimals);

/**
 * shares * (pit_total_assets + 1) / (total_supply + 10^decimals_offset)
 *
 * The +1 and the virtual supply form a virtual liquidity pool: a donation made
 * before any supply exists moves the price seen by later depositors by at most
 * D * supply / (supply + 10^decimals_offset).
 */
Amount convert_to_assets(const Amount& shares, const Amount& pit_total_assets, const Amount& total_supply,
                         unsigned decimals_offset, Rounding rounding = Rounding::FLOOR);

Amount convert_to_shares(const Amount& assets, const Amount& pit_total_assets, const Amount& total_supply,
                         unsigned decimals_offset, Rounding rounding = Rounding::FLOOR);

// Pro-rata share of the pool for settled redemptions: shares * pit_total_assets / total_supply.
Amount redemption_payout(const Amount& shares, const Amount& pit_total_assets, const Amount& total_supply);

// Value of `units` of an asset in underlying units.
Amount to_underlying_value(const Amount& units, const PriceQuote& quote, unsigned asset_decimals,
                           unsigned underlying_decimals);

// Units of an asset worth `value` underlying units.
Amount to_asset_units(const Amount& value, const PriceQuote& quote, unsigned asset_decimals,
                      unsigned underlying_decimals);

// Asset metadata and the epoch's price snapshot. The underlying is valued 1:1.
class PricingContext {
public:
    PricingContext() = default;
    PricingContext(AssetId underlying, unsigned underlying_decimals);

    void add_asset(const AssetId& asset, const AssetInfo& info);
    void set_quote(const AssetId& asset, const PriceQuote& quote);

    const AssetId& underlying() const { return underlying_; }
    unsigned underlying_decimals() const { return underlying_decimals_; }
    const PriceSnapshot& quotes() const { return quotes_; }

    bool has_asset(const AssetId& asset) const;
    const AssetInfo& asset_info(const AssetId& asset) const;

    Amount value_of(const AssetId& asset, const Amount& units) const;
    Amount units_for(const AssetId& asset, const Amount& value) const;
    Amount portfolio_value(const Portfolio& portfolio) const;

private:
    const PriceQuote& quote_for(const AssetId& asset) const;

    AssetId underlying_;
    unsigned underlying_decimals_ = 6;
    std::map<AssetId, AssetInfo> assets_;
    PriceSnapshot quotes_;
};

} // namespace accounting
} // namespace orion
