#include "vault_accounting.hpp"

#include <utility>

#include "exceptions.hpp"
#include "fixed_point.hpp"

namespace orion {
namespace accounting {

using fixed_point::mul_div;
using fixed_point::pow10;

unsigned decimals_offset(unsigned share_decimals, unsigned underlying_decimals) {
    return share_decimals > underlying_decimals ? share_decimals - underlying_decimals : 0;
}

Amount convert_to_assets(const Amount& shares, const Amount& pit_total_assets, const Amount& total_supply,
                         unsigned decimals_offset, Rounding rounding) {
    return mul_div(shares, pit_total_assets + 1, total_supply + pow10(decimals_offset), rounding);
}

Amount convert_to_shares(const Amount& assets, const Amount& pit_total_assets, const Amount& total_supply,
                         unsigned decimals_offset, Rounding rounding) {
    return mul_div(assets, total_supply + pow10(decimals_offset), pit_total_assets + 1, rounding);
}

Amount redemption_payout(const Amount& shares, const Amount& pit_total_assets, const Amount& total_supply) {
    if (total_supply == 0) {
        return 0;
    }
    if (shares > total_supply) {
        throw InvariantViolationError("redeemed shares exceed total supply");
    }
    return mul_div(shares, pit_total_assets, total_supply);
}

Amount to_underlying_value(const Amount& units, const PriceQuote& quote, unsigned asset_decimals,
                           unsigned underlying_decimals) {
    if (quote.price == 0) {
        throw InvariantViolationError("zero price quote");
    }
    return mul_div(units, quote.price * pow10(underlying_decimals),
                   pow10(asset_decimals + quote.price_decimals));
}

Amount to_asset_units(const Amount& value, const PriceQuote& quote, unsigned asset_decimals,
                      unsigned underlying_decimals) {
    if (quote.price == 0) {
        throw InvariantViolationError("zero price quote");
    }
    return mul_div(value, pow10(asset_decimals + quote.price_decimals),
                   quote.price * pow10(underlying_decimals));
}

PricingContext::PricingContext(AssetId underlying, unsigned underlying_decimals)
    : underlying_(std::move(underlying)), underlying_decimals_(underlying_decimals) {
    AssetInfo info;
    info.decimals = underlying_decimals;
    assets_[underlying_] = info;
}

void PricingContext::add_asset(const AssetId& asset, const AssetInfo& info) {
    assets_[asset] = info;
}

void PricingContext::set_quote(const AssetId& asset, const PriceQuote& quote) {
    if (quote.price == 0) {
        throw InvariantViolationError("zero price quote for " + asset);
    }
    quotes_[asset] = quote;
}

bool PricingContext::has_asset(const AssetId& asset) const {
    return assets_.count(asset) > 0;
}

const AssetInfo& PricingContext::asset_info(const AssetId& asset) const {
    auto it = assets_.find(asset);
    if (it == assets_.end()) {
        throw InvariantViolationError("unknown asset " + asset);
    }
    return it->second;
}

const PriceQuote& PricingContext::quote_for(const AssetId& asset) const {
    auto it = quotes_.find(asset);
    if (it == quotes_.end()) {
        throw InvariantViolationError("no price snapshot for " + asset);
    }
    return it->second;
}

Amount PricingContext::value_of(const AssetId& asset, const Amount& units) const {
    if (asset == underlying_ || units == 0) {
        return units;
    }
    return to_underlying_value(units, quote_for(asset), asset_info(asset).decimals, underlying_decimals_);
}

Amount PricingContext::units_for(const AssetId& asset, const Amount& value) const {
    if (asset == underlying_ || value == 0) {
        return value;
    }
    return to_asset_units(value, quote_for(asset), asset_info(asset).decimals, underlying_decimals_);
}

Amount PricingContext::portfolio_value(const Portfolio& portfolio) const {
    Amount total = 0;
    for (const auto& [asset, units] : portfolio) {
        total += value_of(asset, units);
    }
    return total;
}

} // namespace accounting
} // namespace orion
