#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <set>
#include <vector>
#include "types.hpp"
#include "vault_accounting.hpp"

namespace orion {

// The netted result of one epoch: at most one order per asset.
struct NettedOrders {
    std::vector<Order> sells;  // drain orders first, then by asset id
    std::vector<Order> buys;   // by asset id
    std::size_t dust_filtered = 0;
    std::set<AssetId> filtered_assets;

    bool empty() const { return sells.empty() && buys.empty(); }
};

/**
 * Accumulates per-asset signed deltas (target - current) across every vault of an epoch
 * and nets them into a single buy list and sell list.
 *
 * A netted delta becomes an order only when its magnitude is strictly greater than the
 * asset's dust threshold. The underlying asset never produces an order.
 */
class OrderBook {
public:
    using DustThreshold = std::function<Amount(const AssetId&)>;

    explicit OrderBook(AssetId underlying = AssetId());

    // Folds one vault's rebalance into the book. Sells of assets in `drain_assets` are flagged.
    void fold_vault(const Portfolio& current, const Portfolio& target,
                    const std::set<AssetId>& drain_assets = {});

    void add_delta(const AssetId& asset, const SignedAmount& delta, bool drain = false);

    const std::map<AssetId, SignedAmount>& deltas() const { return deltas_; }
    std::size_t folded_vaults() const { return folded_vaults_; }

    NettedOrders build(const DustThreshold& dust_threshold, const accounting::PricingContext& pricing) const;

private:
    AssetId underlying_;
    std::map<AssetId, SignedAmount> deltas_;
    std::set<AssetId> drain_assets_;
    std::size_t folded_vaults_ = 0;
};

// One vault's side of a rebalance. `target` is adjusted in place when a netted order is filtered.
struct Rebalance {
    const Portfolio* current = nullptr;
    Portfolio* target = nullptr;
    std::set<AssetId> drain_assets;
    bool adjusted = false;
};

// Moves targets back toward current holdings until the deltas of `asset` sum to zero.
// Units come back from the vaults trading in the direction of the net, draining vaults last;
// vaults trading against the net are filled by the others.
void revert_filtered_delta(const AssetId& asset, std::vector<Rebalance>& rebalances);

// Re-derives the underlying position so `target` is worth `total_value`. Returns how much the
// other positions are worth beyond `total_value`, zero when they fit.
Amount settle_underlying(Portfolio& target, const Amount& total_value, const accounting::PricingContext& pricing);

// Target holdings for `intent` worth exactly `total_value` at the snapshot prices.
// Rounding remainders stay in the underlying.
Portfolio target_portfolio(const Intent& intent, const Amount& total_value,
                           const accounting::PricingContext& pricing);

} // namespace orion
