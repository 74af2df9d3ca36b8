#include "order_book.hpp"

#include <algorithm>
#include <utility>
#include "exceptions.hpp"
#include "fixed_point.hpp"

namespace orion {

namespace {

Amount units_of(const Portfolio& portfolio, const AssetId& asset) {
    auto it = portfolio.find(asset);
    return it == portfolio.end() ? Amount(0) : it->second;
}

struct Mover {
    Rebalance* rebalance;
    Amount move;
    Amount reverted;
    bool draining;
};

// Pro rata to each mover's size, then the rounding remainder in order. `amount` never exceeds the total move.
void spread_revert(std::vector<Mover*>& movers, const Amount& amount) {
    Amount capacity = 0;
    for (const auto* mover : movers) {
        capacity += mover->move;
    }
    if (amount == 0 || capacity == 0) {
        return;
    }
    Amount assigned = 0;
    for (auto* mover : movers) {
        mover->reverted = fixed_point::mul_div(amount, mover->move, capacity);
        assigned += mover->reverted;
    }
    for (auto* mover : movers) {
        if (assigned == amount) {
            break;
        }
        const Amount room = mover->move - mover->reverted;
        const Amount extra = std::min(room, Amount(amount - assigned));
        mover->reverted += extra;
        assigned += extra;
    }
}

} // namespace

OrderBook::OrderBook(AssetId underlying) : underlying_(std::move(underlying)) {
}

void OrderBook::fold_vault(const Portfolio& current, const Portfolio& target,
                           const std::set<AssetId>& drain_assets) {
    std::set<AssetId> assets;
    for (const auto& [asset, units] : current) {
        assets.insert(asset);
    }
    for (const auto& [asset, units] : target) {
        assets.insert(asset);
    }

    for (const auto& asset : assets) {
        if (asset == underlying_) {
            continue;
        }
        auto held = current.find(asset);
        auto wanted = target.find(asset);
        const SignedAmount delta =
            fixed_point::to_signed(wanted == target.end() ? Amount(0) : wanted->second) -
            fixed_point::to_signed(held == current.end() ? Amount(0) : held->second);
        add_delta(asset, delta, delta < 0 && drain_assets.count(asset) > 0);
    }
    ++folded_vaults_;
}

void OrderBook::add_delta(const AssetId& asset, const SignedAmount& delta, bool drain) {
    if (asset == underlying_) {
        return;
    }
    deltas_[asset] += delta;
    if (drain) {
        drain_assets_.insert(asset);
    }
}

NettedOrders OrderBook::build(const DustThreshold& dust_threshold,
                              const accounting::PricingContext& pricing) const {
    NettedOrders orders;
    for (const auto& [asset, delta] : deltas_) {
        if (delta == 0) {
            continue;
        }
        const Amount amount = fixed_point::magnitude(delta);
        if (amount <= dust_threshold(asset)) {
            ++orders.dust_filtered;
            orders.filtered_assets.insert(asset);
            continue;
        }

        Order order;
        order.asset = asset;
        order.side = delta > 0 ? OrderSide::BUY : OrderSide::SELL;
        order.amount = amount;
        order.estimated_underlying_value = pricing.value_of(asset, amount);
        if (order.side == OrderSide::SELL) {
            order.drain = drain_assets_.count(asset) > 0;
            orders.sells.push_back(std::move(order));
        } else {
            orders.buys.push_back(std::move(order));
        }
    }

    // deltas_ is ordered by asset id, so a stable partition keeps that order within each group
    std::stable_partition(orders.sells.begin(), orders.sells.end(),
                          [](const Order& order) { return order.drain; });
    return orders;
}

void revert_filtered_delta(const AssetId& asset, std::vector<Rebalance>& rebalances) {
    std::vector<Mover> buyers;
    std::vector<Mover> sellers;
    SignedAmount net = 0;
    for (auto& rebalance : rebalances) {
        const Amount held = units_of(*rebalance.current, asset);
        const Amount wanted = units_of(*rebalance.target, asset);
        const bool draining = rebalance.drain_assets.count(asset) > 0;
        if (wanted > held) {
            buyers.push_back(Mover{&rebalance, wanted - held, 0, draining});
            net += fixed_point::to_signed(wanted - held);
        } else if (held > wanted) {
            sellers.push_back(Mover{&rebalance, held - wanted, 0, draining});
            net -= fixed_point::to_signed(held - wanted);
        }
    }
    if (net == 0) {
        return;
    }

    const bool buying = net > 0;
    std::vector<Mover>& movers = buying ? buyers : sellers;
    Amount remaining = fixed_point::magnitude(net);
    for (const bool draining : {false, true}) {
        std::vector<Mover*> tier;
        Amount capacity = 0;
        for (auto& mover : movers) {
            if (mover.draining == draining) {
                tier.push_back(&mover);
                capacity += mover.move;
            }
        }
        const Amount share = std::min(remaining, capacity);
        spread_revert(tier, share);
        remaining -= share;
    }
    if (remaining > 0) {
        throw InvariantViolationError("filtered delta of " + asset + " exceeds the vault rebalances");
    }

    for (const auto& mover : movers) {
        if (mover.reverted == 0) {
            continue;
        }
        Portfolio& target = *mover.rebalance->target;
        const Amount units = buying ? units_of(target, asset) - mover.reverted
                                    : units_of(target, asset) + mover.reverted;
        if (units == 0) {
            target.erase(asset);
        } else {
            target[asset] = units;
        }
        mover.rebalance->adjusted = true;
    }
}

Amount settle_underlying(Portfolio& target, const Amount& total_value, const accounting::PricingContext& pricing) {
    Amount allocated = 0;
    for (const auto& [asset, units] : target) {
        if (asset != pricing.underlying()) {
            allocated += pricing.value_of(asset, units);
        }
    }
    target.erase(pricing.underlying());
    if (allocated >= total_value) {
        return allocated - total_value;
    }
    target[pricing.underlying()] = total_value - allocated;
    return 0;
}

Portfolio target_portfolio(const Intent& intent, const Amount& total_value,
                           const accounting::PricingContext& pricing) {
    Portfolio target;
    Amount allocated = 0;
    for (const auto& entry : intent) {
        if (entry.asset == pricing.underlying()) {
            continue;
        }
        const Amount value = fixed_point::mul_div(Amount(entry.weight), total_value, Amount(INTENT_SCALE));
        const Amount units = pricing.units_for(entry.asset, value);
        if (units == 0) {
            continue;
        }
        target[entry.asset] += units;
        allocated += pricing.value_of(entry.asset, units);
    }
    if (allocated > total_value) {
        throw InvariantViolationError("target allocation exceeds vault value");
    }
    const Amount remainder = total_value - allocated;
    if (remainder > 0) {
        target[pricing.underlying()] = remainder;
    }
    return target;
}

} // namespace orion
