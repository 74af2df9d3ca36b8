#pragma once

#include <map>
#include "types.hpp"

namespace orion {

// Aggregate positions held by the liquidity orchestrator on behalf of all vaults.
struct LiquidityLedger {
    std::map<AssetId, Amount> holdings;  // asset units, underlying excluded
    Amount cash = 0;                     // underlying, includes everything below
    Amount buffer = 0;
    Amount reserved = 0;                 // redemption proceeds owed to vaults this epoch
    std::map<VaultId, Amount> curator_fees;
    Amount protocol_fees = 0;

    Amount holding(const AssetId& asset) const {
        auto it = holdings.find(asset);
        return it == holdings.end() ? Amount(0) : it->second;
    }

    Amount spendable_cash() const {
        return cash > reserved ? Amount(cash - reserved) : Amount(0);
    }

    Amount total_fees() const {
        Amount total = protocol_fees;
        for (const auto& [vault, amount] : curator_fees) {
            total += amount;
        }
        return total;
    }
};

} // namespace orion
