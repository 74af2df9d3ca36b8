#pragma once

#include <cstddef>
#include <cstdint>
#include <set>
#include <utility>
#include <vector>
#include "adapters.hpp"
#include "epoch_state.hpp"
#include "liquidity_ledger.hpp"
#include "types.hpp"

namespace orion {

class ConfigRegistry;
class Vault;
class VaultRegistry;
class VaultTransaction;

/**
 * Phase 1 of an epoch: prices every vault, settles the share math for its pending
 * requests, computes its target portfolio and nets all rebalances into the order book.
 *
 * Idle -> PreprocessingTransparentVaults -> PreprocessingEncryptedVaults -> Buffering
 *      -> PostprocessingTransparentVaults -> PostprocessingEncryptedVaults -> BuildingOrders -> Idle
 */
class StatesOrchestrator {
public:
    StatesOrchestrator(EpochState& state, VaultRegistry& vaults, const ConfigRegistry& config,
                       const LiquidityLedger& ledger, PriceAdapter& prices, DecryptionOracle& oracle);

    UpkeepCheck check_upkeep(Timestamp now) const;
    void perform_upkeep(const Address& caller, const std::vector<std::uint8_t>& payload, Timestamp now);

    Phase phase() const { return state_.phase; }
    std::uint64_t epoch_counter() const { return state_.epoch_counter; }

private:
    void validate_payload(const UpkeepPayload& payload, Timestamp now) const;

    // Each returns false when the call changed nothing.
    bool dispatch(Action action, EpochState& next, VaultTransaction& vaults, Timestamp now);
    void start_epoch(EpochState& next, Timestamp now);
    void preprocess_batch(EpochState& next, VaultTransaction& vaults, bool encrypted);
    void preprocess_vault(EpochState& next, VaultTransaction& vaults, const VaultId& id, bool encrypted);
    bool resolve_decryptions(EpochState& next, VaultTransaction& vaults);
    bool decryptions_ready() const;
    void buffer(EpochState& next);
    void postprocess_batch(EpochState& next, VaultTransaction& vaults, bool encrypted);
    void postprocess_vault(EpochState& next, const Vault& vault);
    void build_orders(EpochState& next);
    // Pulls rebalances of dust-filtered assets back to what the ledger will actually hold.
    void keep_filtered_holdings(EpochState& next);

    // Moves to `to`, skipping vault phases with nothing to process.
    void advance(EpochState& next, Phase to) const;
    const std::vector<VaultId>* phase_vaults(const EpochState& state, Phase phase) const;
    std::pair<std::size_t, std::size_t> next_batch(const EpochState& state, std::size_t total) const;

    Intent effective_intent(const Vault& vault, const Intent& intent) const;
    std::set<AssetId> drain_assets(const Vault& vault) const;
    PriceQuote fetch_quote(const AssetId& asset);

    EpochState& state_;
    VaultRegistry& vaults_;
    const ConfigRegistry& config_;
    const LiquidityLedger& ledger_;
    PriceAdapter& prices_;
    DecryptionOracle& oracle_;
};

} // namespace orion
