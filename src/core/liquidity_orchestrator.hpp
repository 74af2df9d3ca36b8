#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "adapters.hpp"
#include "epoch_state.hpp"
#include "liquidity_ledger.hpp"
#include "types.hpp"

namespace orion {

class ConfigRegistry;
class VaultRegistry;
class VaultTransaction;

/**
 * Phase 2 of an epoch: executes the netted order book built by the states side and
 * settles vault accounting.
 *
 * Idle -> Redeeming -> Selling -> Buying -> Depositing -> Idle
 *
 * Runs once per built epoch; a start request for an epoch that was already processed
 * is ignored.
 */
class LiquidityOrchestrator {
public:
    LiquidityOrchestrator(EpochState& state, LiquidityLedger& ledger, VaultRegistry& vaults,
                          const ConfigRegistry& config, ExecutionAdapter& execution);

    UpkeepCheck check_upkeep(Timestamp now) const;
    void perform_upkeep(const Address& caller, const std::vector<std::uint8_t>& payload, Timestamp now);

    Phase phase() const { return state_.phase; }
    std::uint64_t last_processed_epoch() const { return state_.last_processed_epoch; }
    const LiquidityLedger& ledger() const { return ledger_; }

    // Idle-only operations on the buffer and the accrued fees
    void deposit_liquidity(const Address& caller, const Amount& amount);
    void withdraw_liquidity(const Address& caller, const Amount& amount);
    Amount claim_curator_fees(const Address& caller, const VaultId& vault);
    Amount claim_protocol_fees(const Address& caller);

private:
    void validate_payload(const UpkeepPayload& payload) const;

    void dispatch(Action action, EpochState& next, LiquidityLedger& ledger, VaultTransaction& vaults);
    void redeem_batch(EpochState& next, LiquidityLedger& ledger, VaultTransaction& vaults);
    void sell_batch(EpochState& next, LiquidityLedger& ledger, VaultTransaction& vaults);
    void buy_batch(EpochState& next, LiquidityLedger& ledger, VaultTransaction& vaults);
    void deposit_batch(EpochState& next, LiquidityLedger& ledger, VaultTransaction& vaults);
    void finish_epoch(EpochState& next, LiquidityLedger& ledger, VaultTransaction& vaults);

    // Every non-underlying unit the ledger holds must belong to exactly one vault.
    void check_holdings_owned(const LiquidityLedger& ledger, const VaultTransaction& vaults) const;
    void execute_sell(const Order& order, LiquidityLedger& ledger);
    void execute_buy(const Order& order, LiquidityLedger& ledger);
    Amount call_adapter(OrderSide side, const AssetId& asset, const Amount& amount, const Amount& bound);
    void absorb_slippage(LiquidityLedger& ledger, const Amount& expected_cash_delta, const Amount& actual_cash_delta,
                         bool cash_in) const;

    // Moves to `to`, skipping phases with nothing to process; reaching Idle finishes the epoch.
    void advance(EpochState& next, LiquidityLedger& ledger, VaultTransaction& vaults, Phase to);
    std::size_t phase_size(const EpochState& state, Phase phase) const;
    std::pair<std::size_t, std::size_t> next_batch(const EpochState& state, std::size_t total) const;

    void require_idle_admin_window(const std::string& operation) const;

    EpochState& state_;
    LiquidityLedger& ledger_;
    VaultRegistry& vaults_;
    const ConfigRegistry& config_;
    ExecutionAdapter& execution_;
};

} // namespace orion
