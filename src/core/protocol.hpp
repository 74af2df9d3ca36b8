#pragma once

#include <cstddef>
#include <string>
#include "adapters.hpp"
#include "config_registry.hpp"
#include "epoch_state.hpp"
#include "liquidity_ledger.hpp"
#include "liquidity_orchestrator.hpp"
#include "states_orchestrator.hpp"
#include "types.hpp"
#include "vault_registry.hpp"

namespace orion {

/**
 * Owns the protocol state and both orchestrators; the collaborators are borrowed and
 * must outlive it.
 */
class Protocol {
public:
    Protocol(Principals principals, AssetId underlying_asset, unsigned underlying_decimals,
             ProtocolParameters parameters, PriceAdapter& prices, ExecutionAdapter& execution,
             DecryptionOracle& oracle, Timestamp genesis);

    Protocol(const Protocol&) = delete;
    Protocol& operator=(const Protocol&) = delete;

    ConfigRegistry& config() { return config_; }
    const ConfigRegistry& config() const { return config_; }
    VaultRegistry& vaults() { return vaults_; }
    const VaultRegistry& vaults() const { return vaults_; }
    StatesOrchestrator& states() { return states_; }
    LiquidityOrchestrator& liquidity() { return liquidity_; }
    const EpochState& epoch_state() const { return state_; }
    const LiquidityLedger& ledger() const { return ledger_; }

    bool is_system_idle() const { return state_.is_system_idle(); }

    // Acts as the automation registry: runs whichever orchestrator needs work until
    // neither does or `max_steps` calls were made. Returns the number of calls made.
    std::size_t run_keeper(Timestamp now, std::size_t max_steps = 10000);

private:
    ConfigRegistry config_;
    VaultRegistry vaults_;
    EpochState state_;
    LiquidityLedger ledger_;
    StatesOrchestrator states_;
    LiquidityOrchestrator liquidity_;
};

} // namespace orion
