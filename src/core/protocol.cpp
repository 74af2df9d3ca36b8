#include "protocol.hpp"

#include <utility>
#include "utils/logger.hpp"

namespace orion {

Protocol::Protocol(Principals principals, AssetId underlying_asset, unsigned underlying_decimals,
                   ProtocolParameters parameters, PriceAdapter& prices, ExecutionAdapter& execution,
                   DecryptionOracle& oracle, Timestamp genesis)
    : config_(std::move(principals), std::move(underlying_asset), underlying_decimals, std::move(parameters)),
      vaults_(config_),
      states_(state_, vaults_, config_, ledger_, prices, oracle),
      liquidity_(state_, ledger_, vaults_, config_, execution) {
    state_.last_epoch_start = genesis;
    config_.set_idle_probe([this]() { return state_.is_system_idle(); });
    ORION_LOG_INFO("Protocol initialized with underlying {} at {}", config_.underlying_asset(), genesis);
}

std::size_t Protocol::run_keeper(Timestamp now, std::size_t max_steps) {
    ORION_SCOPED_TIMER("run_keeper");
    const Address& keeper = config_.automation_registry();
    std::size_t steps = 0;
    while (steps < max_steps) {
        UpkeepCheck check = states_.check_upkeep(now);
        if (check.needed) {
            states_.perform_upkeep(keeper, check.payload, now);
            ++steps;
            continue;
        }
        check = liquidity_.check_upkeep(now);
        if (check.needed) {
            liquidity_.perform_upkeep(keeper, check.payload, now);
            ++steps;
            continue;
        }
        break;
    }
    if (steps == max_steps) {
        ORION_LOG_WARN("Keeper stopped after {} steps with work remaining", steps);
    }
    return steps;
}

} // namespace orion
