#include "liquidity_orchestrator.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>
#include "config_registry.hpp"
#include "exceptions.hpp"
#include "fixed_point.hpp"
#include "vault.hpp"
#include "vault_registry.hpp"
#include "utils/epoch_logger.hpp"
#include "utils/logger.hpp"

namespace orion {

namespace {

Amount lower_bound_for(const Amount& estimate, std::uint32_t slippage_bps) {
    return fixed_point::mul_div(estimate, Amount(BASIS_POINTS - slippage_bps), Amount(BASIS_POINTS));
}

Amount upper_bound_for(const Amount& estimate, std::uint32_t slippage_bps) {
    return fixed_point::mul_div(estimate, Amount(BASIS_POINTS + slippage_bps), Amount(BASIS_POINTS));
}

} // namespace

LiquidityOrchestrator::LiquidityOrchestrator(EpochState& state, LiquidityLedger& ledger, VaultRegistry& vaults,
                                             const ConfigRegistry& config, ExecutionAdapter& execution)
    : state_(state), ledger_(ledger), vaults_(vaults), config_(config), execution_(execution) {
}

UpkeepCheck LiquidityOrchestrator::check_upkeep(Timestamp /*now*/) const {
    UpkeepCheck check;
    if (config_.is_paused()) {
        return check;
    }
    const auto transition = find_transition(Orchestrator::LIQUIDITY, state_.phase);
    if (!transition) {
        return check;
    }
    if (state_.phase == Phase::IDLE && state_.epoch_counter <= state_.last_processed_epoch) {
        return check;
    }

    UpkeepPayload payload;
    payload.action = transition->action;
    payload.epoch = state_.epoch_counter;
    payload.minibatch = state_.cursor;
    check.needed = true;
    check.payload = encode_payload(payload);
    return check;
}

void LiquidityOrchestrator::perform_upkeep(const Address& caller, const std::vector<std::uint8_t>& payload_bytes,
                                           Timestamp /*now*/) {
    if (caller != config_.automation_registry()) {
        throw NotAuthorizedError(caller + " is not the automation registry");
    }
    config_.require_not_paused("perform_upkeep");

    const UpkeepPayload payload = decode_payload(payload_bytes);
    if (payload.action == Action::START_LIQUIDITY && state_.phase == Phase::IDLE &&
        payload.epoch == state_.epoch_counter && state_.last_processed_epoch == state_.epoch_counter) {
        ORION_LOG_DEBUG("Epoch {} already executed, ignoring start request", payload.epoch);
        return;
    }
    validate_payload(payload);

    EpochState next = state_;
    LiquidityLedger ledger = ledger_;
    VaultTransaction vaults(vaults_);
    try {
        dispatch(payload.action, next, ledger, vaults);
    } catch (const std::overflow_error& e) {
        throw InvariantViolationError(std::string("arithmetic overflow: ") + e.what());
    } catch (const std::range_error& e) {
        throw InvariantViolationError(std::string("arithmetic underflow: ") + e.what());
    }

    vaults.commit();
    ledger_ = std::move(ledger);
    state_ = std::move(next);
}

void LiquidityOrchestrator::validate_payload(const UpkeepPayload& payload) const {
    if (payload.epoch != state_.epoch_counter) {
        throw InvalidStateError("payload for epoch " + std::to_string(payload.epoch) + ", current epoch is " +
                                std::to_string(state_.epoch_counter));
    }
    const auto transition = find_transition(Orchestrator::LIQUIDITY, state_.phase);
    if (!transition || transition->action != payload.action) {
        throw InvalidStateError(to_string(payload.action) + " is not legal in phase " + to_string(state_.phase));
    }
    if (payload.minibatch != state_.cursor) {
        throw InvalidStateError("minibatch " + std::to_string(payload.minibatch) + " does not match cursor " +
                                std::to_string(state_.cursor));
    }
}

void LiquidityOrchestrator::dispatch(Action action, EpochState& next, LiquidityLedger& ledger,
                                     VaultTransaction& vaults) {
    switch (action) {
        case Action::START_LIQUIDITY:
            ORION_LOG_INFO("Executing epoch {}: {} sells, {} buys", next.epoch_counter, next.orders.sells.size(),
                           next.orders.buys.size());
            advance(next, ledger, vaults, Phase::REDEEMING);
            break;
        case Action::REDEEM:
            redeem_batch(next, ledger, vaults);
            break;
        case Action::SELL:
            sell_batch(next, ledger, vaults);
            break;
        case Action::BUY:
            buy_batch(next, ledger, vaults);
            break;
        case Action::DEPOSIT:
            deposit_batch(next, ledger, vaults);
            break;
        default:
            throw InvalidStateError(to_string(action) + " is not a liquidity action");
    }
}

void LiquidityOrchestrator::redeem_batch(EpochState& next, LiquidityLedger& ledger, VaultTransaction& vaults) {
    const std::vector<VaultId> ids = next.epoch_vaults();
    const auto [first, last] = next_batch(next, ids.size());
    for (std::size_t i = first; i < last; ++i) {
        const VaultEpochRecord& record = next.record(ids[i]);
        Vault& vault = vaults.edit(ids[i]);

        vault.settle_redemptions(record.redemption_payouts, record.pit.total_assets_for_deposit);
        ledger.reserved += record.total_redemption_payout;

        const Amount escrow = vault.collect_deposit_escrow();
        if (escrow != record.total_deposits) {
            throw InvariantViolationError("deposit escrow of " + ids[i] + " is " + escrow.str() + ", expected " +
                                          record.total_deposits.str());
        }
        ledger.cash += escrow;
        ledger.buffer += record.buffer_charge;

        utils::EpochLogger::log_redemption_settled(ids[i], record.redemption_payouts.size(),
                                                   record.total_redeemed_shares, record.total_redemption_payout);
    }
    utils::EpochLogger::log_minibatch_processed(to_string(next.phase), next.epoch_counter, first, last - first);

    if (last < ids.size()) {
        next.cursor = last;
        return;
    }
    advance(next, ledger, vaults, Phase::SELLING);
}

void LiquidityOrchestrator::sell_batch(EpochState& next, LiquidityLedger& ledger, VaultTransaction& vaults) {
    const auto [first, last] = next_batch(next, next.orders.sells.size());
    for (std::size_t i = first; i < last; ++i) {
        execute_sell(next.orders.sells[i], ledger);
    }
    utils::EpochLogger::log_minibatch_processed(to_string(next.phase), next.epoch_counter, first, last - first);

    if (last < next.orders.sells.size()) {
        next.cursor = last;
        return;
    }
    advance(next, ledger, vaults, Phase::BUYING);
}

void LiquidityOrchestrator::buy_batch(EpochState& next, LiquidityLedger& ledger, VaultTransaction& vaults) {
    const auto [first, last] = next_batch(next, next.orders.buys.size());
    for (std::size_t i = first; i < last; ++i) {
        execute_buy(next.orders.buys[i], ledger);
    }
    utils::EpochLogger::log_minibatch_processed(to_string(next.phase), next.epoch_counter, first, last - first);

    if (last < next.orders.buys.size()) {
        next.cursor = last;
        return;
    }
    advance(next, ledger, vaults, Phase::DEPOSITING);
}

void LiquidityOrchestrator::deposit_batch(EpochState& next, LiquidityLedger& ledger, VaultTransaction& vaults) {
    const std::vector<VaultId> ids = next.epoch_vaults();
    const auto [first, last] = next_batch(next, ids.size());
    for (std::size_t i = first; i < last; ++i) {
        const VaultEpochRecord& record = next.record(ids[i]);
        Vault& vault = vaults.edit(ids[i]);

        vault.settle_deposits(record.minted_shares);
        if (vault.total_supply() != record.final_total_supply) {
            throw InvariantViolationError("supply of " + ids[i] + " is " + vault.total_supply().str() +
                                          ", expected " + record.final_total_supply.str());
        }
        vault.record_epoch_result(record.final_total_assets, record.target_portfolio);
        vault.apply_fee_model(record.fee_model, next.last_epoch_start);
        utils::EpochLogger::log_deposit_settled(ids[i], record.minted_shares.size(), record.total_deposits,
                                                record.total_minted_shares);

        if (record.fees.total() > 0) {
            ledger.curator_fees[ids[i]] += record.fees.curator_share;
            ledger.protocol_fees += record.fees.protocol_share;
            utils::EpochLogger::log_fees_accrued(ids[i], record.fees.management, record.fees.performance,
                                                 record.fees.curator_share, record.fees.protocol_share);
        }

        if (vault.is_decommissioning()) {
            // Dust the book could not sell keeps the vault open until a later epoch nets it away.
            const AssetId& underlying = config_.underlying_asset();
            const bool underlying_only = std::all_of(
                record.target_portfolio.begin(), record.target_portfolio.end(),
                [&underlying](const auto& position) { return position.first == underlying || position.second == 0; });
            if (!underlying_only) {
                ORION_LOG_INFO("Vault {} still holds unsold dust, decommissioning continues", ids[i]);
                continue;
            }
            auto it = record.target_portfolio.find(underlying);
            const Amount released = it == record.target_portfolio.end() ? Amount(0) : it->second;
            if (ledger.spendable_cash() < released) {
                throw ExecutionError("not enough cash to release " + released.str() + " to decommissioned vault " +
                                     ids[i]);
            }
            ledger.cash -= released;
            vault.complete_decommissioning(released);
            utils::EpochLogger::log_vault_decommissioned(ids[i], released);
        }
    }
    utils::EpochLogger::log_minibatch_processed(to_string(next.phase), next.epoch_counter, first, last - first);

    if (last < ids.size()) {
        next.cursor = last;
        return;
    }
    advance(next, ledger, vaults, Phase::IDLE);
}

void LiquidityOrchestrator::finish_epoch(EpochState& next, LiquidityLedger& ledger, VaultTransaction& vaults) {
    for (const auto& id : next.epoch_vaults()) {
        const VaultEpochRecord& record = next.record(id);
        if (record.total_redemption_payout > 0) {
            vaults.edit(id).receive_redemption_funds(record.total_redemption_payout);
        }
    }
    if (ledger.cash < ledger.reserved) {
        throw ExecutionError("cash " + ledger.cash.str() + " cannot cover redemptions of " + ledger.reserved.str());
    }
    ledger.cash -= ledger.reserved;
    ledger.reserved = 0;

    check_holdings_owned(ledger, vaults);

    // Whatever cash the vaults and fee balances do not own is the buffer.
    const AssetId& underlying = config_.underlying_asset();
    Amount committed = ledger.total_fees();
    for (const auto& id : vaults_.all_vault_ids()) {
        const Vault& vault = vaults.view(id);
        if (vault.is_decommissioned()) {
            continue;
        }
        auto it = vault.portfolio().find(underlying);
        if (it != vault.portfolio().end()) {
            committed += it->second;
        }
    }
    if (ledger.cash < committed) {
        throw ExecutionError("cash " + ledger.cash.str() + " is below committed balances of " + committed.str());
    }
    const Amount reconciled = ledger.cash - committed;
    if (reconciled != ledger.buffer) {
        ORION_LOG_DEBUG("Buffer reconciled from {} to {}", ledger.buffer.str(), reconciled.str());
    }
    ledger.buffer = reconciled;

    next.last_processed_epoch = next.epoch_counter;
    utils::EpochLogger::log_epoch_completed(next.epoch_counter, ledger.buffer);
}

void LiquidityOrchestrator::check_holdings_owned(const LiquidityLedger& ledger, const VaultTransaction& vaults) const {
    const AssetId& underlying = config_.underlying_asset();
    std::map<AssetId, Amount> owned;
    for (const auto& [asset, units] : ledger.holdings) {
        owned[asset] = 0;
    }
    for (const auto& id : vaults_.all_vault_ids()) {
        for (const auto& [asset, units] : vaults.view(id).portfolio()) {
            if (asset != underlying) {
                owned[asset] += units;
            }
        }
    }
    for (const auto& [asset, units] : owned) {
        if (units != ledger.holding(asset)) {
            throw InvariantViolationError("ledger holds " + ledger.holding(asset).str() + " " + asset +
                                          ", vault portfolios record " + units.str());
        }
    }
}

void LiquidityOrchestrator::execute_sell(const Order& order, LiquidityLedger& ledger) {
    const Amount amount = order.amount;
    if (ledger.holding(order.asset) < amount) {
        throw InvariantViolationError("sell of " + amount.str() + " " + order.asset + " exceeds ledger holdings of " +
                                      ledger.holding(order.asset).str());
    }
    const Amount estimate = order.estimated_underlying_value;
    const Amount min_out = lower_bound_for(estimate, config_.slippage_tolerance_bps());

    const Amount received = call_adapter(OrderSide::SELL, order.asset, amount, min_out);
    if (received < min_out) {
        throw ExecutionError("sell of " + order.asset + " returned " + received.str() + ", minimum " +
                             min_out.str());
    }

    ledger.holdings[order.asset] -= amount;
    if (ledger.holdings[order.asset] == 0) {
        ledger.holdings.erase(order.asset);
    }
    ledger.cash += received;
    absorb_slippage(ledger, estimate, received, true);
    utils::EpochLogger::log_trade_executed(OrderSide::SELL, order.asset, amount, min_out, received);
}

void LiquidityOrchestrator::execute_buy(const Order& order, LiquidityLedger& ledger) {
    const Amount max_in = upper_bound_for(order.estimated_underlying_value, config_.slippage_tolerance_bps());

    const Amount spent = call_adapter(OrderSide::BUY, order.asset, order.amount, max_in);
    if (spent > max_in) {
        throw ExecutionError("buy of " + order.asset + " cost " + spent.str() + ", maximum " + max_in.str());
    }
    if (spent > ledger.spendable_cash()) {
        throw ExecutionError("buy of " + order.asset + " cost " + spent.str() + ", spendable cash " +
                             ledger.spendable_cash().str());
    }

    ledger.holdings[order.asset] += order.amount;
    ledger.cash -= spent;
    absorb_slippage(ledger, order.estimated_underlying_value, spent, false);
    utils::EpochLogger::log_trade_executed(OrderSide::BUY, order.asset, order.amount, max_in, spent);
}

Amount LiquidityOrchestrator::call_adapter(OrderSide side, const AssetId& asset, const Amount& amount,
                                           const Amount& bound) {
    try {
        return execution_.execute(side, asset, amount, bound);
    } catch (const ExecutionError&) {
        throw;
    } catch (const std::exception& e) {
        throw ExecutionError(to_string(side) + " " + asset + " failed: " + e.what());
    }
}

void LiquidityOrchestrator::absorb_slippage(LiquidityLedger& ledger, const Amount& expected_cash_delta,
                                            const Amount& actual_cash_delta, bool cash_in) const {
    const bool gain = cash_in ? actual_cash_delta >= expected_cash_delta : actual_cash_delta <= expected_cash_delta;
    const Amount difference = actual_cash_delta > expected_cash_delta ? Amount(actual_cash_delta - expected_cash_delta)
                                                                      : Amount(expected_cash_delta - actual_cash_delta);
    if (gain) {
        ledger.buffer += difference;
        return;
    }
    if (difference > ledger.buffer) {
        throw ExecutionError("slippage loss of " + difference.str() + " exceeds buffer of " + ledger.buffer.str());
    }
    ledger.buffer -= difference;
}

void LiquidityOrchestrator::advance(EpochState& next, LiquidityLedger& ledger, VaultTransaction& vaults, Phase to) {
    const Phase from = next.phase;
    Phase target = to;
    while (target != Phase::IDLE && phase_size(next, target) == 0) {
        target = find_transition(Orchestrator::LIQUIDITY, target)->to;
    }
    next.phase = target;
    next.cursor = 0;
    utils::EpochLogger::log_phase_advanced(to_string(Orchestrator::LIQUIDITY), next.epoch_counter, to_string(from),
                                           to_string(target));
    if (target == Phase::IDLE) {
        finish_epoch(next, ledger, vaults);
    }
}

std::size_t LiquidityOrchestrator::phase_size(const EpochState& state, Phase phase) const {
    switch (phase) {
        case Phase::REDEEMING:
        case Phase::DEPOSITING:
            return state.transparent_vaults.size() + state.encrypted_vaults.size();
        case Phase::SELLING:
            return state.orders.sells.size();
        case Phase::BUYING:
            return state.orders.buys.size();
        default:
            return 0;
    }
}

std::pair<std::size_t, std::size_t> LiquidityOrchestrator::next_batch(const EpochState& state,
                                                                      std::size_t total) const {
    const std::size_t first = std::min(state.cursor, total);
    const std::size_t last = std::min(total, first + config_.minibatch_size());
    return {first, last};
}

void LiquidityOrchestrator::require_idle_admin_window(const std::string& operation) const {
    config_.require_not_paused(operation);
    config_.require_idle(operation);
}

void LiquidityOrchestrator::deposit_liquidity(const Address& caller, const Amount& amount) {
    config_.require_admin(caller, "deposit_liquidity");
    require_idle_admin_window("deposit_liquidity");
    if (amount == 0) {
        throw ValidationError("liquidity amount must be positive");
    }
    ledger_.cash += amount;
    ledger_.buffer += amount;
    ORION_LOG_INFO("Buffer funded with {}, now {}", amount.str(), ledger_.buffer.str());
}

void LiquidityOrchestrator::withdraw_liquidity(const Address& caller, const Amount& amount) {
    config_.require_admin(caller, "withdraw_liquidity");
    require_idle_admin_window("withdraw_liquidity");
    if (amount == 0) {
        throw ValidationError("liquidity amount must be positive");
    }
    if (amount > ledger_.buffer) {
        throw ValidationError("withdrawal of " + amount.str() + " exceeds buffer of " + ledger_.buffer.str());
    }
    ledger_.cash -= amount;
    ledger_.buffer -= amount;
    ORION_LOG_INFO("Buffer reduced by {}, now {}", amount.str(), ledger_.buffer.str());
}

Amount LiquidityOrchestrator::claim_curator_fees(const Address& caller, const VaultId& vault) {
    require_idle_admin_window("claim_curator_fees");
    if (vaults_.vault(vault).curator() != caller) {
        throw NotAuthorizedError(caller + " is not the curator of " + vault);
    }
    auto it = ledger_.curator_fees.find(vault);
    if (it == ledger_.curator_fees.end() || it->second == 0) {
        throw ValidationError("no curator fees accrued for " + vault);
    }
    const Amount amount = it->second;
    ledger_.curator_fees.erase(it);
    ledger_.cash -= amount;
    ORION_LOG_INFO("Curator {} claimed {} in fees from {}", caller, amount.str(), vault);
    return amount;
}

Amount LiquidityOrchestrator::claim_protocol_fees(const Address& caller) {
    config_.require_admin(caller, "claim_protocol_fees");
    require_idle_admin_window("claim_protocol_fees");
    if (ledger_.protocol_fees == 0) {
        throw ValidationError("no protocol fees accrued");
    }
    const Amount amount = ledger_.protocol_fees;
    ledger_.protocol_fees = 0;
    ledger_.cash -= amount;
    ORION_LOG_INFO("Protocol fees of {} claimed", amount.str());
    return amount;
}

} // namespace orion
