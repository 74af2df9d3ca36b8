#include "states_orchestrator.hpp"

#include <algorithm>
#include <stdexcept>
#include "config_registry.hpp"
#include "exceptions.hpp"
#include "fee_engine.hpp"
#include "fixed_point.hpp"
#include "vault.hpp"
#include "vault_accounting.hpp"
#include "vault_registry.hpp"
#include "utils/epoch_logger.hpp"
#include "utils/logger.hpp"

namespace orion {

StatesOrchestrator::StatesOrchestrator(EpochState& state, VaultRegistry& vaults, const ConfigRegistry& config,
                                       const LiquidityLedger& ledger, PriceAdapter& prices,
                                       DecryptionOracle& oracle)
    : state_(state), vaults_(vaults), config_(config), ledger_(ledger), prices_(prices), oracle_(oracle) {
}

UpkeepCheck StatesOrchestrator::check_upkeep(Timestamp now) const {
    UpkeepCheck check;
    if (config_.is_paused()) {
        return check;
    }
    const auto transition = find_transition(Orchestrator::STATES, state_.phase);
    if (!transition) {
        return check;
    }

    if (state_.phase == Phase::IDLE) {
        if (state_.last_processed_epoch != state_.epoch_counter) {
            return check;
        }
        if (now < state_.last_epoch_start + config_.epoch_duration()) {
            return check;
        }
    } else if (state_.phase == Phase::PREPROCESSING_ENCRYPTED_VAULTS &&
               state_.cursor >= state_.encrypted_vaults.size() && !decryptions_ready()) {
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

void StatesOrchestrator::perform_upkeep(const Address& caller, const std::vector<std::uint8_t>& payload_bytes,
                                        Timestamp now) {
    if (caller != config_.automation_registry()) {
        throw NotAuthorizedError(caller + " is not the automation registry");
    }
    config_.require_not_paused("perform_upkeep");

    const UpkeepPayload payload = decode_payload(payload_bytes);
    validate_payload(payload, now);

    EpochState next = state_;
    VaultTransaction vaults(vaults_);
    bool changed = false;
    try {
        changed = dispatch(payload.action, next, vaults, now);
    } catch (const std::overflow_error& e) {
        throw InvariantViolationError(std::string("arithmetic overflow: ") + e.what());
    } catch (const std::range_error& e) {
        throw InvariantViolationError(std::string("arithmetic underflow: ") + e.what());
    }

    if (!changed) {
        return;
    }
    vaults.commit();
    state_ = std::move(next);
}

void StatesOrchestrator::validate_payload(const UpkeepPayload& payload, Timestamp now) const {
    if (payload.epoch != state_.epoch_counter) {
        throw InvalidStateError("payload for epoch " + std::to_string(payload.epoch) + ", current epoch is " +
                                std::to_string(state_.epoch_counter));
    }
    const auto transition = find_transition(Orchestrator::STATES, state_.phase);
    if (!transition || transition->action != payload.action) {
        throw InvalidStateError(to_string(payload.action) + " is not legal in phase " + to_string(state_.phase));
    }
    if (payload.minibatch != state_.cursor) {
        throw InvalidStateError("minibatch " + std::to_string(payload.minibatch) + " does not match cursor " +
                                std::to_string(state_.cursor));
    }
    if (payload.action == Action::START_EPOCH) {
        if (state_.last_processed_epoch != state_.epoch_counter) {
            throw InvalidStateError("orders of epoch " + std::to_string(state_.epoch_counter) +
                                    " have not been executed");
        }
        if (now < state_.last_epoch_start + config_.epoch_duration()) {
            throw InvalidStateError("epoch duration has not elapsed");
        }
    }
}

bool StatesOrchestrator::dispatch(Action action, EpochState& next, VaultTransaction& vaults, Timestamp now) {
    switch (action) {
        case Action::START_EPOCH:
            start_epoch(next, now);
            advance(next, Phase::PREPROCESSING_TRANSPARENT_VAULTS);
            return true;
        case Action::PREPROCESS_TRANSPARENT:
            preprocess_batch(next, vaults, false);
            return true;
        case Action::PREPROCESS_ENCRYPTED:
            if (next.cursor < next.encrypted_vaults.size()) {
                preprocess_batch(next, vaults, true);
                return true;
            }
            if (!resolve_decryptions(next, vaults)) {
                ORION_LOG_DEBUG("Epoch {} waiting for intent decryption", next.epoch_counter);
                return false;
            }
            advance(next, Phase::BUFFERING);
            return true;
        case Action::BUFFER:
            buffer(next);
            advance(next, Phase::POSTPROCESSING_TRANSPARENT_VAULTS);
            return true;
        case Action::POSTPROCESS_TRANSPARENT:
            postprocess_batch(next, vaults, false);
            return true;
        case Action::POSTPROCESS_ENCRYPTED:
            postprocess_batch(next, vaults, true);
            return true;
        case Action::BUILD_ORDERS:
            build_orders(next);
            return true;
        default:
            throw InvalidStateError(to_string(action) + " is not a states action");
    }
}

void StatesOrchestrator::start_epoch(EpochState& next, Timestamp now) {
    next.last_epoch_start = now;
    next.transparent_vaults = vaults_.vault_ids(VaultType::TRANSPARENT);
    next.encrypted_vaults = vaults_.vault_ids(VaultType::ENCRYPTED);
    next.records.clear();
    next.orders = NettedOrders();
    next.buffer_target = 0;
    next.pending_book = OrderBook(config_.underlying_asset());

    // Every whitelisted asset plus anything a vault still holds after a de-whitelisting.
    std::set<AssetId> assets;
    for (const auto& asset : config_.whitelisted_assets()) {
        assets.insert(asset);
    }
    for (const auto& id : next.epoch_vaults()) {
        for (const auto& [asset, units] : vaults_.vault(id).portfolio()) {
            if (asset != config_.underlying_asset() && units > 0) {
                assets.insert(asset);
            }
        }
    }

    accounting::PricingContext pricing(config_.underlying_asset(), config_.underlying_decimals());
    for (const auto& asset : assets) {
        pricing.add_asset(asset, config_.asset_info(asset));
        pricing.set_quote(asset, fetch_quote(asset));
    }
    next.pricing = std::move(pricing);

    utils::EpochLogger::log_epoch_started(next.epoch_counter, next.transparent_vaults.size(),
                                          next.encrypted_vaults.size(), assets.size());
}

void StatesOrchestrator::preprocess_batch(EpochState& next, VaultTransaction& vaults, bool encrypted) {
    const std::vector<VaultId> ids = encrypted ? next.encrypted_vaults : next.transparent_vaults;
    const auto [first, last] = next_batch(next, ids.size());
    for (std::size_t i = first; i < last; ++i) {
        preprocess_vault(next, vaults, ids[i], encrypted);
    }
    utils::EpochLogger::log_minibatch_processed(to_string(next.phase), next.epoch_counter, first, last - first);

    if (last < ids.size()) {
        next.cursor = last;
        return;
    }
    if (!encrypted) {
        advance(next, Phase::PREPROCESSING_ENCRYPTED_VAULTS);
        return;
    }
    next.cursor = last;
    if (resolve_decryptions(next, vaults)) {
        advance(next, Phase::BUFFERING);
    }
}

void StatesOrchestrator::preprocess_vault(EpochState& next, VaultTransaction& vaults, const VaultId& id,
                                          bool encrypted) {
    const Vault& vault = vaults.view(id);

    VaultEpochRecord record;
    record.vault = id;
    record.pit.total_assets_for_redeem = next.pricing.portfolio_value(vault.portfolio());
    record.pit.supply_for_redeem = vault.total_supply();

    // Redemptions price off the pre-deposit value.
    for (const auto& [user, shares] : vault.pending_redeems()) {
        const Amount payout = accounting::redemption_payout(shares, record.pit.total_assets_for_redeem,
                                                            record.pit.supply_for_redeem);
        record.redemption_payouts[user] = payout;
        record.total_redeemed_shares += shares;
        record.total_redemption_payout += payout;
    }
    record.pit.total_assets_for_deposit = record.pit.total_assets_for_redeem - record.total_redemption_payout;
    record.pit.supply_for_deposit = record.pit.supply_for_redeem - record.total_redeemed_shares;
    record.total_deposits = vault.total_pending_deposits();

    if (encrypted) {
        Vault& editable = vaults.edit(id);
        if (auto ciphertext = editable.take_encrypted_intent()) {
            record.decryption_request = oracle_.request_decryption(id, *ciphertext);
            ORION_LOG_DEBUG("Decryption request {} submitted for {}", *record.decryption_request, id);
        } else {
            record.intent = editable.intent();
        }
    } else {
        record.intent = vault.intent();
    }

    next.records[id] = std::move(record);
}

bool StatesOrchestrator::resolve_decryptions(EpochState& next, VaultTransaction& vaults) {
    bool ready = true;
    for (const auto& id : next.encrypted_vaults) {
        VaultEpochRecord& record = next.record(id);
        if (!record.decryption_request || record.decryption_resolved) {
            continue;
        }
        const auto intent = oracle_.poll(*record.decryption_request);
        if (!intent) {
            ready = false;
            continue;
        }
        Vault& vault = vaults.edit(id);
        vault.apply_decrypted_intent(*intent);
        record.intent = vault.intent();
        record.decryption_resolved = true;
    }
    return ready;
}

bool StatesOrchestrator::decryptions_ready() const {
    for (const auto& id : state_.encrypted_vaults) {
        auto it = state_.records.find(id);
        if (it == state_.records.end()) {
            continue;
        }
        const VaultEpochRecord& record = it->second;
        if (record.decryption_request && !record.decryption_resolved &&
            !oracle_.is_resolved(*record.decryption_request)) {
            return false;
        }
    }
    return true;
}

void StatesOrchestrator::buffer(EpochState& next) {
    Amount base_total = 0;
    for (const auto& [id, record] : next.records) {
        base_total += record.pit.total_assets_for_deposit + record.total_deposits;
    }
    next.buffer_target = fixed_point::apply_bps(base_total, config_.buffer_ratio_bps());

    if (ledger_.buffer >= next.buffer_target || base_total == 0) {
        return;
    }

    // Shortfall is charged pro rata; rounding leaves the buffer marginally under target.
    const Amount shortfall = next.buffer_target - ledger_.buffer;
    Amount charged = 0;
    for (auto& [id, record] : next.records) {
        const Amount base = record.pit.total_assets_for_deposit + record.total_deposits;
        record.buffer_charge = fixed_point::mul_div(shortfall, base, base_total);
        charged += record.buffer_charge;
    }
    ORION_LOG_INFO("Epoch {} buffer target {} (current {}), charged {} to vaults", next.epoch_counter,
                   next.buffer_target.str(), ledger_.buffer.str(), charged.str());
}

void StatesOrchestrator::postprocess_batch(EpochState& next, VaultTransaction& vaults, bool encrypted) {
    const std::vector<VaultId> ids = encrypted ? next.encrypted_vaults : next.transparent_vaults;
    const auto [first, last] = next_batch(next, ids.size());
    for (std::size_t i = first; i < last; ++i) {
        postprocess_vault(next, vaults.view(ids[i]));
    }
    utils::EpochLogger::log_minibatch_processed(to_string(next.phase), next.epoch_counter, first, last - first);

    if (last < ids.size()) {
        next.cursor = last;
        return;
    }
    advance(next, encrypted ? Phase::BUILDING_ORDERS : Phase::POSTPROCESSING_ENCRYPTED_VAULTS);
}

void StatesOrchestrator::postprocess_vault(EpochState& next, const Vault& vault) {
    VaultEpochRecord& record = next.record(vault.id());

    // Deposits price off the post-redemption value.
    const unsigned offset = vault.decimals_offset();
    for (const auto& [user, assets] : vault.pending_deposits()) {
        const Amount shares = accounting::convert_to_shares(assets, record.pit.total_assets_for_deposit,
                                                            record.pit.supply_for_deposit, offset, Rounding::FLOOR);
        record.minted_shares[user] = shares;
        record.total_minted_shares += shares;
    }
    record.final_total_supply = record.pit.supply_for_deposit + record.total_minted_shares;

    const Amount gross_assets = record.pit.total_assets_for_deposit + record.total_deposits - record.buffer_charge;

    FeeModel model = vault.fee_model_at(next.last_epoch_start);
    fees::FeeSnapshot snapshot;
    snapshot.current_share_price = vault.recorded_share_price();
    snapshot.total_supply = record.final_total_supply;
    snapshot.previous_supply = record.pit.supply_for_redeem;
    record.fees = fees::compute_epoch_fees(gross_assets, model, snapshot, config_.protocol_fee_rates(),
                                           config_.epoch_duration(), config_.risk_free_rate_bps());
    record.final_total_assets = gross_assets - record.fees.total();

    if (record.final_total_supply > 0) {
        model.high_water_mark = fees::updated_high_water_mark(
            model, fees::share_price(record.final_total_assets, record.final_total_supply));
    }
    record.fee_model = model;

    record.target_portfolio = target_portfolio(effective_intent(vault, record.intent), record.final_total_assets,
                                               next.pricing);
    next.pending_book.fold_vault(vault.portfolio(), record.target_portfolio, drain_assets(vault));
}

void StatesOrchestrator::build_orders(EpochState& next) {
    next.orders = next.pending_book.build(
        [this](const AssetId& asset) { return config_.dust_threshold_for(asset); }, next.pricing);
    next.pending_book = OrderBook(config_.underlying_asset());
    if (!next.orders.filtered_assets.empty()) {
        keep_filtered_holdings(next);
    }

    utils::EpochLogger::log_orders_built(next.epoch_counter, next.orders.sells.size(), next.orders.buys.size(),
                                         next.orders.dust_filtered);
    advance(next, Phase::IDLE);
    ++next.epoch_counter;
}

void StatesOrchestrator::keep_filtered_holdings(EpochState& next) {
    const std::vector<VaultId> ids = next.epoch_vaults();
    std::vector<Rebalance> rebalances;
    for (const auto& id : ids) {
        const Vault& vault = vaults_.vault(id);
        Rebalance rebalance;
        rebalance.current = &vault.portfolio();
        rebalance.target = &next.record(id).target_portfolio;
        rebalance.drain_assets = drain_assets(vault);
        rebalances.push_back(std::move(rebalance));
    }
    for (const auto& asset : next.orders.filtered_assets) {
        revert_filtered_delta(asset, rebalances);
    }

    for (std::size_t i = 0; i < rebalances.size(); ++i) {
        if (!rebalances[i].adjusted) {
            continue;
        }
        VaultEpochRecord& record = next.record(ids[i]);
        const Amount excess = settle_underlying(record.target_portfolio, record.final_total_assets, next.pricing);
        if (excess > 0) {
            // Units the vault could not sell stay on its books; the buffer carries the difference.
            record.final_total_assets += excess;
            if (record.final_total_supply > 0) {
                record.fee_model.high_water_mark = fees::updated_high_water_mark(
                    record.fee_model, fees::share_price(record.final_total_assets, record.final_total_supply));
            }
            ORION_LOG_WARN("Vault {} keeps {} of unsold dust beyond its assets", record.vault, excess.str());
        }
    }
    ORION_LOG_DEBUG("Epoch {} kept holdings for {} dust-sized assets", next.epoch_counter,
                    next.orders.filtered_assets.size());
}

void StatesOrchestrator::advance(EpochState& next, Phase to) const {
    const Phase from = next.phase;
    Phase target = to;
    for (const auto* vaults = phase_vaults(next, target); vaults != nullptr && vaults->empty();
         vaults = phase_vaults(next, target)) {
        target = find_transition(Orchestrator::STATES, target)->to;
    }
    next.phase = target;
    next.cursor = 0;
    utils::EpochLogger::log_phase_advanced(to_string(Orchestrator::STATES), next.epoch_counter, to_string(from),
                                           to_string(target));
}

const std::vector<VaultId>* StatesOrchestrator::phase_vaults(const EpochState& state, Phase phase) const {
    switch (phase) {
        case Phase::PREPROCESSING_TRANSPARENT_VAULTS:
        case Phase::POSTPROCESSING_TRANSPARENT_VAULTS:
            return &state.transparent_vaults;
        case Phase::PREPROCESSING_ENCRYPTED_VAULTS:
        case Phase::POSTPROCESSING_ENCRYPTED_VAULTS:
            return &state.encrypted_vaults;
        default:
            return nullptr;
    }
}

std::pair<std::size_t, std::size_t> StatesOrchestrator::next_batch(const EpochState& state,
                                                                   std::size_t total) const {
    const std::size_t first = std::min(state.cursor, total);
    const std::size_t last = std::min(total, first + config_.minibatch_size());
    return {first, last};
}

Intent StatesOrchestrator::effective_intent(const Vault& vault, const Intent& intent) const {
    const AssetId& underlying = config_.underlying_asset();
    if (vault.is_decommissioning() || intent.empty()) {
        return Intent{IntentEntry{underlying, INTENT_SCALE}};
    }

    Intent effective;
    std::uint64_t underlying_weight = 0;
    for (const auto& entry : intent) {
        if (entry.asset == underlying || !config_.is_whitelisted_asset(entry.asset)) {
            underlying_weight += entry.weight;
        } else {
            effective.push_back(entry);
        }
    }
    if (underlying_weight > 0) {
        effective.push_back(IntentEntry{underlying, underlying_weight});
    }
    return effective;
}

std::set<AssetId> StatesOrchestrator::drain_assets(const Vault& vault) const {
    std::set<AssetId> drains;
    for (const auto& [asset, units] : vault.portfolio()) {
        if (vault.is_decommissioning() || !config_.is_whitelisted_asset(asset)) {
            drains.insert(asset);
        }
    }
    return drains;
}

PriceQuote StatesOrchestrator::fetch_quote(const AssetId& asset) {
    PriceQuote quote;
    try {
        quote = prices_.quote(asset);
    } catch (const InvariantViolationError&) {
        throw;
    } catch (const std::exception& e) {
        throw InvariantViolationError("price adapter failed for " + asset + ": " + e.what());
    }
    if (quote.price == 0) {
        throw InvariantViolationError("zero price for " + asset);
    }
    return quote;
}

} // namespace orion
