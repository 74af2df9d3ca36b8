#include "vault.hpp"

#include <set>
#include <utility>
#include "config_registry.hpp"
#include "exceptions.hpp"
#include "fee_engine.hpp"
#include "vault_accounting.hpp"
#include "utils/logger.hpp"

namespace orion {

namespace {

Amount lookup(const std::map<Address, Amount>& balances, const Address& user) {
    auto it = balances.find(user);
    return it == balances.end() ? Amount(0) : it->second;
}

Amount sum(const std::map<Address, Amount>& balances) {
    Amount total = 0;
    for (const auto& [user, amount] : balances) {
        total += amount;
    }
    return total;
}

void debit(std::map<Address, Amount>& balances, const Address& user, const Amount& amount) {
    auto it = balances.find(user);
    if (it == balances.end() || it->second < amount) {
        throw ValidationError("amount exceeds balance of " + user);
    }
    it->second -= amount;
    if (it->second == 0) {
        balances.erase(it);
    }
}

} // namespace

Vault::Vault(VaultId id, VaultType type, Address owner, Address curator, FeeModel fee_model,
             const ConfigRegistry* config)
    : id_(std::move(id)),
      type_(type),
      owner_(std::move(owner)),
      curator_(std::move(curator)),
      fee_model_(std::move(fee_model)),
      config_(config) {
    if (config_ == nullptr) {
        throw ConfigurationError("vault " + id_ + " created without a config registry");
    }
}

void Vault::require_request_window(const std::string& operation) const {
    config_->require_not_paused(operation);
    config_->require_idle(operation);
}

void Vault::request_deposit(const Address& user, const Amount& assets) {
    require_request_window("request_deposit");
    if (status_ != VaultStatus::ACTIVE) {
        throw InvalidStateError("vault " + id_ + " is " + to_string(status_) + " and takes no deposits");
    }
    if (assets == 0) {
        throw ValidationError("deposit amount must be positive");
    }
    if (assets < config_->min_deposit_amount()) {
        throw ValidationError("deposit below minimum of " + config_->min_deposit_amount().str());
    }
    pending_deposits_[user] += assets;
    underlying_balance_ += assets;
    ORION_LOG_DEBUG("Deposit request of {} from {} on {}", assets.str(), user, id_);
}

void Vault::request_redeem(const Address& user, const Amount& shares) {
    require_request_window("request_redeem");
    if (status_ == VaultStatus::DECOMMISSIONED) {
        throw InvalidStateError("vault " + id_ + " is decommissioned, redeem synchronously");
    }
    if (shares == 0) {
        throw ValidationError("redeem amount must be positive");
    }
    if (shares < config_->min_redeem_amount()) {
        throw ValidationError("redeem below minimum of " + config_->min_redeem_amount().str());
    }
    debit(share_balances_, user, shares);
    pending_redeems_[user] += shares;
    ORION_LOG_DEBUG("Redeem request of {} shares from {} on {}", shares.str(), user, id_);
}

void Vault::cancel_deposit_request(const Address& user, const Amount& assets) {
    require_request_window("cancel_deposit_request");
    if (assets == 0) {
        throw ValidationError("cancel amount must be positive");
    }
    debit(pending_deposits_, user, assets);
    underlying_balance_ -= assets;
}

void Vault::cancel_redeem_request(const Address& user, const Amount& shares) {
    require_request_window("cancel_redeem_request");
    if (shares == 0) {
        throw ValidationError("cancel amount must be positive");
    }
    debit(pending_redeems_, user, shares);
    share_balances_[user] += shares;
}

Amount Vault::claim_redemption(const Address& user) {
    require_request_window("claim_redemption");
    const Amount amount = lookup(claimable_redemptions_, user);
    if (amount == 0) {
        throw ValidationError("nothing to claim for " + user);
    }
    claimable_redemptions_.erase(user);
    underlying_balance_ -= amount;
    return amount;
}

Amount Vault::redeem_decommissioned(const Address& user, const Amount& shares) {
    config_->require_not_paused("redeem_decommissioned");
    if (status_ != VaultStatus::DECOMMISSIONED) {
        throw InvalidStateError("vault " + id_ + " is not decommissioned");
    }
    if (shares == 0) {
        throw ValidationError("redeem amount must be positive");
    }
    const Amount payout = accounting::redemption_payout(shares, total_assets_, total_supply_);
    debit(share_balances_, user, shares);
    total_supply_ -= shares;
    total_assets_ -= payout;
    underlying_balance_ -= payout;
    return payout;
}

void Vault::submit_intent(const Address& caller, const Intent& intent) {
    config_->require_not_paused("submit_intent");
    if (caller != curator_) {
        throw NotAuthorizedError(caller + " is not the curator of " + id_);
    }
    if (type_ != VaultType::TRANSPARENT) {
        throw InvalidStateError("vault " + id_ + " takes encrypted intents only");
    }
    validate_intent(intent, *config_);
    intent_ = intent;
    ORION_LOG_INFO("Intent with {} assets submitted for {}", intent.size(), id_);
}

void Vault::submit_encrypted_intent(const Address& caller, const std::string& ciphertext) {
    config_->require_not_paused("submit_encrypted_intent");
    if (caller != curator_) {
        throw NotAuthorizedError(caller + " is not the curator of " + id_);
    }
    if (type_ != VaultType::ENCRYPTED) {
        throw InvalidStateError("vault " + id_ + " takes plaintext intents only");
    }
    if (ciphertext.empty()) {
        throw ValidationError("empty ciphertext");
    }
    encrypted_intent_ = ciphertext;
}

void Vault::update_fee_model(const Address& caller, const FeeModel& model, Timestamp now) {
    config_->require_not_paused("update_fee_model");
    if (caller != owner_) {
        throw NotAuthorizedError(caller + " is not the owner of " + id_);
    }
    fees::validate_fee_model(model);

    PendingFeeModel pending;
    pending.model = model;
    pending.model.high_water_mark = fee_model_.high_water_mark;
    pending.effective_at = now + config_->fee_change_cooldown();
    pending_fee_model_ = pending;
    ORION_LOG_INFO("Fee model of {} changes to {} at {}", id_, to_string(model.type), pending.effective_at);
}

void Vault::validate_intent(const Intent& intent, const ConfigRegistry& config) {
    if (intent.empty()) {
        throw InvariantViolationError("intent is empty");
    }
    std::set<AssetId> seen;
    std::uint64_t total = 0;
    for (const auto& entry : intent) {
        if (entry.weight == 0) {
            throw InvariantViolationError("zero weight for " + entry.asset);
        }
        if (entry.weight > INTENT_SCALE) {
            throw InvariantViolationError("weight for " + entry.asset + " exceeds intent scale");
        }
        if (!seen.insert(entry.asset).second) {
            throw InvariantViolationError("duplicate asset " + entry.asset + " in intent");
        }
        if (!config.is_whitelisted_asset(entry.asset)) {
            throw InvariantViolationError("asset " + entry.asset + " is not whitelisted");
        }
        total += entry.weight;
        if (total > INTENT_SCALE) {
            throw InvariantViolationError("intent weights exceed " + std::to_string(INTENT_SCALE));
        }
    }
    if (total != INTENT_SCALE) {
        throw InvariantViolationError("intent weights sum to " + std::to_string(total) + ", expected " +
                                      std::to_string(INTENT_SCALE));
    }
}

Amount Vault::recorded_share_price() const {
    return fees::share_price(total_assets_, total_supply_);
}

FeeModel Vault::fee_model_at(Timestamp now) const {
    if (pending_fee_model_ && now >= pending_fee_model_->effective_at) {
        FeeModel model = pending_fee_model_->model;
        model.high_water_mark = fee_model_.high_water_mark;
        return model;
    }
    return fee_model_;
}

Amount Vault::share_balance(const Address& user) const {
    return lookup(share_balances_, user);
}

Amount Vault::pending_deposit(const Address& user) const {
    return lookup(pending_deposits_, user);
}

Amount Vault::pending_redeem(const Address& user) const {
    return lookup(pending_redeems_, user);
}

Amount Vault::claimable_redemption(const Address& user) const {
    return lookup(claimable_redemptions_, user);
}

Amount Vault::total_pending_deposits() const {
    return sum(pending_deposits_);
}

Amount Vault::total_pending_redeems() const {
    return sum(pending_redeems_);
}

unsigned Vault::decimals_offset() const {
    return accounting::decimals_offset(SHARE_DECIMALS, config_->underlying_decimals());
}

Amount Vault::convert_to_assets(const Amount& shares) const {
    return accounting::convert_to_assets(shares, total_assets_, total_supply_, decimals_offset());
}

Amount Vault::convert_to_shares(const Amount& assets) const {
    return accounting::convert_to_shares(assets, total_assets_, total_supply_, decimals_offset());
}

bool Vault::apply_decrypted_intent(const Intent& intent) {
    try {
        validate_intent(intent, *config_);
    } catch (const InvariantViolationError& e) {
        ORION_LOG_WARN("Discarding decrypted intent for {}: {}", id_, e.what());
        return false;
    }
    intent_ = intent;
    return true;
}

std::optional<std::string> Vault::take_encrypted_intent() {
    std::optional<std::string> ciphertext;
    ciphertext.swap(encrypted_intent_);
    return ciphertext;
}

void Vault::settle_redemptions(const std::map<Address, Amount>& payouts, const Amount& remaining_assets) {
    total_supply_ -= total_pending_redeems();
    for (const auto& [user, assets] : payouts) {
        if (assets > 0) {
            claimable_redemptions_[user] += assets;
        }
    }
    pending_redeems_.clear();
    total_assets_ = remaining_assets;
}

Amount Vault::collect_deposit_escrow() {
    const Amount escrow = total_pending_deposits();
    underlying_balance_ -= escrow;
    return escrow;
}

void Vault::settle_deposits(const std::map<Address, Amount>& minted_shares) {
    for (const auto& [user, shares] : minted_shares) {
        if (shares > 0) {
            share_balances_[user] += shares;
            total_supply_ += shares;
        }
    }
    pending_deposits_.clear();
}

void Vault::record_epoch_result(const Amount& total_assets, const Portfolio& portfolio) {
    total_assets_ = total_assets;
    portfolio_ = portfolio;
}

void Vault::apply_fee_model(const FeeModel& model, Timestamp as_of) {
    if (pending_fee_model_ && pending_fee_model_->effective_at <= as_of) {
        pending_fee_model_.reset();
    }
    fee_model_ = model;
}

void Vault::receive_redemption_funds(const Amount& amount) {
    underlying_balance_ += amount;
}

void Vault::begin_decommissioning() {
    if (status_ != VaultStatus::ACTIVE) {
        throw InvalidStateError("vault " + id_ + " is already " + to_string(status_));
    }
    status_ = VaultStatus::DECOMMISSIONING;
}

void Vault::complete_decommissioning(const Amount& underlying) {
    if (status_ != VaultStatus::DECOMMISSIONING) {
        throw InvalidStateError("vault " + id_ + " is not decommissioning");
    }
    status_ = VaultStatus::DECOMMISSIONED;
    portfolio_.clear();
    underlying_balance_ += underlying;
}

} // namespace orion
