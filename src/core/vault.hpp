#pragma once

#include <map>
#include <optional>
#include <string>
#include "types.hpp"

namespace orion {

class ConfigRegistry;

/**
 * One vault: identity, intent, recorded portfolio, share ledger and request queues.
 *
 * Users and curators act through the request methods, which are only open while the
 * system is idle and not paused. total_assets and total_supply change only through the
 * settlement methods driven by the orchestrators.
 */
class Vault {
public:
    Vault(VaultId id, VaultType type, Address owner, Address curator, FeeModel fee_model,
          const ConfigRegistry* config);

    // Identity
    const VaultId& id() const { return id_; }
    VaultType type() const { return type_; }
    const Address& owner() const { return owner_; }
    const Address& curator() const { return curator_; }
    VaultStatus status() const { return status_; }
    bool is_decommissioning() const { return status_ == VaultStatus::DECOMMISSIONING; }
    bool is_decommissioned() const { return status_ == VaultStatus::DECOMMISSIONED; }

    // Depositor requests
    void request_deposit(const Address& user, const Amount& assets);
    void request_redeem(const Address& user, const Amount& shares);
    void cancel_deposit_request(const Address& user, const Amount& assets);
    void cancel_redeem_request(const Address& user, const Amount& shares);
    Amount claim_redemption(const Address& user);
    Amount redeem_decommissioned(const Address& user, const Amount& shares);

    // Curator and owner actions
    void submit_intent(const Address& caller, const Intent& intent);
    void submit_encrypted_intent(const Address& caller, const std::string& ciphertext);
    void update_fee_model(const Address& caller, const FeeModel& model, Timestamp now);

    static void validate_intent(const Intent& intent, const ConfigRegistry& config);

    // Views
    const Intent& intent() const { return intent_; }
    const std::optional<std::string>& encrypted_intent() const { return encrypted_intent_; }
    const Portfolio& portfolio() const { return portfolio_; }
    const Amount& total_assets() const { return total_assets_; }
    const Amount& total_supply() const { return total_supply_; }
    Amount recorded_share_price() const;
    const FeeModel& fee_model() const { return fee_model_; }
    FeeModel fee_model_at(Timestamp now) const;
    Amount share_balance(const Address& user) const;
    Amount pending_deposit(const Address& user) const;
    Amount pending_redeem(const Address& user) const;
    Amount claimable_redemption(const Address& user) const;
    const std::map<Address, Amount>& pending_deposits() const { return pending_deposits_; }
    const std::map<Address, Amount>& pending_redeems() const { return pending_redeems_; }
    Amount total_pending_deposits() const;
    Amount total_pending_redeems() const;
    const Amount& underlying_balance() const { return underlying_balance_; }
    unsigned decimals_offset() const;

    // Previews at the recorded totals
    Amount convert_to_assets(const Amount& shares) const;
    Amount convert_to_shares(const Amount& assets) const;

    // Settlement, driven by the orchestrators
    bool apply_decrypted_intent(const Intent& intent);
    std::optional<std::string> take_encrypted_intent();
    void settle_redemptions(const std::map<Address, Amount>& payouts, const Amount& remaining_assets);
    Amount collect_deposit_escrow();
    void settle_deposits(const std::map<Address, Amount>& minted_shares);
    void record_epoch_result(const Amount& total_assets, const Portfolio& portfolio);
    void apply_fee_model(const FeeModel& model, Timestamp as_of);
    void receive_redemption_funds(const Amount& amount);
    void begin_decommissioning();
    void complete_decommissioning(const Amount& underlying);

private:
    struct PendingFeeModel {
        FeeModel model;
        Timestamp effective_at = 0;
    };

    void require_request_window(const std::string& operation) const;

    VaultId id_;
    VaultType type_;
    Address owner_;
    Address curator_;
    VaultStatus status_ = VaultStatus::ACTIVE;

    FeeModel fee_model_;
    std::optional<PendingFeeModel> pending_fee_model_;

    Intent intent_;
    std::optional<std::string> encrypted_intent_;
    Portfolio portfolio_;

    Amount total_assets_ = 0;
    Amount total_supply_ = 0;
    std::map<Address, Amount> share_balances_;
    std::map<Address, Amount> pending_deposits_;
    std::map<Address, Amount> pending_redeems_;
    std::map<Address, Amount> claimable_redemptions_;

    // Underlying held by the vault itself: deposit escrow, settled redemptions, decommissioned funds.
    Amount underlying_balance_ = 0;

    const ConfigRegistry* config_;
};

} // namespace orion
