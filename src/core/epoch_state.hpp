#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "fee_engine.hpp"
#include "order_book.hpp"
#include "types.hpp"
#include "vault_accounting.hpp"

namespace orion {

// One phase sequence shared by both orchestrators.
enum class Phase {
    IDLE,
    PREPROCESSING_TRANSPARENT_VAULTS,
    PREPROCESSING_ENCRYPTED_VAULTS,
    BUFFERING,
    POSTPROCESSING_TRANSPARENT_VAULTS,
    POSTPROCESSING_ENCRYPTED_VAULTS,
    BUILDING_ORDERS,
    REDEEMING,
    SELLING,
    BUYING,
    DEPOSITING
};

enum class Action {
    START_EPOCH,
    PREPROCESS_TRANSPARENT,
    PREPROCESS_ENCRYPTED,
    BUFFER,
    POSTPROCESS_TRANSPARENT,
    POSTPROCESS_ENCRYPTED,
    BUILD_ORDERS,
    START_LIQUIDITY,
    REDEEM,
    SELL,
    BUY,
    DEPOSIT
};

enum class Orchestrator {
    STATES,
    LIQUIDITY
};

std::string to_string(Phase phase);
std::string to_string(Action action);
std::string to_string(Orchestrator orchestrator);
std::optional<Action> action_from_string(const std::string& name);

struct Transition {
    Orchestrator owner;
    Phase from;
    Action action;
    Phase to;
};

// Every legal (phase, action) pair and the phase it nominally leads to.
const std::vector<Transition>& transition_table();

std::optional<Transition> find_transition(Orchestrator owner, Phase from);
bool is_owned_by(Orchestrator owner, Phase phase);

// Opaque keeper data: which action, for which epoch, at which minibatch cursor.
struct UpkeepPayload {
    Action action = Action::START_EPOCH;
    std::uint64_t epoch = 0;
    std::uint64_t minibatch = 0;
};

std::vector<std::uint8_t> encode_payload(const UpkeepPayload& payload);
UpkeepPayload decode_payload(const std::vector<std::uint8_t>& bytes);

struct UpkeepCheck {
    bool needed = false;
    std::vector<std::uint8_t> payload;
};

// Everything the states side computed for one vault, consumed by the liquidity side.
struct VaultEpochRecord {
    VaultId vault;
    accounting::PitSnapshot pit;
    Intent intent;

    std::map<Address, Amount> redemption_payouts;
    Amount total_redeemed_shares = 0;
    Amount total_redemption_payout = 0;

    Amount total_deposits = 0;
    std::map<Address, Amount> minted_shares;
    Amount total_minted_shares = 0;

    Amount buffer_charge = 0;
    fees::EpochFees fees;
    FeeModel fee_model;  // model in effect this epoch, high-water mark already updated
    Amount final_total_assets = 0;
    Amount final_total_supply = 0;
    Portfolio target_portfolio;

    std::optional<std::string> decryption_request;
    bool decryption_resolved = false;
};

/**
 * The single owned epoch record. Orchestrators copy it at the start of a step and
 * assign the copy back only when the step succeeded.
 */
struct EpochState {
    std::uint64_t epoch_counter = 0;
    std::uint64_t last_processed_epoch = 0;
    Phase phase = Phase::IDLE;
    std::size_t cursor = 0;
    Timestamp last_epoch_start = 0;

    std::vector<VaultId> transparent_vaults;
    std::vector<VaultId> encrypted_vaults;
    accounting::PricingContext pricing;
    std::map<VaultId, VaultEpochRecord> records;
    Amount buffer_target = 0;

    OrderBook pending_book;
    NettedOrders orders;

    bool is_system_idle() const { return phase == Phase::IDLE && last_processed_epoch == epoch_counter; }
    std::vector<VaultId> epoch_vaults() const;
    VaultEpochRecord& record(const VaultId& vault);
    const VaultEpochRecord& record(const VaultId& vault) const;
};

} // namespace orion
