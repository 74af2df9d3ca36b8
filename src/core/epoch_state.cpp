#include "epoch_state.hpp"

#include <nlohmann/json.hpp>
#include "exceptions.hpp"

namespace orion {

std::string to_string(Phase phase) {
    switch (phase) {
        case Phase::IDLE: return "Idle";
        case Phase::PREPROCESSING_TRANSPARENT_VAULTS: return "PreprocessingTransparentVaults";
        case Phase::PREPROCESSING_ENCRYPTED_VAULTS: return "PreprocessingEncryptedVaults";
        case Phase::BUFFERING: return "Buffering";
        case Phase::POSTPROCESSING_TRANSPARENT_VAULTS: return "PostprocessingTransparentVaults";
        case Phase::POSTPROCESSING_ENCRYPTED_VAULTS: return "PostprocessingEncryptedVaults";
        case Phase::BUILDING_ORDERS: return "BuildingOrders";
        case Phase::REDEEMING: return "Redeeming";
        case Phase::SELLING: return "Selling";
        case Phase::BUYING: return "Buying";
        case Phase::DEPOSITING: return "Depositing";
    }
    return "Unknown";
}

std::string to_string(Action action) {
    switch (action) {
        case Action::START_EPOCH: return "START_EPOCH";
        case Action::PREPROCESS_TRANSPARENT: return "PREPROCESS_TRANSPARENT";
        case Action::PREPROCESS_ENCRYPTED: return "PREPROCESS_ENCRYPTED";
        case Action::BUFFER: return "BUFFER";
        case Action::POSTPROCESS_TRANSPARENT: return "POSTPROCESS_TRANSPARENT";
        case Action::POSTPROCESS_ENCRYPTED: return "POSTPROCESS_ENCRYPTED";
        case Action::BUILD_ORDERS: return "BUILD_ORDERS";
        case Action::START_LIQUIDITY: return "START_LIQUIDITY";
        case Action::REDEEM: return "REDEEM";
        case Action::SELL: return "SELL";
        case Action::BUY: return "BUY";
        case Action::DEPOSIT: return "DEPOSIT";
    }
    return "UNKNOWN";
}

std::string to_string(Orchestrator orchestrator) {
    return orchestrator == Orchestrator::STATES ? "states" : "liquidity";
}

std::optional<Action> action_from_string(const std::string& name) {
    static const std::map<std::string, Action> actions = {
        {"START_EPOCH", Action::START_EPOCH},
        {"PREPROCESS_TRANSPARENT", Action::PREPROCESS_TRANSPARENT},
        {"PREPROCESS_ENCRYPTED", Action::PREPROCESS_ENCRYPTED},
        {"BUFFER", Action::BUFFER},
        {"POSTPROCESS_TRANSPARENT", Action::POSTPROCESS_TRANSPARENT},
        {"POSTPROCESS_ENCRYPTED", Action::POSTPROCESS_ENCRYPTED},
        {"BUILD_ORDERS", Action::BUILD_ORDERS},
        {"START_LIQUIDITY", Action::START_LIQUIDITY},
        {"REDEEM", Action::REDEEM},
        {"SELL", Action::SELL},
        {"BUY", Action::BUY},
        {"DEPOSIT", Action::DEPOSIT},
    };
    auto it = actions.find(name);
    if (it == actions.end()) {
        return std::nullopt;
    }
    return it->second;
}

const std::vector<Transition>& transition_table() {
    static const std::vector<Transition> table = {
        {Orchestrator::STATES, Phase::IDLE, Action::START_EPOCH, Phase::PREPROCESSING_TRANSPARENT_VAULTS},
        {Orchestrator::STATES, Phase::PREPROCESSING_TRANSPARENT_VAULTS, Action::PREPROCESS_TRANSPARENT,
         Phase::PREPROCESSING_ENCRYPTED_VAULTS},
        {Orchestrator::STATES, Phase::PREPROCESSING_ENCRYPTED_VAULTS, Action::PREPROCESS_ENCRYPTED, Phase::BUFFERING},
        {Orchestrator::STATES, Phase::BUFFERING, Action::BUFFER, Phase::POSTPROCESSING_TRANSPARENT_VAULTS},
        {Orchestrator::STATES, Phase::POSTPROCESSING_TRANSPARENT_VAULTS, Action::POSTPROCESS_TRANSPARENT,
         Phase::POSTPROCESSING_ENCRYPTED_VAULTS},
        {Orchestrator::STATES, Phase::POSTPROCESSING_ENCRYPTED_VAULTS, Action::POSTPROCESS_ENCRYPTED,
         Phase::BUILDING_ORDERS},
        {Orchestrator::STATES, Phase::BUILDING_ORDERS, Action::BUILD_ORDERS, Phase::IDLE},
        {Orchestrator::LIQUIDITY, Phase::IDLE, Action::START_LIQUIDITY, Phase::REDEEMING},
        {Orchestrator::LIQUIDITY, Phase::REDEEMING, Action::REDEEM, Phase::SELLING},
        {Orchestrator::LIQUIDITY, Phase::SELLING, Action::SELL, Phase::BUYING},
        {Orchestrator::LIQUIDITY, Phase::BUYING, Action::BUY, Phase::DEPOSITING},
        {Orchestrator::LIQUIDITY, Phase::DEPOSITING, Action::DEPOSIT, Phase::IDLE},
    };
    return table;
}

std::optional<Transition> find_transition(Orchestrator owner, Phase from) {
    for (const auto& transition : transition_table()) {
        if (transition.owner == owner && transition.from == from) {
            return transition;
        }
    }
    return std::nullopt;
}

bool is_owned_by(Orchestrator owner, Phase phase) {
    return phase != Phase::IDLE && find_transition(owner, phase).has_value();
}

std::vector<std::uint8_t> encode_payload(const UpkeepPayload& payload) {
    nlohmann::json j = {
        {"action", to_string(payload.action)},
        {"epoch", payload.epoch},
        {"minibatch", payload.minibatch},
    };
    return nlohmann::json::to_cbor(j);
}

UpkeepPayload decode_payload(const std::vector<std::uint8_t>& bytes) {
    try {
        const nlohmann::json j = nlohmann::json::from_cbor(bytes);
        const auto action = action_from_string(j.at("action").get<std::string>());
        if (!action) {
            throw ValidationError("unknown upkeep action " + j.at("action").dump());
        }
        UpkeepPayload payload;
        payload.action = *action;
        payload.epoch = j.at("epoch").get<std::uint64_t>();
        payload.minibatch = j.at("minibatch").get<std::uint64_t>();
        return payload;
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError(std::string("malformed upkeep payload: ") + e.what());
    }
}

std::vector<VaultId> EpochState::epoch_vaults() const {
    std::vector<VaultId> vaults = transparent_vaults;
    vaults.insert(vaults.end(), encrypted_vaults.begin(), encrypted_vaults.end());
    return vaults;
}

VaultEpochRecord& EpochState::record(const VaultId& vault) {
    auto it = records.find(vault);
    if (it == records.end()) {
        throw InvariantViolationError("no epoch record for vault " + vault);
    }
    return it->second;
}

const VaultEpochRecord& EpochState::record(const VaultId& vault) const {
    auto it = records.find(vault);
    if (it == records.end()) {
        throw InvariantViolationError("no epoch record for vault " + vault);
    }
    return it->second;
}

} // namespace orion
