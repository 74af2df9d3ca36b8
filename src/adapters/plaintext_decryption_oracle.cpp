#include "plaintext_decryption_oracle.hpp"

#include <nlohmann/json.hpp>
#include "core/exceptions.hpp"
#include "utils/logger.hpp"

namespace orion {

static void to_json(nlohmann::json& j, const IntentEntry& entry) {
    j = nlohmann::json{{"asset", entry.asset}, {"weight", entry.weight}};
}

static void from_json(const nlohmann::json& j, IntentEntry& entry) {
    j.at("asset").get_to(entry.asset);
    j.at("weight").get_to(entry.weight);
}

PlaintextDecryptionOracle::PlaintextDecryptionOracle(std::size_t rounds_until_resolved)
    : rounds_until_resolved_(rounds_until_resolved) {
}

std::string PlaintextDecryptionOracle::encode_intent(const Intent& intent) {
    nlohmann::json j = intent;
    return j.dump();
}

std::string PlaintextDecryptionOracle::request_decryption(const VaultId& vault, const std::string& ciphertext) {
    const std::string id = "decrypt-" + std::to_string(next_id_++);
    Request request;
    request.vault = vault;
    request.ciphertext = ciphertext;
    if (rounds_until_resolved_ == 0) {
        request.result = decode_intent(vault, ciphertext);
    }
    requests_[id] = std::move(request);
    return id;
}

bool PlaintextDecryptionOracle::is_resolved(const std::string& request_id) const {
    return find_request(request_id).result.has_value();
}

std::optional<Intent> PlaintextDecryptionOracle::poll(const std::string& request_id) {
    return find_request(request_id).result;
}

void PlaintextDecryptionOracle::advance_round() {
    for (auto& [id, request] : requests_) {
        if (request.result) {
            continue;
        }
        if (++request.rounds >= rounds_until_resolved_) {
            request.result = decode_intent(request.vault, request.ciphertext);
            ORION_LOG_DEBUG("Decryption request {} resolved after {} rounds", id, request.rounds);
        }
    }
}

std::size_t PlaintextDecryptionOracle::pending_requests() const {
    std::size_t pending = 0;
    for (const auto& [id, request] : requests_) {
        if (!request.result) {
            ++pending;
        }
    }
    return pending;
}

const PlaintextDecryptionOracle::Request& PlaintextDecryptionOracle::find_request(const std::string& request_id) const {
    auto it = requests_.find(request_id);
    if (it == requests_.end()) {
        throw ValidationError("unknown decryption request " + request_id);
    }
    return it->second;
}

Intent PlaintextDecryptionOracle::decode_intent(const VaultId& vault, const std::string& ciphertext) {
    try {
        return nlohmann::json::parse(ciphertext).get<Intent>();
    } catch (const nlohmann::json::exception& e) {
        ORION_LOG_WARN("Undecodable intent for {}: {}", vault, e.what());
        return Intent();
    }
}

} // namespace orion
