#include "vault_registry.hpp"

#include "config_registry.hpp"
#include "exceptions.hpp"
#include "fee_engine.hpp"
#include "utils/logger.hpp"

namespace orion {

VaultRegistry::VaultRegistry(const ConfigRegistry& config) : config_(config) {
}

Vault& VaultRegistry::create_vault(const Address& caller, const VaultConfig& vault_config) {
    config_.require_not_paused("create_vault");
    if (!config_.is_whitelisted_owner(caller)) {
        throw NotAuthorizedError(caller + " is not a whitelisted vault owner");
    }
    if (!config_.is_whitelisted_curator(vault_config.curator)) {
        throw NotAuthorizedError(vault_config.curator + " is not a whitelisted curator");
    }
    if (vault_config.id.empty()) {
        throw ValidationError("vault id must not be empty");
    }
    if (vaults_.count(vault_config.id) > 0) {
        throw ValidationError("vault " + vault_config.id + " already exists");
    }
    fees::validate_fee_model(vault_config.fee_model);

    FeeModel fee_model = vault_config.fee_model;
    fee_model.high_water_mark = 0;

    auto [it, inserted] = vaults_.emplace(
        vault_config.id, Vault(vault_config.id, vault_config.type, caller, vault_config.curator, fee_model, &config_));
    creation_order_.push_back(vault_config.id);

    ORION_LOG_INFO("Vault {} created ({}, curator {}, fee model {})", vault_config.id,
                   to_string(vault_config.type), vault_config.curator, to_string(fee_model.type));
    return it->second;
}

void VaultRegistry::decommission_vault(const Address& caller, const VaultId& id) {
    config_.require_admin(caller, "decommission_vault");
    config_.require_idle("decommission_vault");
    vault(id).begin_decommissioning();
    ORION_LOG_WARN("Vault {} is decommissioning", id);
}

bool VaultRegistry::contains(const VaultId& id) const {
    return vaults_.count(id) > 0;
}

Vault& VaultRegistry::vault(const VaultId& id) {
    auto it = vaults_.find(id);
    if (it == vaults_.end()) {
        throw ValidationError("unknown vault " + id);
    }
    return it->second;
}

const Vault& VaultRegistry::vault(const VaultId& id) const {
    auto it = vaults_.find(id);
    if (it == vaults_.end()) {
        throw ValidationError("unknown vault " + id);
    }
    return it->second;
}

std::vector<VaultId> VaultRegistry::vault_ids(VaultType type, bool include_decommissioned) const {
    std::vector<VaultId> ids;
    for (const auto& id : creation_order_) {
        const Vault& v = vaults_.at(id);
        if (v.type() == type && (include_decommissioned || !v.is_decommissioned())) {
            ids.push_back(id);
        }
    }
    return ids;
}

VaultTransaction::VaultTransaction(VaultRegistry& registry) : registry_(registry) {
}

Vault& VaultTransaction::edit(const VaultId& id) {
    auto it = edits_.find(id);
    if (it != edits_.end()) {
        return it->second;
    }
    return edits_.emplace(id, registry_.vault(id)).first->second;
}

const Vault& VaultTransaction::view(const VaultId& id) const {
    auto it = edits_.find(id);
    if (it != edits_.end()) {
        return it->second;
    }
    return registry_.vault(id);
}

void VaultTransaction::commit() {
    for (auto& [id, edited] : edits_) {
        registry_.vaults_.at(id) = std::move(edited);
    }
    edits_.clear();
}

} // namespace orion
