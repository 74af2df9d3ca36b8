#pragma once

#include <map>
#include <string>
#include <vector>
#include "types.hpp"
#include "vault.hpp"

namespace orion {

class ConfigRegistry;

struct VaultConfig {
    VaultId id;
    VaultType type = VaultType::TRANSPARENT;
    Address curator;
    FeeModel fee_model;
};

class VaultRegistry {
public:
    explicit VaultRegistry(const ConfigRegistry& config);

    Vault& create_vault(const Address& caller, const VaultConfig& vault_config);
    void decommission_vault(const Address& caller, const VaultId& id);

    bool contains(const VaultId& id) const;
    Vault& vault(const VaultId& id);
    const Vault& vault(const VaultId& id) const;
    std::size_t size() const { return vaults_.size(); }

    // Vaults of one type in creation order; decommissioned vaults only when asked for.
    std::vector<VaultId> vault_ids(VaultType type, bool include_decommissioned = false) const;
    std::vector<VaultId> all_vault_ids() const { return creation_order_; }

private:
    friend class VaultTransaction;

    const ConfigRegistry& config_;
    std::map<VaultId, Vault> vaults_;
    std::vector<VaultId> creation_order_;
};

// Copy-on-write view of the registry; nothing reaches the registry until commit().
class VaultTransaction {
public:
    explicit VaultTransaction(VaultRegistry& registry);

    Vault& edit(const VaultId& id);
    const Vault& view(const VaultId& id) const;
    void commit();

private:
    VaultRegistry& registry_;
    std::map<VaultId, Vault> edits_;
};

} // namespace orion
