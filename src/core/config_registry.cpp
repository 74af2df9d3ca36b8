#include "config_registry.hpp"

#include <utility>
#include "exceptions.hpp"
#include "fixed_point.hpp"
#include "utils/logger.hpp"

namespace orion {

ConfigRegistry::ConfigRegistry(Principals principals, AssetId underlying_asset, unsigned underlying_decimals,
                               ProtocolParameters parameters)
    : principals_(std::move(principals)),
      underlying_asset_(std::move(underlying_asset)),
      underlying_decimals_(underlying_decimals),
      parameters_(std::move(parameters)) {
    if (principals_.admin.empty() || principals_.automation_registry.empty()) {
        throw ConfigurationError("admin and automation registry must be set");
    }
    if (underlying_asset_.empty()) {
        throw ConfigurationError("underlying asset must be set");
    }
    if (underlying_decimals_ > SHARE_DECIMALS) {
        throw ConfigurationError("underlying decimals above share decimals");
    }
    try {
        validate_parameters(parameters_);
    } catch (const ValidationError& e) {
        throw ConfigurationError(e.what());
    }

    AssetInfo underlying_info;
    underlying_info.decimals = underlying_decimals_;
    known_assets_[underlying_asset_] = underlying_info;
}

void ConfigRegistry::validate_parameters(const ProtocolParameters& parameters) {
    if (parameters.epoch_duration == 0) {
        throw ValidationError("epoch duration must be positive");
    }
    if (parameters.minibatch_size == 0) {
        throw ValidationError("minibatch size must be at least 1");
    }
    if (parameters.slippage_tolerance_bps > MAX_SLIPPAGE_TOLERANCE_BPS) {
        throw ValidationError("slippage tolerance " + std::to_string(parameters.slippage_tolerance_bps) +
                              " bps exceeds maximum " + std::to_string(MAX_SLIPPAGE_TOLERANCE_BPS));
    }
    if (parameters.buffer_ratio_bps < MIN_BUFFER_RATIO_BPS || parameters.buffer_ratio_bps > MAX_BUFFER_RATIO_BPS) {
        throw ValidationError("buffer ratio " + std::to_string(parameters.buffer_ratio_bps) +
                              " bps outside [1, 500]");
    }
    if (parameters.risk_free_rate_bps > MAX_RISK_FREE_RATE_BPS) {
        throw ValidationError("risk free rate exceeds 100%");
    }
    fees::validate_protocol_fee_rates(parameters.protocol_fees);
}

void ConfigRegistry::set_guardian(const Address& caller, const Address& guardian) {
    require_admin(caller, "set_guardian");
    principals_.guardian = guardian;
    ORION_LOG_INFO("Guardian set to {}", guardian);
}

void ConfigRegistry::set_automation_registry(const Address& caller, const Address& registry) {
    require_admin(caller, "set_automation_registry");
    if (registry.empty()) {
        throw ValidationError("automation registry must not be empty");
    }
    principals_.automation_registry = registry;
    ORION_LOG_INFO("Automation registry set to {}", registry);
}

void ConfigRegistry::add_whitelisted_asset(const Address& caller, const AssetId& asset, const AssetInfo& info) {
    require_admin(caller, "add_whitelisted_asset");
    require_idle("add_whitelisted_asset");
    if (asset.empty() || asset == underlying_asset_) {
        throw ValidationError("cannot whitelist asset '" + asset + "'");
    }
    if (info.decimals > 36) {
        throw ValidationError("asset decimals out of range for " + asset);
    }
    whitelisted_assets_.insert(asset);
    known_assets_[asset] = info;
    ORION_LOG_INFO("Asset {} whitelisted with {} decimals", asset, info.decimals);
}

void ConfigRegistry::remove_whitelisted_asset(const Address& caller, const AssetId& asset) {
    require_admin(caller, "remove_whitelisted_asset");
    require_idle("remove_whitelisted_asset");
    if (whitelisted_assets_.erase(asset) == 0) {
        throw ValidationError("asset " + asset + " is not whitelisted");
    }
    ORION_LOG_WARN("Asset {} removed from whitelist, holdings will be drained", asset);
}

bool ConfigRegistry::is_whitelisted_asset(const AssetId& asset) const {
    return asset == underlying_asset_ || whitelisted_assets_.count(asset) > 0;
}

std::vector<AssetId> ConfigRegistry::whitelisted_assets() const {
    return std::vector<AssetId>(whitelisted_assets_.begin(), whitelisted_assets_.end());
}

bool ConfigRegistry::is_known_asset(const AssetId& asset) const {
    return known_assets_.count(asset) > 0;
}

const AssetInfo& ConfigRegistry::asset_info(const AssetId& asset) const {
    auto it = known_assets_.find(asset);
    if (it == known_assets_.end()) {
        throw InvariantViolationError("unknown asset " + asset);
    }
    return it->second;
}

Amount ConfigRegistry::dust_threshold_for(const AssetId& asset) const {
    const AssetInfo& info = asset_info(asset);
    if (info.dust_threshold) {
        return *info.dust_threshold;
    }
    if (info.decimals >= DUST_THRESHOLD_DECIMALS) {
        return parameters_.dust_threshold * fixed_point::pow10(info.decimals - DUST_THRESHOLD_DECIMALS);
    }
    return parameters_.dust_threshold / fixed_point::pow10(DUST_THRESHOLD_DECIMALS - info.decimals);
}

void ConfigRegistry::add_whitelisted_curator(const Address& caller, const Address& curator) {
    require_admin(caller, "add_whitelisted_curator");
    curators_.insert(curator);
}

void ConfigRegistry::remove_whitelisted_curator(const Address& caller, const Address& curator) {
    require_admin(caller, "remove_whitelisted_curator");
    curators_.erase(curator);
}

bool ConfigRegistry::is_whitelisted_curator(const Address& curator) const {
    return curators_.count(curator) > 0;
}

void ConfigRegistry::add_whitelisted_owner(const Address& caller, const Address& owner) {
    require_admin(caller, "add_whitelisted_owner");
    owners_.insert(owner);
}

void ConfigRegistry::remove_whitelisted_owner(const Address& caller, const Address& owner) {
    require_admin(caller, "remove_whitelisted_owner");
    owners_.erase(owner);
}

bool ConfigRegistry::is_whitelisted_owner(const Address& owner) const {
    return owners_.count(owner) > 0;
}

void ConfigRegistry::update_parameters(const Address& caller, const std::string& operation,
                                       const std::function<void(ProtocolParameters&)>& apply) {
    require_admin(caller, operation);
    require_idle(operation);
    ProtocolParameters updated = parameters_;
    apply(updated);
    validate_parameters(updated);
    parameters_ = std::move(updated);
    ORION_LOG_INFO("Protocol parameters updated by {}", operation);
}

void ConfigRegistry::set_epoch_duration(const Address& caller, std::uint64_t seconds) {
    update_parameters(caller, "set_epoch_duration", [&](ProtocolParameters& p) { p.epoch_duration = seconds; });
}

void ConfigRegistry::set_minibatch_size(const Address& caller, std::size_t size) {
    update_parameters(caller, "set_minibatch_size", [&](ProtocolParameters& p) { p.minibatch_size = size; });
}

void ConfigRegistry::set_slippage_tolerance(const Address& caller, std::uint32_t bps) {
    update_parameters(caller, "set_slippage_tolerance",
                      [&](ProtocolParameters& p) { p.slippage_tolerance_bps = bps; });
}

void ConfigRegistry::set_buffer_ratio(const Address& caller, std::uint32_t bps) {
    update_parameters(caller, "set_buffer_ratio", [&](ProtocolParameters& p) { p.buffer_ratio_bps = bps; });
}

void ConfigRegistry::set_dust_threshold(const Address& caller, const Amount& threshold) {
    update_parameters(caller, "set_dust_threshold", [&](ProtocolParameters& p) { p.dust_threshold = threshold; });
}

void ConfigRegistry::set_risk_free_rate(const Address& caller, std::uint32_t bps) {
    update_parameters(caller, "set_risk_free_rate", [&](ProtocolParameters& p) { p.risk_free_rate_bps = bps; });
}

void ConfigRegistry::set_protocol_fees(const Address& caller, const fees::ProtocolFeeRates& rates) {
    update_parameters(caller, "set_protocol_fees", [&](ProtocolParameters& p) { p.protocol_fees = rates; });
}

void ConfigRegistry::set_min_deposit_amount(const Address& caller, const Amount& amount) {
    update_parameters(caller, "set_min_deposit_amount",
                      [&](ProtocolParameters& p) { p.min_deposit_amount = amount; });
}

void ConfigRegistry::set_min_redeem_amount(const Address& caller, const Amount& amount) {
    update_parameters(caller, "set_min_redeem_amount",
                      [&](ProtocolParameters& p) { p.min_redeem_amount = amount; });
}

void ConfigRegistry::set_fee_change_cooldown(const Address& caller, std::uint64_t seconds) {
    update_parameters(caller, "set_fee_change_cooldown",
                      [&](ProtocolParameters& p) { p.fee_change_cooldown = seconds; });
}

void ConfigRegistry::pause_all(const Address& caller) {
    if (caller != principals_.admin && (principals_.guardian.empty() || caller != principals_.guardian)) {
        throw NotAuthorizedError(caller + " may not pause the protocol");
    }
    paused_ = true;
    ORION_LOG_WARN("Protocol paused by {}", caller);
}

void ConfigRegistry::unpause_all(const Address& caller) {
    require_admin(caller, "unpause_all");
    paused_ = false;
    ORION_LOG_INFO("Protocol unpaused by {}", caller);
}

void ConfigRegistry::set_idle_probe(std::function<bool()> probe) {
    idle_probe_ = std::move(probe);
}

bool ConfigRegistry::is_system_idle() const {
    return !idle_probe_ || idle_probe_();
}

void ConfigRegistry::require_admin(const Address& caller, const std::string& operation) const {
    if (caller != principals_.admin) {
        throw NotAuthorizedError(caller + " may not call " + operation);
    }
}

void ConfigRegistry::require_idle(const std::string& operation) const {
    if (!is_system_idle()) {
        throw SystemNotIdleError(operation + " while an epoch is in flight");
    }
}

void ConfigRegistry::require_not_paused(const std::string& operation) const {
    if (paused_) {
        throw ProtocolPausedError(operation + " while the protocol is paused");
    }
}

} // namespace orion
