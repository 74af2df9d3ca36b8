#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>
#include "fee_engine.hpp"
#include "types.hpp"

namespace orion {

constexpr std::uint32_t MAX_SLIPPAGE_TOLERANCE_BPS = 2000;
constexpr std::uint32_t MIN_BUFFER_RATIO_BPS = 1;
constexpr std::uint32_t MAX_BUFFER_RATIO_BPS = 500;
constexpr std::uint32_t MAX_RISK_FREE_RATE_BPS = 10000;
constexpr unsigned DUST_THRESHOLD_DECIMALS = 18;

struct Principals {
    Address admin;
    Address guardian;
    Address automation_registry;
};

struct ProtocolParameters {
    std::uint64_t epoch_duration = 24 * 60 * 60;
    std::size_t minibatch_size = 8;
    std::uint32_t slippage_tolerance_bps = 200;
    std::uint32_t buffer_ratio_bps = 100;
    Amount dust_threshold = Amount("10000000000000000");  // 10^16 at 18 decimals
    std::uint32_t risk_free_rate_bps = 0;
    fees::ProtocolFeeRates protocol_fees;
    Amount min_deposit_amount = 0;
    Amount min_redeem_amount = 0;
    std::uint64_t fee_change_cooldown = 7 * 24 * 60 * 60;
};

/**
 * Protocol-wide configuration: principals, whitelists and bounded parameters.
 *
 * Every setter requires the admin and is rejected while an epoch is in flight.
 * Metadata of a de-whitelisted asset stays known so vaults still holding it can be priced.
 */
class ConfigRegistry {
public:
    ConfigRegistry(Principals principals, AssetId underlying_asset, unsigned underlying_decimals,
                   ProtocolParameters parameters = ProtocolParameters());

    static void validate_parameters(const ProtocolParameters& parameters);

    // Principals
    const Address& admin() const { return principals_.admin; }
    const Address& guardian() const { return principals_.guardian; }
    const Address& automation_registry() const { return principals_.automation_registry; }
    void set_guardian(const Address& caller, const Address& guardian);
    void set_automation_registry(const Address& caller, const Address& registry);

    // Assets
    const AssetId& underlying_asset() const { return underlying_asset_; }
    unsigned underlying_decimals() const { return underlying_decimals_; }
    void add_whitelisted_asset(const Address& caller, const AssetId& asset, const AssetInfo& info);
    void remove_whitelisted_asset(const Address& caller, const AssetId& asset);
    bool is_whitelisted_asset(const AssetId& asset) const;
    std::vector<AssetId> whitelisted_assets() const;
    bool is_known_asset(const AssetId& asset) const;
    const AssetInfo& asset_info(const AssetId& asset) const;
    const std::map<AssetId, AssetInfo>& known_assets() const { return known_assets_; }

    // Minimum order size for an asset, in its own smallest units.
    Amount dust_threshold_for(const AssetId& asset) const;

    // Curators and vault owners
    void add_whitelisted_curator(const Address& caller, const Address& curator);
    void remove_whitelisted_curator(const Address& caller, const Address& curator);
    bool is_whitelisted_curator(const Address& curator) const;
    void add_whitelisted_owner(const Address& caller, const Address& owner);
    void remove_whitelisted_owner(const Address& caller, const Address& owner);
    bool is_whitelisted_owner(const Address& owner) const;

    // Parameters
    const ProtocolParameters& parameters() const { return parameters_; }
    std::uint64_t epoch_duration() const { return parameters_.epoch_duration; }
    std::size_t minibatch_size() const { return parameters_.minibatch_size; }
    std::uint32_t slippage_tolerance_bps() const { return parameters_.slippage_tolerance_bps; }
    std::uint32_t buffer_ratio_bps() const { return parameters_.buffer_ratio_bps; }
    const Amount& dust_threshold() const { return parameters_.dust_threshold; }
    std::uint32_t risk_free_rate_bps() const { return parameters_.risk_free_rate_bps; }
    const fees::ProtocolFeeRates& protocol_fee_rates() const { return parameters_.protocol_fees; }
    const Amount& min_deposit_amount() const { return parameters_.min_deposit_amount; }
    const Amount& min_redeem_amount() const { return parameters_.min_redeem_amount; }
    std::uint64_t fee_change_cooldown() const { return parameters_.fee_change_cooldown; }

    void set_epoch_duration(const Address& caller, std::uint64_t seconds);
    void set_minibatch_size(const Address& caller, std::size_t size);
    void set_slippage_tolerance(const Address& caller, std::uint32_t bps);
    void set_buffer_ratio(const Address& caller, std::uint32_t bps);
    void set_dust_threshold(const Address& caller, const Amount& threshold);
    void set_risk_free_rate(const Address& caller, std::uint32_t bps);
    void set_protocol_fees(const Address& caller, const fees::ProtocolFeeRates& rates);
    void set_min_deposit_amount(const Address& caller, const Amount& amount);
    void set_min_redeem_amount(const Address& caller, const Amount& amount);
    void set_fee_change_cooldown(const Address& caller, std::uint64_t seconds);

    // Emergency controls
    void pause_all(const Address& caller);
    void unpause_all(const Address& caller);
    bool is_paused() const { return paused_; }

    // Epoch status, supplied by whoever owns the epoch state.
    void set_idle_probe(std::function<bool()> probe);
    bool is_system_idle() const;

    void require_admin(const Address& caller, const std::string& operation) const;
    void require_idle(const std::string& operation) const;
    void require_not_paused(const std::string& operation) const;

private:
    void update_parameters(const Address& caller, const std::string& operation,
                           const std::function<void(ProtocolParameters&)>& apply);

    Principals principals_;
    AssetId underlying_asset_;
    unsigned underlying_decimals_;
    ProtocolParameters parameters_;

    std::set<AssetId> whitelisted_assets_;
    std::map<AssetId, AssetInfo> known_assets_;
    std::set<Address> curators_;
    std::set<Address> owners_;

    bool paused_ = false;
    std::function<bool()> idle_probe_;
};

} // namespace orion
