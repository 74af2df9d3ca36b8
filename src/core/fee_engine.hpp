#pragma once

#include <cstdint>
#include "types.hpp"

namespace orion {
namespace fees {

constexpr std::uint32_t MAX_PERFORMANCE_FEE_BPS = 3000;
constexpr std::uint32_t MAX_MANAGEMENT_FEE_BPS = 300;
constexpr std::uint32_t MAX_PROTOCOL_VOLUME_FEE_BPS = 50;
constexpr std::uint32_t MAX_PROTOCOL_REVENUE_SHARE_BPS = 2000;

// State of a vault at the moment fees are assessed.
struct FeeSnapshot {
    Amount current_share_price = 0;  // recorded price at the start of the epoch
    Amount total_supply = 0;         // supply after this epoch's settlement
    Amount previous_supply = 0;      // supply at the start of the epoch
};

struct ProtocolFeeRates {
    std::uint32_t volume_fee_bps = 0;
    std::uint32_t revenue_share_bps = 0;
};

struct EpochFees {
    Amount management = 0;
    Amount performance = 0;
    Amount protocol_volume = 0;
    Amount curator_share = 0;   // management + performance minus the protocol's revenue share
    Amount protocol_share = 0;  // protocol_volume plus the revenue share

    Amount total() const { return management + performance + protocol_volume; }
};

// Underlying units per whole share; zero when there is no supply.
Amount share_price(const Amount& assets, const Amount& supply);

Amount hurdle_price(const Amount& current_share_price, std::uint32_t risk_free_rate_bps,
                    std::uint64_t epoch_duration_seconds);

Amount benchmark_price(const FeeModel& model, const Amount& current_share_price,
                       std::uint32_t risk_free_rate_bps, std::uint64_t epoch_duration_seconds);

Amount management_fee(const Amount& assets, const FeeModel& model, std::uint64_t epoch_duration_seconds);

// Must be given the assets left after the management fee has been taken.
Amount performance_fee(const Amount& assets_after_management_fee, const FeeModel& model,
                       const FeeSnapshot& snapshot, std::uint64_t epoch_duration_seconds,
                       std::uint32_t risk_free_rate_bps);

EpochFees compute_epoch_fees(const Amount& assets, const FeeModel& model, const FeeSnapshot& snapshot,
                             const ProtocolFeeRates& protocol_rates, std::uint64_t epoch_duration_seconds,
                             std::uint32_t risk_free_rate_bps);

// High-water mark after settlement; only ever moves up.
Amount updated_high_water_mark(const FeeModel& model, const Amount& new_share_price);

bool uses_high_water_mark(FeeType type);

void validate_fee_model(const FeeModel& model);
void validate_protocol_fee_rates(const ProtocolFeeRates& rates);

} // namespace fees
} // namespace orion
