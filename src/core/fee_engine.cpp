#include "fee_engine.hpp"

#include <algorithm>
#include "exceptions.hpp"
#include "fixed_point.hpp"

namespace orion {
namespace fees {

using fixed_point::mul_div;

namespace {

const Amount& share_unit() {
    static const Amount unit = fixed_point::pow10(SHARE_DECIMALS);
    return unit;
}

} // namespace

Amount share_price(const Amount& assets, const Amount& supply) {
    if (supply == 0) {
        return 0;
    }
    return mul_div(assets, share_unit(), supply);
}

Amount hurdle_price(const Amount& current_share_price, std::uint32_t risk_free_rate_bps,
                    std::uint64_t epoch_duration_seconds) {
    // current * (1 + rf * dt / year), kept as one fraction so short epochs do not truncate to zero
    const Amount year_bps = Amount(BASIS_POINTS) * Amount(SECONDS_PER_YEAR);
    const Amount growth = Amount(risk_free_rate_bps) * Amount(epoch_duration_seconds);
    return mul_div(current_share_price, year_bps + growth, year_bps);
}

bool uses_high_water_mark(FeeType type) {
    return type == FeeType::HIGH_WATER_MARK || type == FeeType::HURDLE_HWM;
}

Amount benchmark_price(const FeeModel& model, const Amount& current_share_price,
                       std::uint32_t risk_free_rate_bps, std::uint64_t epoch_duration_seconds) {
    const Amount mark = model.high_water_mark == 0 ? current_share_price : model.high_water_mark;
    switch (model.type) {
        case FeeType::ABSOLUTE:
            return current_share_price;
        case FeeType::HIGH_WATER_MARK:
            return mark;
        case FeeType::SOFT_HURDLE:
        case FeeType::HARD_HURDLE:
            return hurdle_price(current_share_price, risk_free_rate_bps, epoch_duration_seconds);
        case FeeType::HURDLE_HWM:
            return std::max(hurdle_price(current_share_price, risk_free_rate_bps, epoch_duration_seconds), mark);
    }
    throw InvariantViolationError("unknown fee type");
}

Amount management_fee(const Amount& assets, const FeeModel& model, std::uint64_t epoch_duration_seconds) {
    return fixed_point::annualized_bps(assets, model.management_fee_bps, epoch_duration_seconds);
}

Amount performance_fee(const Amount& assets_after_management_fee, const FeeModel& model,
                       const FeeSnapshot& snapshot, std::uint64_t epoch_duration_seconds,
                       std::uint32_t risk_free_rate_bps) {
    if (model.performance_fee_bps == 0 || snapshot.previous_supply == 0 || snapshot.total_supply == 0 ||
        snapshot.current_share_price == 0) {
        return 0;
    }

    const Amount active = share_price(assets_after_management_fee, snapshot.total_supply);
    const Amount benchmark = benchmark_price(model, snapshot.current_share_price,
                                             risk_free_rate_bps, epoch_duration_seconds);
    if (active <= benchmark) {
        return 0;
    }

    // A cleared soft hurdle charges on the whole gain over the starting price.
    const Amount& base = model.type == FeeType::SOFT_HURDLE ? snapshot.current_share_price : benchmark;
    const Amount gain = active - base;

    const Amount fee = mul_div(gain * Amount(model.performance_fee_bps), snapshot.total_supply,
                               Amount(BASIS_POINTS) * share_unit());
    return std::min(fee, assets_after_management_fee);
}

EpochFees compute_epoch_fees(const Amount& assets, const FeeModel& model, const FeeSnapshot& snapshot,
                             const ProtocolFeeRates& protocol_rates, std::uint64_t epoch_duration_seconds,
                             std::uint32_t risk_free_rate_bps) {
    EpochFees result;
    result.management = management_fee(assets, model, epoch_duration_seconds);
    result.performance = performance_fee(assets - result.management, model, snapshot,
                                         epoch_duration_seconds, risk_free_rate_bps);
    result.protocol_volume = fixed_point::annualized_bps(assets, protocol_rates.volume_fee_bps,
                                                         epoch_duration_seconds);

    if (result.total() > assets) {
        throw InvariantViolationError("fees exceed vault assets");
    }

    const Amount curator_gross = result.management + result.performance;
    const Amount revenue_share = fixed_point::apply_bps(curator_gross, protocol_rates.revenue_share_bps);
    result.curator_share = curator_gross - revenue_share;
    result.protocol_share = result.protocol_volume + revenue_share;
    return result;
}

Amount updated_high_water_mark(const FeeModel& model, const Amount& new_share_price) {
    if (!uses_high_water_mark(model.type)) {
        return model.high_water_mark;
    }
    return std::max(model.high_water_mark, new_share_price);
}

void validate_fee_model(const FeeModel& model) {
    if (model.performance_fee_bps > MAX_PERFORMANCE_FEE_BPS) {
        throw ValidationError("performance fee " + std::to_string(model.performance_fee_bps) +
                              " bps exceeds maximum " + std::to_string(MAX_PERFORMANCE_FEE_BPS));
    }
    if (model.management_fee_bps > MAX_MANAGEMENT_FEE_BPS) {
        throw ValidationError("management fee " + std::to_string(model.management_fee_bps) +
                              " bps exceeds maximum " + std::to_string(MAX_MANAGEMENT_FEE_BPS));
    }
}

void validate_protocol_fee_rates(const ProtocolFeeRates& rates) {
    if (rates.volume_fee_bps > MAX_PROTOCOL_VOLUME_FEE_BPS) {
        throw ValidationError("protocol volume fee exceeds maximum");
    }
    if (rates.revenue_share_bps > MAX_PROTOCOL_REVENUE_SHARE_BPS) {
        throw ValidationError("protocol revenue share exceeds maximum");
    }
}

} // namespace fees
} // namespace orion
