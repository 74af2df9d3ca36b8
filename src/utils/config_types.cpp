#include "config_types.hpp"

#include <cstdlib>
#include "core/exceptions.hpp"
#include "core/fixed_point.hpp"

namespace orion {
namespace utils {

namespace {

Amount amount_or(const std::string& text, const Amount& fallback, const std::string& field) {
    if (text.empty()) {
        return fallback;
    }
    try {
        return fixed_point::parse_amount(text);
    } catch (const ValidationError& e) {
        throw ConfigurationError(field + ": " + e.what());
    }
}

} // namespace

std::string get_env_var(const std::string& key) {
    const char* val = std::getenv(key.c_str());
    return val == nullptr ? std::string() : std::string(val);
}

Principals to_principals(const PrincipalsConfig& config) {
    Principals principals;
    principals.admin = config.admin;
    principals.guardian = config.guardian;
    principals.automation_registry = config.automation_registry;
    return principals;
}

ProtocolParameters to_protocol_parameters(const ProtocolSettings& settings) {
    ProtocolParameters parameters;
    parameters.epoch_duration = settings.epoch_duration;
    parameters.minibatch_size = settings.minibatch_size;
    parameters.slippage_tolerance_bps = settings.slippage_tolerance_bps;
    parameters.buffer_ratio_bps = settings.buffer_ratio_bps;
    parameters.dust_threshold = amount_or(settings.dust_threshold, parameters.dust_threshold, "protocol.dust_threshold");
    parameters.risk_free_rate_bps = settings.risk_free_rate_bps;
    parameters.protocol_fees.volume_fee_bps = settings.protocol_fees.volume_fee_bps;
    parameters.protocol_fees.revenue_share_bps = settings.protocol_fees.revenue_share_bps;
    parameters.min_deposit_amount =
        amount_or(settings.min_deposit_amount, parameters.min_deposit_amount, "protocol.min_deposit_amount");
    parameters.min_redeem_amount =
        amount_or(settings.min_redeem_amount, parameters.min_redeem_amount, "protocol.min_redeem_amount");
    parameters.fee_change_cooldown = settings.fee_change_cooldown;
    return parameters;
}

AssetInfo to_asset_info(const AssetConfig& config) {
    AssetInfo info;
    info.decimals = config.decimals;
    if (!config.dust_threshold.empty()) {
        info.dust_threshold = amount_or(config.dust_threshold, Amount(0), "assets." + config.symbol + ".dust_threshold");
    }
    return info;
}

PriceQuote to_price_quote(const AssetConfig& config) {
    PriceQuote quote;
    quote.price = amount_or(config.price, Amount(0), "assets." + config.symbol + ".price");
    quote.price_decimals = config.price_decimals;
    if (quote.price == 0) {
        throw ConfigurationError("assets." + config.symbol + ".price must be positive");
    }
    return quote;
}

VaultType parse_vault_type(const std::string& type) {
    if (type == "transparent") {
        return VaultType::TRANSPARENT;
    }
    if (type == "encrypted") {
        return VaultType::ENCRYPTED;
    }
    throw ConfigurationError("unknown vault type '" + type + "'");
}

FeeType parse_fee_type(const std::string& type) {
    static const std::map<std::string, FeeType> types = {
        {"absolute", FeeType::ABSOLUTE},
        {"soft_hurdle", FeeType::SOFT_HURDLE},
        {"hard_hurdle", FeeType::HARD_HURDLE},
        {"high_water_mark", FeeType::HIGH_WATER_MARK},
        {"hurdle_hwm", FeeType::HURDLE_HWM},
    };
    auto it = types.find(type);
    if (it == types.end()) {
        throw ConfigurationError("unknown fee type '" + type + "'");
    }
    return it->second;
}

FeeModel to_fee_model(const VaultSettings& settings) {
    FeeModel model;
    model.type = parse_fee_type(settings.fee_type);
    model.performance_fee_bps = settings.performance_fee_bps;
    model.management_fee_bps = settings.management_fee_bps;
    return model;
}

Intent to_intent(const std::vector<IntentWeightConfig>& weights) {
    Intent intent;
    intent.reserve(weights.size());
    for (const auto& weight : weights) {
        intent.push_back(IntentEntry{weight.asset, weight.weight});
    }
    return intent;
}

} // namespace utils
} // namespace orion
