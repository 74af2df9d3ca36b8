#include "config_validator.hpp"

#include <algorithm>
#include <cctype>
#include <numeric>
#include "core/config_registry.hpp"
#include "core/fee_engine.hpp"

namespace orion {
namespace utils {

ConfigValidator::ValidationErrors ConfigValidator::errors_;

ConfigValidator::ValidationResult ConfigValidator::validate_config(const nlohmann::json& config) {
    clear_errors();

    if (!config.is_object()) {
        add_error("", "Configuration must be a JSON object");
        return Result<bool>::error("Configuration is not an object");
    }

    // Validate required top-level sections
    if (!config.contains("app")) {
        add_error("app", "Missing required app configuration section");
        return Result<bool>::error("Missing app configuration");
    }

    if (!config.contains("protocol")) {
        add_error("protocol", "Missing required protocol configuration section");
        return Result<bool>::error("Missing protocol configuration");
    }

    if (!config.contains("assets")) {
        add_error("assets", "Missing required assets configuration section");
        return Result<bool>::error("Missing assets configuration");
    }

    // Validate each section
    auto app_result = validate_app_config(config["app"]);
    if (app_result.is_error()) {
        return app_result;
    }

    if (config.contains("logging")) {
        auto logging_result = validate_logging_config(config["logging"]);
        if (logging_result.is_error()) {
            return logging_result;
        }
    }

    auto protocol_result = validate_protocol_config(config["protocol"]);
    if (protocol_result.is_error()) {
        return protocol_result;
    }

    validate_array_field(config, "assets");
    if (!errors_.empty()) {
        return Result<bool>::error("Assets configuration validation failed");
    }
    for (const auto& asset : config["assets"]) {
        auto asset_result = validate_asset_config(asset);
        if (asset_result.is_error()) {
            return asset_result;
        }
    }

    if (config.contains("vaults")) {
        validate_array_field(config, "vaults");
        if (!errors_.empty()) {
            return Result<bool>::error("Vault configuration validation failed");
        }
        for (const auto& vault : config["vaults"]) {
            auto vault_result = validate_vault_config(vault);
            if (vault_result.is_error()) {
                return vault_result;
            }
        }
    }

    if (config.contains("market")) {
        auto market_result = validate_market_config(config["market"]);
        if (market_result.is_error()) {
            return market_result;
        }
    }

    return Result<bool>::success(true);
}

ConfigValidator::ValidationResult ConfigValidator::validate_app_config(const nlohmann::json& app_config) {
    validate_required_field(app_config, "name");
    validate_string_field(app_config, "name", 1, 100);

    validate_required_field(app_config, "version");
    validate_string_field(app_config, "version", 1, 20);

    validate_required_field(app_config, "log_level");
    validate_enum_field(app_config, "log_level", {"TRACE", "DEBUG", "INFO", "WARNING", "ERROR", "CRITICAL"});

    return errors_.empty() ? Result<bool>::success(true) :
                           Result<bool>::error("App configuration validation failed");
}

ConfigValidator::ValidationResult ConfigValidator::validate_logging_config(const nlohmann::json& logging_config) {
    validate_required_field(logging_config, "file_path");
    validate_string_field(logging_config, "file_path", 0, 500);

    validate_required_field(logging_config, "max_file_size_mb");
    validate_integer_field(logging_config, "max_file_size_mb", 1, 1024);
    validate_required_field(logging_config, "max_backup_files");
    validate_integer_field(logging_config, "max_backup_files", 1, 100);
    validate_required_field(logging_config, "console_output");
    validate_boolean_field(logging_config, "console_output");
    validate_required_field(logging_config, "file_output");
    validate_boolean_field(logging_config, "file_output");

    return errors_.empty() ? Result<bool>::success(true) :
                           Result<bool>::error("Logging configuration validation failed");
}

ConfigValidator::ValidationResult ConfigValidator::validate_protocol_config(const nlohmann::json& protocol_config) {
    validate_required_field(protocol_config, "principals");
    if (protocol_config.contains("principals")) {
        const auto& principals = protocol_config["principals"];
        for (const auto* field : {"admin", "guardian", "automation_registry"}) {
            validate_required_field(principals, field);
            validate_string_field(principals, field, 1, 100);
        }
    }

    validate_required_field(protocol_config, "underlying_asset");
    validate_string_field(protocol_config, "underlying_asset", 1, 20);
    validate_required_field(protocol_config, "underlying_decimals");
    validate_integer_field(protocol_config, "underlying_decimals", 0, SHARE_DECIMALS);
    validate_required_field(protocol_config, "genesis_timestamp");
    validate_integer_field(protocol_config, "genesis_timestamp", 0, std::numeric_limits<std::int64_t>::max());

    validate_required_field(protocol_config, "epoch_duration");
    validate_integer_field(protocol_config, "epoch_duration", 1, std::numeric_limits<std::int64_t>::max());
    validate_required_field(protocol_config, "minibatch_size");
    validate_integer_field(protocol_config, "minibatch_size", 1, 10000);
    validate_required_field(protocol_config, "slippage_tolerance_bps");
    validate_bps_field(protocol_config, "slippage_tolerance_bps", MAX_SLIPPAGE_TOLERANCE_BPS);
    validate_required_field(protocol_config, "buffer_ratio_bps");
    validate_integer_field(protocol_config, "buffer_ratio_bps", MIN_BUFFER_RATIO_BPS, MAX_BUFFER_RATIO_BPS);
    validate_required_field(protocol_config, "risk_free_rate_bps");
    validate_bps_field(protocol_config, "risk_free_rate_bps", MAX_RISK_FREE_RATE_BPS);
    validate_required_field(protocol_config, "fee_change_cooldown");
    validate_integer_field(protocol_config, "fee_change_cooldown", 0, std::numeric_limits<std::int64_t>::max());

    for (const auto* field : {"dust_threshold", "min_deposit_amount", "min_redeem_amount"}) {
        validate_required_field(protocol_config, field);
        validate_amount_field(protocol_config, field, true);
    }

    validate_required_field(protocol_config, "protocol_fees");
    if (protocol_config.contains("protocol_fees")) {
        const auto& protocol_fees = protocol_config["protocol_fees"];
        validate_required_field(protocol_fees, "volume_fee_bps");
        validate_bps_field(protocol_fees, "volume_fee_bps", fees::MAX_PROTOCOL_VOLUME_FEE_BPS);
        validate_required_field(protocol_fees, "revenue_share_bps");
        validate_bps_field(protocol_fees, "revenue_share_bps", fees::MAX_PROTOCOL_REVENUE_SHARE_BPS);
    }

    return errors_.empty() ? Result<bool>::success(true) :
                           Result<bool>::error("Protocol configuration validation failed");
}

ConfigValidator::ValidationResult ConfigValidator::validate_asset_config(const nlohmann::json& asset_config) {
    validate_required_field(asset_config, "symbol");
    validate_string_field(asset_config, "symbol", 1, 20);
    validate_required_field(asset_config, "decimals");
    validate_integer_field(asset_config, "decimals", 0, 36);
    validate_required_field(asset_config, "price");
    validate_amount_field(asset_config, "price", false);
    validate_required_field(asset_config, "price_decimals");
    validate_integer_field(asset_config, "price_decimals", 0, 36);
    validate_required_field(asset_config, "dust_threshold");
    validate_amount_field(asset_config, "dust_threshold", true);

    return errors_.empty() ? Result<bool>::success(true) :
                           Result<bool>::error("Asset configuration validation failed");
}

ConfigValidator::ValidationResult ConfigValidator::validate_vault_config(const nlohmann::json& vault_config) {
    validate_required_field(vault_config, "id");
    validate_string_field(vault_config, "id", 1, 64);
    validate_required_field(vault_config, "type");
    validate_enum_field(vault_config, "type", {"transparent", "encrypted"});
    validate_required_field(vault_config, "owner");
    validate_string_field(vault_config, "owner", 1, 100);
    validate_required_field(vault_config, "curator");
    validate_string_field(vault_config, "curator", 1, 100);
    validate_required_field(vault_config, "fee_type");
    validate_enum_field(vault_config, "fee_type",
                        {"absolute", "soft_hurdle", "hard_hurdle", "high_water_mark", "hurdle_hwm"});
    validate_required_field(vault_config, "performance_fee_bps");
    validate_bps_field(vault_config, "performance_fee_bps", fees::MAX_PERFORMANCE_FEE_BPS);
    validate_required_field(vault_config, "management_fee_bps");
    validate_bps_field(vault_config, "management_fee_bps", fees::MAX_MANAGEMENT_FEE_BPS);

    validate_required_field(vault_config, "intent");
    if (validate_array_field(vault_config, "intent") && vault_config.contains("intent")) {
        for (const auto& entry : vault_config["intent"]) {
            validate_required_field(entry, "asset");
            validate_string_field(entry, "asset", 1, 20);
            validate_required_field(entry, "weight");
            validate_integer_field(entry, "weight", 1, static_cast<std::int64_t>(INTENT_SCALE));
        }
    }

    validate_required_field(vault_config, "deposits");
    if (validate_array_field(vault_config, "deposits") && vault_config.contains("deposits")) {
        for (const auto& deposit : vault_config["deposits"]) {
            validate_required_field(deposit, "user");
            validate_string_field(deposit, "user", 1, 100);
            validate_required_field(deposit, "amount");
            validate_amount_field(deposit, "amount", false);
        }
    }

    return errors_.empty() ? Result<bool>::success(true) :
                           Result<bool>::error("Vault configuration validation failed");
}

ConfigValidator::ValidationResult ConfigValidator::validate_market_config(const nlohmann::json& market_config) {
    validate_required_field(market_config, "epochs");
    validate_integer_field(market_config, "epochs", 1, 100000);
    validate_required_field(market_config, "slippage_bps");
    validate_bps_field(market_config, "slippage_bps", BASIS_POINTS - 1);
    validate_required_field(market_config, "decryption_rounds");
    validate_integer_field(market_config, "decryption_rounds", 0, 1000);

    validate_required_field(market_config, "price_change_bps");
    if (market_config.contains("price_change_bps")) {
        if (!market_config["price_change_bps"].is_object()) {
            add_error("price_change_bps", "Field must be an object", market_config["price_change_bps"].dump());
        } else {
            for (const auto& [asset, change] : market_config["price_change_bps"].items()) {
                if (!change.is_number_integer() || change.get<std::int64_t>() <= -static_cast<std::int64_t>(BASIS_POINTS)) {
                    add_error("price_change_bps." + asset, "Change must be an integer above -10000", change.dump());
                }
            }
        }
    }

    return errors_.empty() ? Result<bool>::success(true) :
                           Result<bool>::error("Market configuration validation failed");
}

bool ConfigValidator::validate_required_field(const nlohmann::json& config, const std::string& field) {
    if (!config.is_object() || !config.contains(field)) {
        add_error(field, "Required field is missing");
        return false;
    }
    return true;
}

bool ConfigValidator::validate_string_field(const nlohmann::json& config, const std::string& field,
                                            size_t min_length, size_t max_length) {
    if (!config.is_object() || !config.contains(field)) return true;

    if (!config[field].is_string()) {
        add_error(field, "Field must be a string", config[field].dump());
        return false;
    }

    std::string value = config[field].get<std::string>();
    if (value.length() < min_length) {
        add_error(field, "String too short (min: " + std::to_string(min_length) + ")", value);
        return false;
    }

    if (value.length() > max_length) {
        add_error(field, "String too long (max: " + std::to_string(max_length) + ")", value);
        return false;
    }

    return true;
}

bool ConfigValidator::validate_numeric_field(const nlohmann::json& config, const std::string& field,
                                             double min_value, double max_value) {
    if (!config.is_object() || !config.contains(field)) return true;

    if (!config[field].is_number()) {
        add_error(field, "Field must be a number", config[field].dump());
        return false;
    }

    double value = config[field].get<double>();
    if (value < min_value) {
        add_error(field, "Value too small (min: " + std::to_string(min_value) + ")", std::to_string(value));
        return false;
    }

    if (value > max_value) {
        add_error(field, "Value too large (max: " + std::to_string(max_value) + ")", std::to_string(value));
        return false;
    }

    return true;
}

bool ConfigValidator::validate_integer_field(const nlohmann::json& config, const std::string& field,
                                             std::int64_t min_value, std::int64_t max_value) {
    if (!config.is_object() || !config.contains(field)) return true;

    if (!config[field].is_number_integer()) {
        add_error(field, "Field must be an integer", config[field].dump());
        return false;
    }

    if (config[field].is_number_unsigned() && config[field].get<std::uint64_t>() >
                                                  static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        add_error(field, "Value too large (max: " + std::to_string(max_value) + ")", config[field].dump());
        return false;
    }

    const std::int64_t value = config[field].get<std::int64_t>();
    if (value < min_value) {
        add_error(field, "Value too small (min: " + std::to_string(min_value) + ")", std::to_string(value));
        return false;
    }

    if (value > max_value) {
        add_error(field, "Value too large (max: " + std::to_string(max_value) + ")", std::to_string(value));
        return false;
    }

    return true;
}

bool ConfigValidator::validate_boolean_field(const nlohmann::json& config, const std::string& field) {
    if (!config.is_object() || !config.contains(field)) return true;

    if (!config[field].is_boolean()) {
        add_error(field, "Field must be a boolean", config[field].dump());
        return false;
    }

    return true;
}

bool ConfigValidator::validate_array_field(const nlohmann::json& config, const std::string& field,
                                           size_t min_size, size_t max_size) {
    if (!config.is_object() || !config.contains(field)) return true;

    if (!config[field].is_array()) {
        add_error(field, "Field must be an array", config[field].dump());
        return false;
    }

    size_t size = config[field].size();
    if (size < min_size) {
        add_error(field, "Array too small (min: " + std::to_string(min_size) + ")", std::to_string(size));
        return false;
    }

    if (size > max_size) {
        add_error(field, "Array too large (max: " + std::to_string(max_size) + ")", std::to_string(size));
        return false;
    }

    return true;
}

bool ConfigValidator::validate_enum_field(const nlohmann::json& config, const std::string& field,
                                          const std::vector<std::string>& valid_values) {
    if (!config.is_object() || !config.contains(field)) return true;

    if (!config[field].is_string()) {
        add_error(field, "Field must be a string", config[field].dump());
        return false;
    }

    std::string value = config[field].get<std::string>();
    if (std::find(valid_values.begin(), valid_values.end(), value) == valid_values.end()) {
        add_error(field, "Invalid value. Must be one of: " +
                 std::accumulate(valid_values.begin(), valid_values.end(), std::string(),
                                 [](const std::string& a, const std::string& b) {
                                     return a.empty() ? b : a + ", " + b;
                                 }), value);
        return false;
    }

    return true;
}

bool ConfigValidator::validate_amount_field(const nlohmann::json& config, const std::string& field, bool optional) {
    if (!config.is_object() || !config.contains(field)) return true;

    if (!config[field].is_string()) {
        add_error(field, "Amount must be a decimal string", config[field].dump());
        return false;
    }

    std::string value = config[field].get<std::string>();
    if (value.empty()) {
        if (!optional) {
            add_error(field, "Amount must not be empty");
            return false;
        }
        return true;
    }

    // 2^256 has 78 digits
    if (value.length() > 77 ||
        !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        add_error(field, "Invalid amount", value);
        return false;
    }

    return true;
}

bool ConfigValidator::validate_bps_field(const nlohmann::json& config, const std::string& field,
                                         std::int64_t max_bps) {
    return validate_integer_field(config, field, 0, max_bps);
}

void ConfigValidator::add_error(const std::string& field, const std::string& message, const std::string& value) {
    errors_.push_back({field, message, value});
}

} // namespace utils
} // namespace orion
