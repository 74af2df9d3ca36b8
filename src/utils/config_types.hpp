#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config_registry.hpp"
#include "core/types.hpp"

namespace orion {
namespace utils {

std::string get_env_var(const std::string& key);

struct AppConfig {
    std::string name;
    std::string version;
    std::string log_level;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(AppConfig, name, version, log_level)

struct LoggingConfig {
    std::string file_path;
    int max_file_size_mb = 10;
    int max_backup_files = 5;
    bool console_output = true;
    bool file_output = false;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(LoggingConfig, file_path, max_file_size_mb, max_backup_files, console_output, file_output)

struct PrincipalsConfig {
    std::string admin;
    std::string guardian;
    std::string automation_registry;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(PrincipalsConfig, admin, guardian, automation_registry)

struct ProtocolFeeConfig {
    std::uint32_t volume_fee_bps = 0;
    std::uint32_t revenue_share_bps = 0;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ProtocolFeeConfig, volume_fee_bps, revenue_share_bps)

// Amounts are decimal strings in smallest units; 256-bit values do not fit a JSON number.
struct ProtocolSettings {
    PrincipalsConfig principals;
    std::string underlying_asset;
    unsigned underlying_decimals = 6;
    std::uint64_t genesis_timestamp = 0;
    std::uint64_t epoch_duration = 86400;
    std::size_t minibatch_size = 8;
    std::uint32_t slippage_tolerance_bps = 200;
    std::uint32_t buffer_ratio_bps = 100;
    std::string dust_threshold;
    std::uint32_t risk_free_rate_bps = 0;
    ProtocolFeeConfig protocol_fees;
    std::string min_deposit_amount;
    std::string min_redeem_amount;
    std::uint64_t fee_change_cooldown = 604800;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ProtocolSettings, principals, underlying_asset, underlying_decimals, genesis_timestamp, epoch_duration, minibatch_size, slippage_tolerance_bps, buffer_ratio_bps, dust_threshold, risk_free_rate_bps, protocol_fees, min_deposit_amount, min_redeem_amount, fee_change_cooldown)

struct AssetConfig {
    std::string symbol;
    unsigned decimals = 18;
    std::string price;
    unsigned price_decimals = 0;
    std::string dust_threshold;  // empty = protocol default
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(AssetConfig, symbol, decimals, price, price_decimals, dust_threshold)

struct IntentWeightConfig {
    std::string asset;
    std::uint64_t weight = 0;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(IntentWeightConfig, asset, weight)

struct DepositConfig {
    std::string user;
    std::string amount;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(DepositConfig, user, amount)

struct VaultSettings {
    std::string id;
    std::string type;
    std::string owner;
    std::string curator;
    std::string fee_type;
    std::uint32_t performance_fee_bps = 0;
    std::uint32_t management_fee_bps = 0;
    std::vector<IntentWeightConfig> intent;
    std::vector<DepositConfig> deposits;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(VaultSettings, id, type, owner, curator, fee_type, performance_fee_bps, management_fee_bps, intent, deposits)

// Simulated venue and run length for orion_sim
struct MarketConfig {
    int epochs = 1;
    std::uint32_t slippage_bps = 0;
    std::size_t decryption_rounds = 0;
    std::map<std::string, int> price_change_bps;  // applied to the asset's price after every epoch
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(MarketConfig, epochs, slippage_bps, decryption_rounds, price_change_bps)

// Conversions into engine types; throw ConfigurationError on values the engine cannot represent.
Principals to_principals(const PrincipalsConfig& config);
ProtocolParameters to_protocol_parameters(const ProtocolSettings& settings);
AssetInfo to_asset_info(const AssetConfig& config);
PriceQuote to_price_quote(const AssetConfig& config);
VaultType parse_vault_type(const std::string& type);
FeeType parse_fee_type(const std::string& type);
FeeModel to_fee_model(const VaultSettings& settings);
Intent to_intent(const std::vector<IntentWeightConfig>& weights);

} // namespace utils
} // namespace orion
