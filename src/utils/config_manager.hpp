#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "config_types.hpp"

namespace orion {
namespace utils {

class ConfigManager {
public:
    bool load(const std::string& file_path);
    bool load_from_string(const std::string& content);

    AppConfig& get_app_config();
    LoggingConfig& get_logging_config();
    ProtocolSettings& get_protocol_settings();
    std::vector<AssetConfig>& get_asset_configs();
    std::vector<VaultSettings>& get_vault_settings();
    MarketConfig& get_market_config();

private:
    bool bind(const nlohmann::json& config);

    nlohmann::json config_data_;
    AppConfig app_config_;
    LoggingConfig logging_config_;
    ProtocolSettings protocol_settings_;
    std::vector<AssetConfig> asset_configs_;
    std::vector<VaultSettings> vault_settings_;
    MarketConfig market_config_;
};

} // namespace utils
} // namespace orion
