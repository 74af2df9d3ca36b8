#include "config_manager.hpp"

#include <fstream>
#include "config_validator.hpp"
#include "logger.hpp"

namespace orion {
namespace utils {

bool ConfigManager::load(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        Logger::error("Failed to open config file: " + file_path);
        return false;
    }
    nlohmann::json config;
    try {
        file >> config;
    } catch (const nlohmann::json::exception& e) {
        Logger::error("Error parsing config file: " + std::string(e.what()));
        return false;
    }
    return bind(config);
}

bool ConfigManager::load_from_string(const std::string& content) {
    nlohmann::json config;
    try {
        config = nlohmann::json::parse(content);
    } catch (const nlohmann::json::exception& e) {
        Logger::error("Error parsing config: " + std::string(e.what()));
        return false;
    }
    return bind(config);
}

bool ConfigManager::bind(const nlohmann::json& config) {
    auto result = ConfigValidator::validate_config(config);
    if (result.is_error()) {
        Logger::error(result.error());
        for (const auto& issue : ConfigValidator::get_errors()) {
            Logger::error("  " + issue.field + ": " + issue.message +
                          (issue.value.empty() ? std::string() : " (" + issue.value + ")"));
        }
        return false;
    }

    try {
        config_data_ = config;
        config_data_["app"].get_to(app_config_);
        if (config_data_.contains("logging")) {
            config_data_["logging"].get_to(logging_config_);
        }
        config_data_["protocol"].get_to(protocol_settings_);
        config_data_["assets"].get_to(asset_configs_);
        if (config_data_.contains("vaults")) {
            config_data_["vaults"].get_to(vault_settings_);
        }
        if (config_data_.contains("market")) {
            config_data_["market"].get_to(market_config_);
        }
    } catch (const nlohmann::json::exception& e) {
        Logger::error("Error binding config: " + std::string(e.what()));
        return false;
    }
    return true;
}

AppConfig& ConfigManager::get_app_config() {
    return app_config_;
}

LoggingConfig& ConfigManager::get_logging_config() {
    return logging_config_;
}

ProtocolSettings& ConfigManager::get_protocol_settings() {
    return protocol_settings_;
}

std::vector<AssetConfig>& ConfigManager::get_asset_configs() {
    return asset_configs_;
}

std::vector<VaultSettings>& ConfigManager::get_vault_settings() {
    return vault_settings_;
}

MarketConfig& ConfigManager::get_market_config() {
    return market_config_;
}

} // namespace utils
} // namespace orion
