#include <cstdint>
#include <exception>
#include <iostream>
#include <map>
#include <string>

#include "adapters/plaintext_decryption_oracle.hpp"
#include "adapters/simulated_market.hpp"
#include "core/exceptions.hpp"
#include "core/fee_engine.hpp"
#include "core/fixed_point.hpp"
#include "core/protocol.hpp"
#include "utils/config_manager.hpp"
#include "utils/logger.hpp"

namespace {

void setup_protocol(orion::Protocol& protocol, orion::SimulatedMarket& market,
                    orion::utils::ConfigManager& config_manager) {
    auto& config = protocol.config();
    const orion::Address admin = config.admin();

    for (const auto& asset : config_manager.get_asset_configs()) {
        if (asset.symbol == config.underlying_asset()) {
            continue;
        }
        config.add_whitelisted_asset(admin, asset.symbol, orion::utils::to_asset_info(asset));
        market.set_price(asset.symbol, orion::utils::to_price_quote(asset), asset.decimals);
    }

    for (const auto& settings : config_manager.get_vault_settings()) {
        if (!config.is_whitelisted_owner(settings.owner)) {
            config.add_whitelisted_owner(admin, settings.owner);
        }
        if (!config.is_whitelisted_curator(settings.curator)) {
            config.add_whitelisted_curator(admin, settings.curator);
        }

        orion::VaultConfig vault_config;
        vault_config.id = settings.id;
        vault_config.type = orion::utils::parse_vault_type(settings.type);
        vault_config.curator = settings.curator;
        vault_config.fee_model = orion::utils::to_fee_model(settings);
        orion::Vault& vault = protocol.vaults().create_vault(settings.owner, vault_config);

        const orion::Intent intent = orion::utils::to_intent(settings.intent);
        if (vault.type() == orion::VaultType::TRANSPARENT) {
            vault.submit_intent(settings.curator, intent);
        } else {
            vault.submit_encrypted_intent(settings.curator, orion::PlaintextDecryptionOracle::encode_intent(intent));
        }

        for (const auto& deposit : settings.deposits) {
            vault.request_deposit(deposit.user, orion::fixed_point::parse_amount(deposit.amount));
        }
    }
}

void apply_price_changes(orion::SimulatedMarket& market, orion::utils::ConfigManager& config_manager,
                         std::map<std::string, orion::PriceQuote>& prices) {
    for (const auto& [asset, change_bps] : config_manager.get_market_config().price_change_bps) {
        auto it = prices.find(asset);
        if (it == prices.end()) {
            ORION_LOG_WARN("Price change configured for unknown asset {}", asset);
            continue;
        }
        const auto factor = static_cast<std::uint64_t>(static_cast<std::int64_t>(orion::BASIS_POINTS) + change_bps);
        it->second.price = orion::fixed_point::mul_div(it->second.price, orion::Amount(factor),
                                                       orion::Amount(orion::BASIS_POINTS));
        for (const auto& asset_config : config_manager.get_asset_configs()) {
            if (asset_config.symbol == asset) {
                market.set_price(asset, it->second, asset_config.decimals);
            }
        }
    }
}

void report_epoch(const orion::Protocol& protocol, int epoch) {
    const unsigned decimals = protocol.config().underlying_decimals();
    for (const auto& id : protocol.vaults().all_vault_ids()) {
        const orion::Vault& vault = protocol.vaults().vault(id);
        ORION_LOG_INFO("Epoch {} | {} | status {} | total assets {} | supply {} | share price {}", epoch, id,
                       orion::to_string(vault.status()),
                       orion::fixed_point::format_amount(vault.total_assets(), decimals),
                       orion::fixed_point::format_amount(vault.total_supply(), orion::SHARE_DECIMALS),
                       orion::fixed_point::format_amount(vault.recorded_share_price(), decimals));
    }
    const auto& ledger = protocol.ledger();
    ORION_LOG_INFO("Epoch {} | buffer {} | protocol fees {} | curator fees {}", epoch,
                   orion::fixed_point::format_amount(ledger.buffer, decimals),
                   orion::fixed_point::format_amount(ledger.protocol_fees, decimals),
                   orion::fixed_point::format_amount(ledger.total_fees() - ledger.protocol_fees, decimals));
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = "config/settings.json";
    if (argc > 1) {
        config_path = argv[1];
    } else if (!orion::utils::get_env_var("ORION_CONFIG").empty()) {
        config_path = orion::utils::get_env_var("ORION_CONFIG");
    }

    // Load configuration
    orion::utils::ConfigManager config_manager;
    if (!config_manager.load(config_path)) {
        std::cerr << "Failed to load configuration from " << config_path << std::endl;
        return 1;
    }

    // Initialize logger
    const auto& logging = config_manager.get_logging_config();
    orion::utils::Logger::initialize(logging.file_output ? logging.file_path : std::string(),
                                     orion::utils::parse_log_level(config_manager.get_app_config().log_level),
                                     logging.console_output,
                                     static_cast<std::size_t>(logging.max_file_size_mb) * 1024 * 1024,
                                     static_cast<std::size_t>(logging.max_backup_files));
    ORION_LOG_INFO("Starting {} {}", config_manager.get_app_config().name, config_manager.get_app_config().version);

    try {
        const auto& settings = config_manager.get_protocol_settings();
        const auto& market_config = config_manager.get_market_config();

        orion::SimulatedMarket market(settings.underlying_asset, settings.underlying_decimals,
                                      market_config.slippage_bps);
        orion::PlaintextDecryptionOracle oracle(market_config.decryption_rounds);
        orion::Protocol protocol(orion::utils::to_principals(settings.principals), settings.underlying_asset,
                                 settings.underlying_decimals, orion::utils::to_protocol_parameters(settings),
                                 market, market, oracle, settings.genesis_timestamp);

        setup_protocol(protocol, market, config_manager);

        std::map<std::string, orion::PriceQuote> prices;
        for (const auto& asset : config_manager.get_asset_configs()) {
            if (asset.symbol != settings.underlying_asset) {
                prices[asset.symbol] = orion::utils::to_price_quote(asset);
            }
        }

        orion::Timestamp now = settings.genesis_timestamp;
        for (int epoch = 1; epoch <= market_config.epochs; ++epoch) {
            now += settings.epoch_duration;
            std::size_t steps = protocol.run_keeper(now);
            // Encrypted intents may need a few oracle rounds before the epoch can finish.
            std::size_t idle_rounds = 0;
            while (!protocol.is_system_idle()) {
                oracle.advance_round();
                const std::size_t more = protocol.run_keeper(now);
                if (more == 0 && ++idle_rounds > market_config.decryption_rounds + 1) {
                    ORION_LOG_ERROR("Epoch {} stalled in phase {}", epoch,
                                    orion::to_string(protocol.epoch_state().phase));
                    orion::utils::Logger::shutdown();
                    return 1;
                }
                steps += more;
            }
            ORION_LOG_INFO("Epoch {} finished after {} keeper calls", epoch, steps);
            report_epoch(protocol, epoch);
            apply_price_changes(market, config_manager, prices);
        }
    } catch (const orion::OrionException& e) {
        ORION_LOG_CRITICAL("Simulation aborted: {}", e.what());
        orion::utils::Logger::shutdown();
        return 1;
    }

    ORION_LOG_INFO("Simulation finished");
    orion::utils::Logger::shutdown();
    return 0;
}
