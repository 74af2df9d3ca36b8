#include "utils/epoch_logger.hpp"

#include <sstream>
#include "utils/logger.hpp"

namespace orion {
namespace utils {

void EpochLogger::log_epoch_started(std::uint64_t epoch, std::size_t transparent_vaults,
                                    std::size_t encrypted_vaults, std::size_t priced_assets) {
    std::stringstream ss;
    ss << "EPOCH_STARTED | Epoch: " << epoch << " | TransparentVaults: " << transparent_vaults
       << " | EncryptedVaults: " << encrypted_vaults << " | PricedAssets: " << priced_assets;
    Logger::info(ss.str());
}

void EpochLogger::log_phase_advanced(const std::string& orchestrator, std::uint64_t epoch,
                                     const std::string& from_phase, const std::string& to_phase) {
    std::stringstream ss;
    ss << "PHASE_ADVANCED | Orchestrator: " << orchestrator << " | Epoch: " << epoch
       << " | From: " << from_phase << " | To: " << to_phase;
    Logger::info(ss.str());
}

void EpochLogger::log_minibatch_processed(const std::string& phase, std::uint64_t epoch,
                                          std::size_t first, std::size_t count) {
    std::stringstream ss;
    ss << "MINIBATCH_PROCESSED | Phase: " << phase << " | Epoch: " << epoch
       << " | First: " << first << " | Count: " << count;
    Logger::debug(ss.str());
}

void EpochLogger::log_orders_built(std::uint64_t epoch, std::size_t sells, std::size_t buys,
                                   std::size_t dust_filtered) {
    std::stringstream ss;
    ss << "ORDERS_BUILT | Epoch: " << epoch << " | Sells: " << sells << " | Buys: " << buys
       << " | DustFiltered: " << dust_filtered;
    Logger::info(ss.str());
}

void EpochLogger::log_trade_executed(OrderSide side, const AssetId& asset, const Amount& amount,
                                     const Amount& bound, const Amount& actual) {
    std::stringstream ss;
    ss << "TRADE_EXECUTED | Side: " << to_string(side) << " | Asset: " << asset
       << " | Amount: " << amount.str() << " | Bound: " << bound.str() << " | Actual: " << actual.str();
    Logger::info(ss.str());
}

void EpochLogger::log_redemption_settled(const VaultId& vault, std::size_t requests,
                                         const Amount& shares_burned, const Amount& assets_paid) {
    std::stringstream ss;
    ss << "REDEMPTION_SETTLED | Vault: " << vault << " | Requests: " << requests
       << " | SharesBurned: " << shares_burned.str() << " | AssetsPaid: " << assets_paid.str();
    Logger::info(ss.str());
}

void EpochLogger::log_deposit_settled(const VaultId& vault, std::size_t requests,
                                      const Amount& assets_deposited, const Amount& shares_minted) {
    std::stringstream ss;
    ss << "DEPOSIT_SETTLED | Vault: " << vault << " | Requests: " << requests
       << " | Assets: " << assets_deposited.str() << " | SharesMinted: " << shares_minted.str();
    Logger::info(ss.str());
}

void EpochLogger::log_fees_accrued(const VaultId& vault, const Amount& management, const Amount& performance,
                                   const Amount& curator_share, const Amount& protocol_share) {
    std::stringstream ss;
    ss << "FEES_ACCRUED | Vault: " << vault << " | Management: " << management.str()
       << " | Performance: " << performance.str() << " | Curator: " << curator_share.str()
       << " | Protocol: " << protocol_share.str();
    Logger::info(ss.str());
}

void EpochLogger::log_vault_decommissioned(const VaultId& vault, const Amount& underlying_released) {
    std::stringstream ss;
    ss << "VAULT_DECOMMISSIONED | Vault: " << vault << " | Underlying: " << underlying_released.str();
    Logger::warn(ss.str());
}

void EpochLogger::log_epoch_completed(std::uint64_t epoch, const Amount& buffer) {
    std::stringstream ss;
    ss << "EPOCH_COMPLETED | Epoch: " << epoch << " | Buffer: " << buffer.str();
    Logger::info(ss.str());
}

} // namespace utils
} // namespace orion
