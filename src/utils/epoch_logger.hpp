#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include "core/types.hpp"

namespace orion {
namespace utils {

// Structured logging for epoch events
class EpochLogger {
public:
    static void log_epoch_started(std::uint64_t epoch, std::size_t transparent_vaults,
                                  std::size_t encrypted_vaults, std::size_t priced_assets);

    static void log_phase_advanced(const std::string& orchestrator, std::uint64_t epoch,
                                   const std::string& from_phase, const std::string& to_phase);

    static void log_minibatch_processed(const std::string& phase, std::uint64_t epoch,
                                        std::size_t first, std::size_t count);

    static void log_orders_built(std::uint64_t epoch, std::size_t sells, std::size_t buys,
                                 std::size_t dust_filtered);

    static void log_trade_executed(OrderSide side, const AssetId& asset, const Amount& amount,
                                   const Amount& bound, const Amount& actual);

    static void log_redemption_settled(const VaultId& vault, std::size_t requests,
                                       const Amount& shares_burned, const Amount& assets_paid);

    static void log_deposit_settled(const VaultId& vault, std::size_t requests,
                                    const Amount& assets_deposited, const Amount& shares_minted);

    static void log_fees_accrued(const VaultId& vault, const Amount& management, const Amount& performance,
                                 const Amount& curator_share, const Amount& protocol_share);

    static void log_vault_decommissioned(const VaultId& vault, const Amount& underlying_released);

    static void log_epoch_completed(std::uint64_t epoch, const Amount& buffer);
};

} // namespace utils
} // namespace orion
